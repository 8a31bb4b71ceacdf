#include "log.hpp"
#include <core/constants.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <mutex>

namespace {
std::mutex log_mutex;
}

std::string remotefs_log_path() {
    static std::string path = [] {
        const char* env = std::getenv(LOG_ENV_VAR);
        if (env && *env) return std::string(env);
        return (platform::temp_dir() / "remotefs_debug.log").string();
    }();
    return path;
}

void remotefs_log(const std::string& msg) {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &t);
#else
    localtime_r(&t, &tm_buf);
#endif

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));

    std::lock_guard<std::mutex> lock(log_mutex);
    std::ofstream out(remotefs_log_path(), std::ios::app);
    if (!out) return;
    out << "[" << ts << "] " << msg << "\n";
}

void remotefs_log_cmd(const std::string& label, const std::string& cmd,
                      const SSHResult& r) {
    remotefs_log(fmt::format("{} CMD: {}", label, cmd));
    remotefs_log(fmt::format("{} exit={} stdout({})", label, r.exit_code,
                             r.stdout_data.size()));
    if (!r.stderr_data.empty())
        remotefs_log(fmt::format("{} stderr={}", label, r.stderr_data.substr(0, 500)));
}
