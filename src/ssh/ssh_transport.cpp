#include "ssh_transport.hpp"
#include "exec_channel.hpp"
#include <core/constants.hpp>
#include <platform/platform.hpp>
#include <libssh2.h>
#include <chrono>

// ── Lifecycle ──────────────────────────────────────────────────

SshTransport::SshTransport(const SessionTarget& target)
    : session_(std::make_unique<SessionManager>(target)) {}

SshTransport::~SshTransport() {
    close();
}

Result<void> SshTransport::connect(StatusCallback callback) {
    return session_->establish(callback);
}

void SshTransport::close() {
    std::call_once(close_once_, [this] { session_->close(); });
}

// ── Channel grants ─────────────────────────────────────────────

Result<std::unique_ptr<ExecChannel>> SshTransport::open_channel() {
    using ChannelResult = Result<std::unique_ptr<ExecChannel>>;

    if (!session_->is_active()) {
        return ChannelResult::Err(Error::transport("SSH session is not connected"));
    }

    auto io_mtx = session_->io_mutex();
    LIBSSH2_SESSION* ssh = session_->get_raw_session();

    LIBSSH2_CHANNEL* ch = nullptr;
    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::seconds(SSH_CHANNEL_OPEN_SECS);
    while (std::chrono::steady_clock::now() < deadline) {
        {
            std::lock_guard<std::mutex> lock(*io_mtx);
            ch = libssh2_channel_open_session(ssh);
            if (!ch && libssh2_session_last_errno(ssh) != LIBSSH2_ERROR_EAGAIN) {
                char* msg = nullptr;
                libssh2_session_last_error(ssh, &msg, nullptr, 0);
                return ChannelResult::Err(Error::transport(
                    std::string("Failed to open exec channel: ") + (msg ? msg : "unknown error")));
            }
        }
        if (ch) break;
        platform::sleep_ms(SSH_EAGAIN_SLEEP_MS);
    }
    if (!ch) {
        return ChannelResult::Err(Error::transport("Timed out opening exec channel"));
    }

    return ChannelResult::Ok(std::make_unique<SshExecChannel>(ch, io_mtx));
}
