#include "command_runner.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <fmt/format.h>

Result<std::string> run_command(ExecChannel& channel, const std::string& command,
                                const std::string& input) {
    auto exec = channel.exec(command, input);
    if (exec.is_err()) {
        remotefs_log(fmt::format("run CMD: {} transport error: {}", command,
                                 exec.error.message));
        return Result<std::string>::Err(exec.error);
    }

    const SSHResult& r = exec.value;
    remotefs_log_cmd("run", command, r);

    if (r.failed()) {
        Error err;
        err.kind = ErrorKind::Command;
        err.message = fmt::format("Process exited with status {}", r.exit_code);
        err.command = command;
        err.stderr_data = r.stderr_data;
        return Result<std::string>::Err(std::move(err));
    }

    return Result<std::string>::Ok(r.stdout_data);
}

bool is_not_found(const Error& error) {
    if (error.kind == ErrorKind::NotFound) return true;
    return error.kind == ErrorKind::Command &&
           error.stderr_data.find(REMOTE_NOT_FOUND) != std::string::npos;
}
