#include "remote_client.hpp"
#include <core/utils.hpp>
#include <ssh/command_runner.hpp>
#include <ssh/ssh_transport.hpp>
#include <fmt/format.h>

RemoteClient::RemoteClient(std::unique_ptr<Transport> transport, bool sudo,
                           int max_sessions)
    : transport_(std::move(transport)), pool_(*transport_, max_sessions), sudo_(sudo) {}

RemoteClient::~RemoteClient() {
    close();
}

Result<std::unique_ptr<RemoteClient>> RemoteClient::connect(const SessionTarget& target,
                                                            bool sudo, int max_sessions,
                                                            StatusCallback callback) {
    using ClientResult = Result<std::unique_ptr<RemoteClient>>;

    auto transport = std::make_unique<SshTransport>(target);
    auto connected = transport->connect(callback);
    if (connected.is_err()) {
        return ClientResult::Err(connected.error);
    }
    return ClientResult::Ok(std::make_unique<RemoteClient>(std::move(transport), sudo,
                                                           max_sessions));
}

void RemoteClient::close() {
    std::call_once(close_once_, [this] {
        pool_.close();
        // Commands already running finish before the session goes away
        pool_.wait_idle();
        transport_->close();
    });
}

std::string RemoteClient::with_sudo(const std::string& cmd) const {
    return sudo_ ? SUDO_PREFIX + cmd : cmd;
}

Result<std::string> RemoteClient::run(const std::string& cmd, const std::string& input) {
    auto lease = pool_.acquire();
    if (lease.is_err()) {
        return Result<std::string>::Err(lease.error);
    }
    // lease.value releases the channel when it goes out of scope
    return run_command(lease.value.channel(), cmd, input);
}

// ── Writes ─────────────────────────────────────────────────────

Result<void> RemoteClient::write_file(const std::string& content, const std::string& path,
                                      bool ensure_dir) {
    std::string cmd = "cat /dev/stdin | " + with_sudo("tee " + path);
    if (ensure_dir) {
        cmd = fmt::format("mkdir -p {} && {}", remote_dirname(path), cmd);
    }

    auto r = run(cmd, content);
    if (r.is_err()) return Result<void>::Err(r.error);
    return Result<void>::Ok();
}

Result<void> RemoteClient::create_dir(const std::string& path) {
    auto r = run(with_sudo("mkdir -p " + path));
    if (r.is_err()) return Result<void>::Err(r.error);
    return Result<void>::Ok();
}

Result<void> RemoteClient::chown(const std::string& path, const std::string& owner) {
    auto r = run(with_sudo(fmt::format("chown {} {}", owner, path)));
    if (r.is_err()) return Result<void>::Err(r.error);
    return Result<void>::Ok();
}

Result<void> RemoteClient::chgrp(const std::string& path, const std::string& group) {
    auto r = run(with_sudo(fmt::format("chgrp {} {}", group, path)));
    if (r.is_err()) return Result<void>::Err(r.error);
    return Result<void>::Ok();
}

Result<void> RemoteClient::chmod(const std::string& path, const std::string& permissions) {
    auto r = run(with_sudo(fmt::format("chmod {} {}", permissions, path)));
    if (r.is_err()) return Result<void>::Err(r.error);
    return Result<void>::Ok();
}

Result<void> RemoteClient::delete_file(const std::string& path) {
    auto r = run(with_sudo("rm " + path));
    if (r.is_err()) {
        Error err = r.error;
        if (is_not_found(err)) err.kind = ErrorKind::NotFound;
        return Result<void>::Err(err);
    }
    return Result<void>::Ok();
}

Result<void> RemoteClient::delete_folder(const std::string& path) {
    auto r = run(with_sudo("rm -rf " + path));
    if (r.is_err()) return Result<void>::Err(r.error);
    return Result<void>::Ok();
}

// ── Reads ──────────────────────────────────────────────────────

Result<FileContent> RemoteClient::read_file(const std::string& path) {
    auto r = run(with_sudo("cat " + path));
    if (r.is_err()) {
        if (is_not_found(r.error)) {
            return Result<FileContent>::Ok(FileContent{"", false});
        }
        return Result<FileContent>::Err(r.error);
    }
    return Result<FileContent>::Ok(FileContent{r.value, true});
}

Result<bool> RemoteClient::file_exists(const std::string& path) {
    auto present = run(with_sudo("test -f " + path));
    if (present.is_ok()) return Result<bool>::Ok(true);
    if (present.error.kind != ErrorKind::Command) {
        return Result<bool>::Err(present.error);
    }

    // `test -f` also fails when the path can't be inspected at all; only a
    // successful negative probe proves the file is absent.
    auto absent = run(with_sudo("test ! -f " + path));
    if (absent.is_err()) {
        return Result<bool>::Err(absent.error.wrap("file existence probe inconclusive"));
    }
    return Result<bool>::Ok(false);
}

Result<bool> RemoteClient::dir_exists(const std::string& path) {
    auto lease = pool_.acquire();
    if (lease.is_err()) {
        return Result<bool>::Err(lease.error);
    }

    auto r = run_command(lease.value.channel(),
                         fmt::format("[ -d \"{}\" ] && exit 0 || exit 1", path));
    return Result<bool>::Ok(r.is_ok());
}

Result<std::string> RemoteClient::read_permissions(const std::string& path) {
    auto r = run(with_sudo("stat -c %a " + path));
    if (r.is_err()) return r;

    std::string permissions = strip_newlines(r.value);
    if (!permissions.empty() && permissions.size() < 4) {
        permissions = "0" + permissions;
    }
    return Result<std::string>::Ok(permissions);
}

Result<std::string> RemoteClient::read_owner(const std::string& path) {
    return stat_file(path, 'u');
}

Result<std::string> RemoteClient::read_group(const std::string& path) {
    return stat_file(path, 'g');
}

Result<std::string> RemoteClient::read_owner_name(const std::string& path) {
    return stat_file(path, 'U');
}

Result<std::string> RemoteClient::read_group_name(const std::string& path) {
    return stat_file(path, 'G');
}

Result<std::string> RemoteClient::stat_file(const std::string& path, char format) {
    auto r = run(with_sudo(fmt::format("stat -c %{} {}", format, path)));
    if (r.is_err()) return r;
    return Result<std::string>::Ok(strip_newlines(r.value));
}
