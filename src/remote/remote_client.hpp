#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <core/types.hpp>
#include <core/constants.hpp>
#include <ssh/channel_pool.hpp>
#include <ssh/transport.hpp>

struct SessionTarget;

struct FileContent {
    std::string content;
    bool exists = false;
};

// Filesystem operations on the remote host, each one shell command on its
// own leased channel (FileExists may use a second channel for its probe).
//
// Every command is prefixed with "sudo " when the client was created with
// sudo enabled; there is no per-call override. Paths are passed to the
// remote shell verbatim.
class RemoteClient {
public:
    RemoteClient(std::unique_ptr<Transport> transport, bool sudo,
                 int max_sessions = DEFAULT_MAX_SESSIONS);
    ~RemoteClient();

    RemoteClient(const RemoteClient&) = delete;
    RemoteClient& operator=(const RemoteClient&) = delete;

    // Dial and authenticate over SSH, then wrap the session in a client.
    static Result<std::unique_ptr<RemoteClient>> connect(const SessionTarget& target,
                                                         bool sudo, int max_sessions,
                                                         StatusCallback callback = nullptr);

    // ── Writes ─────────────────────────────────────────────────

    // Stream `content` to the remote stdin through tee. With ensure_dir,
    // the parent directory is created first.
    Result<void> write_file(const std::string& content, const std::string& path,
                            bool ensure_dir = false);
    Result<void> create_dir(const std::string& path);

    Result<void> chown(const std::string& path, const std::string& owner);
    Result<void> chgrp(const std::string& path, const std::string& group);
    Result<void> chmod(const std::string& path, const std::string& permissions);

    // Fails with ErrorKind::NotFound if the file is already gone.
    Result<void> delete_file(const std::string& path);
    // Recursive; succeeds on a missing path.
    Result<void> delete_folder(const std::string& path);

    // ── Reads ──────────────────────────────────────────────────

    // A missing file is reported as exists=false, not as an error.
    Result<FileContent> read_file(const std::string& path);
    Result<bool> file_exists(const std::string& path);
    // Non-zero exit means "absent"; only lease failures are errors.
    Result<bool> dir_exists(const std::string& path);

    // Octal mode, zero-padded to four digits ("644" -> "0644").
    Result<std::string> read_permissions(const std::string& path);
    Result<std::string> read_owner(const std::string& path);
    Result<std::string> read_group(const std::string& path);
    Result<std::string> read_owner_name(const std::string& path);
    Result<std::string> read_group_name(const std::string& path);

    // `stat -c %<format> <path>`, newline stripped.
    Result<std::string> stat_file(const std::string& path, char format);

    // ── Lifecycle ──────────────────────────────────────────────

    // Close the pool, wait for outstanding leases to be released, then
    // close the transport. Idempotent. Must not be called while the calling
    // thread itself holds a lease.
    void close();

    ChannelPool& pool() { return pool_; }

private:
    std::unique_ptr<Transport> transport_;
    ChannelPool pool_;
    bool sudo_;
    std::once_flag close_once_;

    std::string with_sudo(const std::string& cmd) const;

    // Lease one channel, run `cmd`, release the channel on every path.
    Result<std::string> run(const std::string& cmd, const std::string& input = "");
};
