#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <core/types.hpp>
#include <core/constants.hpp>

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;

struct SessionTarget {
    std::string host;
    int port = SSH_DEFAULT_PORT;
    std::string user;
    std::string password;
    int timeout = SSH_CONNECT_TIMEOUT_SECS;
    std::optional<std::string> ssh_key_path;
    std::optional<std::string> ssh_key_data;       // in-memory private key
};

// Owns the TCP socket and the authenticated libssh2 session.
// No channel is opened here; exec channels are opened on demand by
// SshTransport. Every libssh2 call on this session must hold io_mutex().
class SessionManager {
public:
    explicit SessionManager(const SessionTarget& target);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    Result<void> establish(StatusCallback callback = nullptr);
    void close();
    bool is_active() const;

    LIBSSH2_SESSION* get_raw_session() { return session_; }
    std::shared_ptr<std::mutex> io_mutex() { return io_mutex_; }

private:
    SessionTarget target_;
    LIBSSH2_SESSION* session_;
    int sock_;
    std::atomic<bool> active_;
    std::string target_str_;
    std::shared_ptr<std::mutex> io_mutex_;

    Result<void> connect_socket(StatusCallback callback);
    Result<void> ssh_userauth(StatusCallback callback);
    void teardown(const char* reason);
};
