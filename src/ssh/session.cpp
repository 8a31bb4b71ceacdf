#include "session.hpp"
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <platform/socket_util.hpp>
#include <libssh2.h>
#include <fmt/format.h>
#include <cstring>

// Password handed to the keyboard-interactive callback via the session abstract pointer
struct KbdAuthData {
    std::string password;
    StatusCallback callback;
};

// libssh2 keyboard-interactive callback: answer every prompt with the password
static void kbd_callback(const char* /*name*/, int /*name_len*/,
                          const char* /*instruction*/, int /*instruction_len*/,
                          int num_prompts,
                          const LIBSSH2_USERAUTH_KBDINT_PROMPT* /*prompts*/,
                          LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                          void** abstract) {
    KbdAuthData* data = static_cast<KbdAuthData*>(*abstract);

    for (int i = 0; i < num_prompts; i++) {
        if (data->callback) data->callback("Sending password...");
        responses[i].text = strdup(data->password.c_str());
        responses[i].length = data->password.length();
    }
}

SessionManager::SessionManager(const SessionTarget& target)
    : target_(target), session_(nullptr), sock_(-1), active_(false),
      io_mutex_(std::make_shared<std::mutex>()) {
}

SessionManager::~SessionManager() {
    close();
}

Result<void> SessionManager::establish(StatusCallback callback) {
    if (callback) {
        callback(fmt::format("Connecting to {}:{}...", target_.host, target_.port));
    }

    int rc = libssh2_init(0);
    if (rc != 0) {
        return Result<void>::Err(Error::transport("Failed to initialize libssh2"));
    }

    auto sock_result = connect_socket(callback);
    if (sock_result.is_err()) return sock_result;

    if (callback) callback("TCP connected, starting SSH handshake...");

    session_ = libssh2_session_init_ex(nullptr, nullptr, nullptr, nullptr);
    if (!session_) {
        teardown("Session init failed");
        return Result<void>::Err(Error::transport("Failed to create SSH session"));
    }

    libssh2_session_set_blocking(session_, 0);

    // SSH handshake (key exchange)
    int ret;
    while ((ret = libssh2_session_handshake(session_, sock_)) == LIBSSH2_ERROR_EAGAIN) {
        platform::sleep_ms(SSH_HANDSHAKE_SLEEP_MS);
    }
    if (ret != 0) {
        teardown("Handshake failed");
        return Result<void>::Err(Error::transport("SSH handshake failed"));
    }

    platform::enable_keepalive(sock_, 60);

    // Enable SSH keepalive (send every 30s)
    libssh2_keepalive_config(session_, 1, 30);

    if (callback) callback("SSH handshake complete, authenticating...");

    auto auth_result = ssh_userauth(callback);
    if (auth_result.is_err()) {
        teardown("Authentication failed");
        return auth_result;
    }

    active_ = true;
    target_str_ = target_.user + "@" + target_.host;
    remotefs_log(fmt::format("session established: {}:{}", target_str_, target_.port));

    if (callback) {
        callback("Connected to " + target_.host);
    }

    return Result<void>::Ok();
}

Result<void> SessionManager::connect_socket(StatusCallback callback) {
    auto sock = platform::tcp_connect(target_.host, target_.port, target_.timeout);
    if (sock.is_err()) return Result<void>::Err(sock.error);

    sock_ = static_cast<int>(sock.value);
    if (callback) callback("Socket connected");
    return Result<void>::Ok();
}

Result<void> SessionManager::ssh_userauth(StatusCallback callback) {
    int ret;

    // Check what auth methods the server supports
    char* auth_list = nullptr;
    while ((auth_list = libssh2_userauth_list(session_, target_.user.c_str(),
                                              target_.user.length())) == nullptr) {
        if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) {
            break;
        }
        platform::sleep_ms(SSH_HANDSHAKE_SLEEP_MS);
    }

    std::string methods = auth_list ? auth_list : "";
    if (callback && !methods.empty()) {
        callback("Auth methods: " + methods);
    }

    // Private key first when one is configured; inline key text wins over a file
    bool has_key = target_.ssh_key_data || target_.ssh_key_path;
    if (has_key && methods.find("publickey") != std::string::npos) {
        if (callback) callback("Using public key auth...");

        if (target_.ssh_key_data) {
            const std::string& key = *target_.ssh_key_data;
            while ((ret = libssh2_userauth_publickey_frommemory(session_,
                    target_.user.c_str(), target_.user.length(), nullptr, 0,
                    key.c_str(), key.length(), nullptr)) == LIBSSH2_ERROR_EAGAIN) {
                platform::sleep_ms(SSH_HANDSHAKE_SLEEP_MS);
            }
        } else {
            while ((ret = libssh2_userauth_publickey_fromfile(session_,
                    target_.user.c_str(), nullptr, target_.ssh_key_path->c_str(),
                    nullptr)) == LIBSSH2_ERROR_EAGAIN) {
                platform::sleep_ms(SSH_HANDSHAKE_SLEEP_MS);
            }
        }

        if (ret == 0) {
            if (callback) callback("Authentication successful");
            return Result<void>::Ok();
        }
        if (callback) callback("Public key rejected");
    }

    if (target_.password.empty()) {
        return Result<void>::Err(Error::transport(
            "Authentication failed (no usable key or password)"));
    }

    if (methods.empty() || methods.find("password") != std::string::npos) {
        if (callback) callback("Using password auth...");

        while ((ret = libssh2_userauth_password(session_,
                target_.user.c_str(), target_.password.c_str())) == LIBSSH2_ERROR_EAGAIN) {
            platform::sleep_ms(SSH_HANDSHAKE_SLEEP_MS);
        }

        if (ret == 0) {
            if (callback) callback("Authentication successful");
            return Result<void>::Ok();
        }
    }

    // Some servers only expose passwords through keyboard-interactive
    if (methods.find("keyboard-interactive") != std::string::npos) {
        if (callback) callback("Using keyboard-interactive auth...");

        KbdAuthData kbd_data;
        kbd_data.password = target_.password;
        kbd_data.callback = callback;
        *libssh2_session_abstract(session_) = &kbd_data;

        while ((ret = libssh2_userauth_keyboard_interactive(session_,
                target_.user.c_str(), kbd_callback)) == LIBSSH2_ERROR_EAGAIN) {
            platform::sleep_ms(SSH_HANDSHAKE_SLEEP_MS);
        }
        *libssh2_session_abstract(session_) = nullptr;

        if (ret == 0) {
            if (callback) callback("Authentication successful");
            return Result<void>::Ok();
        }
    }

    return Result<void>::Err(Error::transport(
        "Authentication failed (check username/password/key)"));
}

void SessionManager::teardown(const char* reason) {
    if (session_) {
        libssh2_session_disconnect(session_, reason);
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    if (sock_ >= 0) {
        platform::close_socket(sock_);
        sock_ = -1;
    }
}

void SessionManager::close() {
    // Mark inactive first so concurrent operations bail out early
    active_ = false;

    // Each libssh2 call gets its own brief lock; disconnect does network I/O.
    if (session_) {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            libssh2_session_disconnect(session_, "Normal disconnection");
        }
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            libssh2_session_free(session_);
        }
        session_ = nullptr;
        remotefs_log("session closed: " + target_str_);
    }

    if (sock_ >= 0) {
        platform::close_socket(sock_);
        sock_ = -1;
    }
}

bool SessionManager::is_active() const {
    return active_;
}
