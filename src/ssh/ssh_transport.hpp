#pragma once

#include <memory>
#include <mutex>
#include "session.hpp"
#include "transport.hpp"

// Transport over one authenticated libssh2 session.
//
// open_channel() grants a fresh exec channel (no PTY) per call; callers own
// the result and must not reuse it. Channel opening and every libssh2 call
// on the returned channels serialize on the session's io_mutex, which is
// held only for the duration of each individual API call.
class SshTransport : public Transport {
public:
    explicit SshTransport(const SessionTarget& target);
    ~SshTransport() override;

    Result<void> connect(StatusCallback callback = nullptr);

    Result<std::unique_ptr<ExecChannel>> open_channel() override;
    void close() override;

private:
    std::unique_ptr<SessionManager> session_;
    std::once_flag close_once_;
};
