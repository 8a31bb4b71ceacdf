#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <core/types.hpp>
#include "transport.hpp"

// libssh2 forward declaration
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;

// RAII handle for one libssh2 "session" channel used for a single exec.
// No PTY is requested, so stdin/stdout are binary-clean and stderr stays
// on its own stream. All libssh2 calls are protected by brief io_mutex_ holds.
class SshExecChannel : public ExecChannel {
public:
    SshExecChannel(LIBSSH2_CHANNEL* ch, std::shared_ptr<std::mutex> io_mutex);
    ~SshExecChannel() override;

    SshExecChannel(const SshExecChannel&) = delete;
    SshExecChannel& operator=(const SshExecChannel&) = delete;

    Result<SSHResult> exec(const std::string& command,
                           const std::string& input) override;
    void close() override;

private:
    LIBSSH2_CHANNEL* ch_;
    std::shared_ptr<std::mutex> io_mutex_;
    bool used_ = false;

    int finish();
};
