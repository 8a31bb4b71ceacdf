#pragma once

#include <memory>
#include <string>
#include <core/types.hpp>

// A single-use command execution handle over a shared transport connection.
// Opened, run once, closed. Never shared between threads.
class ExecChannel {
public:
    virtual ~ExecChannel() = default;

    // Run `command`, feeding `input` to its stdin then sending EOF.
    // stdout and stderr are captured separately. A non-zero exit status is
    // reported through SSHResult; only transport failures yield an Err.
    virtual Result<SSHResult> exec(const std::string& command,
                                   const std::string& input) = 0;

    // Close the channel. Idempotent.
    virtual void close() = 0;
};

// One long-lived, already-authenticated connection able to open
// independent command channels.
class Transport {
public:
    virtual ~Transport() = default;

    virtual Result<std::unique_ptr<ExecChannel>> open_channel() = 0;

    // Tear the connection down. Only the first call has an effect.
    virtual void close() = 0;
};
