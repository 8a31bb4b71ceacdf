#pragma once

#include <string>
#include <functional>
#include <cstdint>
#include <utility>

// Error taxonomy for remote operations
enum class ErrorKind {
    None,
    Transport,     // channel creation / session failure
    PoolClosed,    // lease requested after the pool was closed
    Command,       // remote command exited non-zero
    NotFound,      // command failed because the target is absent
    Config,
    Parse,
};

struct Error {
    ErrorKind kind = ErrorKind::None;
    std::string message;        // transport-level cause, or context
    std::string command;        // exact command text (Command / NotFound)
    std::string stderr_data;    // raw captured error stream

    static Error transport(const std::string& msg) {
        return {ErrorKind::Transport, msg, "", ""};
    }

    static Error pool_closed() {
        return {ErrorKind::PoolClosed, "channel pool closed", "", ""};
    }

    static Error config(const std::string& msg) {
        return {ErrorKind::Config, msg, "", ""};
    }

    // Prefix resource-level context, keeping command text and stderr intact.
    Error wrap(const std::string& context) const {
        Error e = *this;
        e.message = message.empty() ? context : context + ": " + message;
        return e;
    }

    std::string to_string() const;
};

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    Error error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), Error{}};
    }

    static Result<T> Err(Error err) {
        return {false, T{}, std::move(err)};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, Error{ErrorKind::Config, err, "", ""}};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    Error error;

    static Result<void> Ok() {
        return {true, Error{}};
    }

    static Result<void> Err(Error err) {
        return {false, std::move(err)};
    }

    static Result<void> Err(const std::string& err) {
        return {false, Error{ErrorKind::Config, err, "", ""}};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Outcome of one command on one exec channel
struct SSHResult {
    int exit_code;
    std::string stdout_data;
    std::string stderr_data;

    bool success() const { return exit_code == 0; }
    bool failed() const { return exit_code != 0; }
};

// Status callback for long-running operations
using StatusCallback = std::function<void(const std::string&)>;
