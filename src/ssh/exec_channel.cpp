#include "exec_channel.hpp"
#include "channel_io.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <libssh2.h>
#include <fmt/format.h>

namespace {

// libssh2 channel streams, each call under a brief io_mutex hold
class Libssh2Streams : public ChannelStreams {
public:
    Libssh2Streams(LIBSSH2_CHANNEL* ch, std::mutex& io_mutex)
        : ch_(ch), io_mutex_(io_mutex) {}

    long write_stdin(const char* data, size_t len) override {
        std::lock_guard<std::mutex> lock(io_mutex_);
        return map(libssh2_channel_write(ch_, data, len));
    }
    long send_eof() override {
        std::lock_guard<std::mutex> lock(io_mutex_);
        return map(libssh2_channel_send_eof(ch_));
    }
    long read_stdout(char* buf, size_t len) override {
        std::lock_guard<std::mutex> lock(io_mutex_);
        return map(libssh2_channel_read(ch_, buf, len));
    }
    long read_stderr(char* buf, size_t len) override {
        std::lock_guard<std::mutex> lock(io_mutex_);
        return map(libssh2_channel_read_stderr(ch_, buf, len));
    }
    bool remote_eof() override {
        std::lock_guard<std::mutex> lock(io_mutex_);
        return libssh2_channel_eof(ch_) != 0;
    }

private:
    LIBSSH2_CHANNEL* ch_;
    std::mutex& io_mutex_;

    static long map(ssize_t rc) {
        if (rc == LIBSSH2_ERROR_EAGAIN) return CHANNEL_IO_AGAIN;
        if (rc < 0) return CHANNEL_IO_ERROR;
        return static_cast<long>(rc);
    }
};

} // namespace

SshExecChannel::SshExecChannel(LIBSSH2_CHANNEL* ch,
                               std::shared_ptr<std::mutex> io_mutex)
    : ch_(ch), io_mutex_(std::move(io_mutex)) {
}

SshExecChannel::~SshExecChannel() {
    close();
}

Result<SSHResult> SshExecChannel::exec(const std::string& command,
                                       const std::string& input) {
    if (!ch_) {
        return Result<SSHResult>::Err(Error::transport("channel is closed"));
    }
    if (used_) {
        return Result<SSHResult>::Err(Error::transport("channel already used"));
    }
    used_ = true;

    int rc = retry_while_again(LIBSSH2_ERROR_EAGAIN, [this, &command] {
        std::lock_guard<std::mutex> lock(*io_mutex_);
        return libssh2_channel_exec(ch_, command.c_str());
    }, SSH_CHANNEL_OPEN_SECS);
    if (rc != 0) {
        return Result<SSHResult>::Err(Error::transport("Failed to exec command on channel"));
    }

    SSHResult result{0, "", ""};
    Libssh2Streams streams(ch_, *io_mutex_);
    auto exchanged = exchange_streams(streams, input, result.stdout_data, result.stderr_data);
    if (exchanged.is_err()) {
        return Result<SSHResult>::Err(exchanged.error);
    }

    result.exit_code = finish();
    return Result<SSHResult>::Ok(std::move(result));
}

// Close the channel and collect the exit status.
int SshExecChannel::finish() {
    int rc = retry_while_again(LIBSSH2_ERROR_EAGAIN, [this] {
        std::lock_guard<std::mutex> lock(*io_mutex_);
        return libssh2_channel_close(ch_);
    }, SSH_CHANNEL_CLOSE_SECS);
    if (rc == 0) {
        retry_while_again(LIBSSH2_ERROR_EAGAIN, [this] {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            return libssh2_channel_wait_closed(ch_);
        }, SSH_CHANNEL_CLOSE_SECS);
    }

    std::lock_guard<std::mutex> lock(*io_mutex_);
    return libssh2_channel_get_exit_status(ch_);
}

void SshExecChannel::close() {
    if (!ch_) return;

    // An exec that failed midway leaves the channel open on the server.
    // Closing an already closed channel is a no-op in libssh2.
    retry_while_again(LIBSSH2_ERROR_EAGAIN, [this] {
        std::lock_guard<std::mutex> lock(*io_mutex_);
        return libssh2_channel_close(ch_);
    }, SSH_CHANNEL_CLOSE_SECS);

    int rc = retry_while_again(LIBSSH2_ERROR_EAGAIN, [this] {
        std::lock_guard<std::mutex> lock(*io_mutex_);
        return libssh2_channel_free(ch_);
    }, SSH_CHANNEL_CLOSE_SECS);
    if (rc != 0) {
        remotefs_log(fmt::format("exec channel free failed (rc={})", rc));
    }
    ch_ = nullptr;
}
