#include "channel_io.hpp"
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <chrono>

Result<void> exchange_streams(ChannelStreams& io, const std::string& input,
                              std::string& out, std::string& err, int stall_secs) {
    char buf[SSH_READ_BUF_SIZE];
    size_t sent = 0;
    bool eof_sent = false;
    auto last_progress = std::chrono::steady_clock::now();

    while (true) {
        bool progress = false;

        if (sent < input.size()) {
            long w = io.write_stdin(input.data() + sent, input.size() - sent);
            if (w > 0) {
                sent += static_cast<size_t>(w);
                progress = true;
            } else if (w == CHANNEL_IO_ERROR) {
                return Result<void>::Err(Error::transport("Channel write error sending data"));
            }
        } else if (!eof_sent) {
            long rc = io.send_eof();
            if (rc == 0) {
                eof_sent = true;
                progress = true;
            } else if (rc != CHANNEL_IO_AGAIN) {
                return Result<void>::Err(Error::transport("Failed to send EOF on channel"));
            }
        }

        long n_out = io.read_stdout(buf, sizeof(buf));
        if (n_out > 0) {
            out.append(buf, static_cast<size_t>(n_out));
            progress = true;
        }
        long n_err = io.read_stderr(buf, sizeof(buf));
        if (n_err > 0) {
            err.append(buf, static_cast<size_t>(n_err));
            progress = true;
        }
        if (n_out == CHANNEL_IO_ERROR || n_err == CHANNEL_IO_ERROR) {
            return Result<void>::Err(Error::transport("SSH channel read error"));
        }

        auto now = std::chrono::steady_clock::now();
        if (progress) {
            last_progress = now;
            continue;
        }
        if (io.remote_eof()) break;
        if (now - last_progress > std::chrono::seconds(stall_secs)) {
            return Result<void>::Err(Error::transport(fmt::format(
                "Channel stalled: nothing sent or received for {}s ({} of {} input bytes sent)",
                stall_secs, sent, input.size())));
        }
        platform::sleep_ms(SSH_EAGAIN_SLEEP_MS);
    }
    return Result<void>::Ok();
}

int retry_while_again(int again, const std::function<int()>& call, int timeout_secs) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(timeout_secs);
    int rc = call();
    while (rc == again && std::chrono::steady_clock::now() < deadline) {
        platform::sleep_ms(SSH_EAGAIN_SLEEP_MS);
        rc = call();
    }
    return rc;
}
