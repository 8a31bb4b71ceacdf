#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <core/types.hpp>
#include <core/constants.hpp>

// Stream call results other than a byte count.
constexpr long CHANNEL_IO_AGAIN = -1;   // would block, retry later
constexpr long CHANNEL_IO_ERROR = -2;

// Non-blocking view of the three streams of one running command.
// Writes and reads return a byte count, CHANNEL_IO_AGAIN or CHANNEL_IO_ERROR.
// send_eof() returns 0 once stdin has been closed.
class ChannelStreams {
public:
    virtual ~ChannelStreams() = default;

    virtual long write_stdin(const char* data, size_t len) = 0;
    virtual long send_eof() = 0;
    virtual long read_stdout(char* buf, size_t len) = 0;
    virtual long read_stderr(char* buf, size_t len) = 0;

    // True once the remote side has closed its output and nothing is buffered.
    virtual bool remote_eof() = 0;
};

// Feed `input` to stdin, then EOF, while collecting stdout and stderr.
//
// Output is drained on every pass, including while stdin is still being
// written: a command that echoes its input (tee) stops reading stdin once
// its unread output fills the channel window. Returns once the remote side
// reaches EOF. Input the command never read is dropped at that point. Fails
// when no byte moves in either direction for `stall_secs`.
Result<void> exchange_streams(ChannelStreams& io, const std::string& input,
                              std::string& out, std::string& err,
                              int stall_secs = SSH_STREAM_STALL_SECS);

// Repeat `call` while it returns `again`, sleeping between attempts, for at
// most `timeout_secs`. Returns the last result.
int retry_while_again(int again, const std::function<int()>& call, int timeout_secs);
