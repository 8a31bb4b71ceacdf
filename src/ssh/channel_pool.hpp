#pragma once

#include <condition_variable>
#include <memory>
#include <mutex>
#include <core/types.hpp>
#include <core/constants.hpp>
#include "transport.hpp"

class ChannelPool;

// Scoped ownership of one leased channel and its pool slot.
// The slot is handed back exactly once: on release() or on destruction,
// whichever comes first. Move-only.
class ChannelLease {
public:
    ChannelLease() = default;
    ChannelLease(ChannelPool* pool, std::unique_ptr<ExecChannel> channel);
    ~ChannelLease();

    ChannelLease(ChannelLease&& other) noexcept;
    ChannelLease& operator=(ChannelLease&& other) noexcept;
    ChannelLease(const ChannelLease&) = delete;
    ChannelLease& operator=(const ChannelLease&) = delete;

    ExecChannel& channel() { return *channel_; }
    ExecChannel* operator->() { return channel_.get(); }
    explicit operator bool() const { return channel_ != nullptr; }

    // Close the channel and free the slot now. Safe to call repeatedly.
    void release();

private:
    ChannelPool* pool_ = nullptr;
    std::unique_ptr<ExecChannel> channel_;
};

// Bounds how many command channels may be open at once against one
// transport connection.
//
// The mutex guards only the closed flag and the slot count. Opening the
// channel and running the command happen outside it, so slow commands
// never hold up bookkeeping for other leases.
class ChannelPool {
public:
    ChannelPool(Transport& transport, int capacity = DEFAULT_MAX_SESSIONS);

    ChannelPool(const ChannelPool&) = delete;
    ChannelPool& operator=(const ChannelPool&) = delete;

    // Block until a slot is free, then open a fresh channel on it.
    // Fails immediately with PoolClosed once close() has been called.
    Result<ChannelLease> acquire();

    // Close `channel` and free one slot. No-op on a null channel.
    void release(std::unique_ptr<ExecChannel> channel);

    // Refuse new leases. Outstanding leases are untouched and still release
    // normally. Only the first call has an effect.
    void close();

    // Block until every outstanding lease has been released.
    void wait_idle();

    int capacity() const { return capacity_; }
    int in_use() const;
    bool is_closed() const;

private:
    Transport& transport_;
    const int capacity_;

    mutable std::mutex mutex_;
    std::condition_variable slot_freed_;
    std::condition_variable drained_;
    int in_use_ = 0;
    bool closed_ = false;

    void free_slot();
};
