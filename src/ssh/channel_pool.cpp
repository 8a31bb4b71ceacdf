#include "channel_pool.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <algorithm>

// ── ChannelLease ───────────────────────────────────────────────

ChannelLease::ChannelLease(ChannelPool* pool, std::unique_ptr<ExecChannel> channel)
    : pool_(pool), channel_(std::move(channel)) {}

ChannelLease::~ChannelLease() {
    release();
}

ChannelLease::ChannelLease(ChannelLease&& other) noexcept
    : pool_(other.pool_), channel_(std::move(other.channel_)) {
    other.pool_ = nullptr;
}

ChannelLease& ChannelLease::operator=(ChannelLease&& other) noexcept {
    if (this != &other) {
        release();
        pool_ = other.pool_;
        channel_ = std::move(other.channel_);
        other.pool_ = nullptr;
    }
    return *this;
}

void ChannelLease::release() {
    if (!pool_) return;
    ChannelPool* pool = pool_;
    pool_ = nullptr;
    pool->release(std::move(channel_));
}

// ── ChannelPool ────────────────────────────────────────────────

ChannelPool::ChannelPool(Transport& transport, int capacity)
    : transport_(transport), capacity_(std::max(1, capacity)) {}

Result<ChannelLease> ChannelPool::acquire() {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        slot_freed_.wait(lock, [this] { return closed_ || in_use_ < capacity_; });
        if (closed_) {
            return Result<ChannelLease>::Err(Error::pool_closed());
        }
        ++in_use_;
    }

    auto opened = transport_.open_channel();
    if (opened.is_err()) {
        free_slot();
        remotefs_log("channel open failed: " + opened.error.message);
        return Result<ChannelLease>::Err(opened.error);
    }

    return Result<ChannelLease>::Ok(ChannelLease(this, std::move(opened.value)));
}

void ChannelPool::release(std::unique_ptr<ExecChannel> channel) {
    if (!channel) return;

    // The slot goes back regardless of how closing the channel went
    channel->close();
    channel.reset();
    free_slot();
}

void ChannelPool::free_slot() {
    bool idle;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (in_use_ > 0) --in_use_;
        idle = in_use_ == 0;
    }
    slot_freed_.notify_one();
    if (idle) drained_.notify_all();
}

void ChannelPool::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return;
        closed_ = true;
    }
    remotefs_log(fmt::format("channel pool closed ({} leases outstanding)", in_use()));
    slot_freed_.notify_all();
}

void ChannelPool::wait_idle() {
    std::unique_lock<std::mutex> lock(mutex_);
    drained_.wait(lock, [this] { return in_use_ == 0; });
}

int ChannelPool::in_use() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_use_;
}

bool ChannelPool::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}
