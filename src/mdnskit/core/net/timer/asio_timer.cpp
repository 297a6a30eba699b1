/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "mdnskit/core/net/timer/asio_timer.hpp"

#include "mdnskit/core/log.hpp"

mdk::AsioTimer::AsioTimer(boost::asio::io_context& io_context) : timer_(io_context) {}

mdk::AsioTimer::~AsioTimer() {
    stop();
}

void mdk::AsioTimer::once(const std::chrono::milliseconds duration, TimerCallback cb) {
    start(duration, std::move(cb), false);
}

void mdk::AsioTimer::start(const std::chrono::milliseconds duration, TimerCallback cb, const bool repeating) {
    std::lock_guard lock(state_->mutex);
    timer_.cancel();
    ++state_->generation;
    state_->callback = std::move(cb);
    state_->duration = duration < std::chrono::milliseconds::zero() ? std::chrono::milliseconds::zero() : duration;
    state_->repeating = repeating;
    wait();
}

void mdk::AsioTimer::stop() {
    std::lock_guard lock(state_->mutex);
    timer_.cancel();
    ++state_->generation;
    state_->callback = nullptr;
    state_->repeating = false;
}

bool mdk::AsioTimer::is_armed() {
    std::lock_guard lock(state_->mutex);
    return state_->callback != nullptr;
}

void mdk::AsioTimer::wait() {
    timer_.expires_after(state_->duration);
    timer_.async_wait([this, state = state_, generation = state_->generation](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted) {
            return;
        }

        if (ec) {
            MDK_ERROR("Timer error: {}", ec.message());
            return;
        }

        std::lock_guard lock(state->mutex);
        // A stale generation also covers the timer having been destroyed, don't touch `this` in that case.
        if (generation != state->generation || !state->callback) {
            return;
        }

        if (state->repeating) {
            state->callback();
            if (generation == state->generation && state->repeating) {
                wait();
            }
            return;
        }

        // Take the callback out before invoking it, so it can re-arm the timer.
        auto cb = std::move(state->callback);
        state->callback = nullptr;
        cb();
    });
}
