/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#pragma once

#include "mdnskit/core/assert.hpp"

#include <boost/asio.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>

namespace mdk {

/**
 * A timer built on boost::asio::steady_timer which takes care of cancellation, so the owner does not need to think
 * about outstanding waits when it goes away.
 */
class AsioTimer {
  public:
    using TimerCallback = std::function<void()>;

    explicit AsioTimer(boost::asio::io_context& io_context);
    ~AsioTimer();

    AsioTimer(const AsioTimer&) = delete;
    AsioTimer& operator=(const AsioTimer&) = delete;

    /**
     * Fires the callback once after the given duration. A running timer is stopped first.
     * The callback may re-arm this timer.
     * @param duration The duration to wait before firing the callback.
     * @param cb The callback to fire.
     */
    void once(std::chrono::milliseconds duration, TimerCallback cb);

    /**
     * Fires the callback after the given duration, repeatedly until stopped if `repeating` is true.
     * A running timer is stopped first.
     * @param duration The duration to wait before firing the callback.
     * @param cb The callback to fire.
     * @param repeating If true, the callback fires after each duration until stop() is called.
     */
    void start(std::chrono::milliseconds duration, TimerCallback cb, bool repeating = true);

    /**
     * Stops the timer. After this call returns no more callbacks will be fired.
     */
    void stop();

    /**
     * @return True if a callback is scheduled.
     */
    [[nodiscard]] bool is_armed();

  private:
    struct State {
        std::recursive_mutex mutex;
        TimerCallback callback;
        bool repeating = false;
        std::chrono::milliseconds duration = std::chrono::milliseconds(0);
        // Incremented on every start and stop, so a wait which completed before being cancelled is discarded.
        uint64_t generation = 0;
    };

    boost::asio::steady_timer timer_;
    std::shared_ptr<State> state_ = std::make_shared<State>();

    void wait();
};

}  // namespace mdk
