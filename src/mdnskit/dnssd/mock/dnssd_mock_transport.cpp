/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "mdnskit/dnssd/mock/dnssd_mock_transport.hpp"

#include "mdnskit/core/exception.hpp"
#include "mdnskit/core/log.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>

#include <algorithm>

class mdk::dnssd::MockTransport::BrowseOperation: public Operation {
  public:
    explicit BrowseOperation(std::shared_ptr<BrowseState> state) : state_(std::move(state)) {}

    ~BrowseOperation() override {
        state_->active = false;
    }

  private:
    std::shared_ptr<BrowseState> state_;
};

class mdk::dnssd::MockTransport::ResolveOperation: public Operation {
  public:
    explicit ResolveOperation(std::shared_ptr<ResolveState> state) : state_(std::move(state)) {}

    ~ResolveOperation() override {
        state_->active = false;
    }

  private:
    std::shared_ptr<ResolveState> state_;
};

namespace {

/**
 * Calls fn on the io_context after given delay.
 */
template<class Fn>
void run_after(boost::asio::io_context& io_context, const std::chrono::milliseconds delay, Fn fn) {
    if (delay <= std::chrono::milliseconds::zero()) {
        boost::asio::post(io_context, std::move(fn));
        return;
    }
    auto timer = std::make_shared<boost::asio::steady_timer>(io_context, delay);
    timer->async_wait([timer, fn = std::move(fn)](const boost::system::error_code& ec) mutable {
        if (ec) {
            return;
        }
        fn();
    });
}

template<class T>
void erase_expired(std::vector<std::weak_ptr<T>>& states) {
    states.erase(
        std::remove_if(
            states.begin(), states.end(),
            [](const std::weak_ptr<T>& state) {
                return state.expired();
            }
        ),
        states.end()
    );
}

}  // namespace

mdk::dnssd::MockTransport::MockTransport(boost::asio::io_context& io_context) : io_context_(io_context) {}

mdk::dnssd::MockTransport::~MockTransport() = default;

void mdk::dnssd::MockTransport::mock_service(
    const ServiceCandidate& candidate, tl::expected<ResolvedService, std::string> resolve_result,
    const std::chrono::milliseconds resolve_delay, const std::chrono::milliseconds found_delay
) {
    boost::asio::post(
        io_context_,
        [this, alive = std::weak_ptr<bool>(alive_), service = MockedService {candidate, std::move(resolve_result), resolve_delay, found_delay}] {
            if (alive.expired()) {
                return;
            }
            {
                std::lock_guard lock(mutex_);
                services_.push_back(service);
            }
            for (auto& browse : browses_for(service.candidate.type)) {
                emit_found(browse, service.candidate, service.found_delay);
            }
        }
    );
}

void mdk::dnssd::MockTransport::mock_discovering_service(const ServiceCandidate& candidate) {
    boost::asio::post(io_context_, [this, alive = std::weak_ptr<bool>(alive_), candidate] {
        if (alive.expired()) {
            return;
        }
        for (auto& browse : browses_for(candidate.type)) {
            emit_found(browse, candidate, {});
        }
    });
}

void mdk::dnssd::MockTransport::mock_removing_service(const ServiceCandidate& candidate) {
    boost::asio::post(io_context_, [this, alive = std::weak_ptr<bool>(alive_), candidate] {
        if (alive.expired()) {
            return;
        }
        for (auto& browse : browses_for(candidate.type)) {
            if (browse->active && browse->handlers.on_lost) {
                browse->handlers.on_lost(candidate);
            }
        }
    });
}

void mdk::dnssd::MockTransport::mock_browse_error(const std::string& reg_type, const std::string& error_message) {
    boost::asio::post(io_context_, [this, alive = std::weak_ptr<bool>(alive_), reg_type, error_message] {
        if (alive.expired()) {
            return;
        }
        for (auto& browse : browses_for(reg_type)) {
            if (browse->active && browse->handlers.on_error) {
                browse->handlers.on_error(error_message);
            }
        }
    });
}

void mdk::dnssd::MockTransport::mock_browse_failure(const std::string& error_message) {
    std::lock_guard lock(mutex_);
    browse_failure_ = error_message;
}

void mdk::dnssd::MockTransport::complete_resolve(
    const std::string& name, tl::expected<ResolvedService, std::string> result
) {
    boost::asio::post(io_context_, [this, alive = std::weak_ptr<bool>(alive_), name, result = std::move(result)] {
        if (alive.expired()) {
            return;
        }
        std::vector<std::shared_ptr<ResolveState>> pending;
        {
            std::lock_guard lock(mutex_);
            erase_expired(resolves_);
            for (auto& weak : resolves_) {
                auto state = weak.lock();
                if (state && state->active && state->candidate.name == name) {
                    pending.push_back(std::move(state));
                }
            }
        }
        for (auto& state : pending) {
            complete(state, result);
        }
    });
}

void mdk::dnssd::MockTransport::set_publish_behavior(PublishBehavior behavior) {
    std::lock_guard lock(mutex_);
    publish_behavior_ = std::move(behavior);
}

void mdk::dnssd::MockTransport::complete_publish(tl::expected<std::string, std::string> result) {
    boost::asio::post(io_context_, [this, alive = std::weak_ptr<bool>(alive_), result = std::move(result)] {
        if (alive.expired()) {
            return;
        }
        uint64_t generation = 0;
        {
            std::lock_guard lock(mutex_);
            generation = publish_generation_;
        }
        finish_publish(generation, result);
    });
}

void mdk::dnssd::MockTransport::set_supports_txt_records(const bool supported) {
    supports_txt_ = supported;
}

std::vector<std::string> mdk::dnssd::MockTransport::calls() const {
    std::lock_guard lock(mutex_);
    return calls_;
}

size_t mdk::dnssd::MockTransport::active_browse_count() const {
    std::lock_guard lock(mutex_);
    erase_expired(browses_);
    size_t count = 0;
    for (auto& weak : browses_) {
        const auto state = weak.lock();
        if (state && state->active) {
            ++count;
        }
    }
    return count;
}

size_t mdk::dnssd::MockTransport::active_resolve_count() const {
    std::lock_guard lock(mutex_);
    erase_expired(resolves_);
    size_t count = 0;
    for (auto& weak : resolves_) {
        const auto state = weak.lock();
        if (state && state->active) {
            ++count;
        }
    }
    return count;
}

std::unique_ptr<mdk::dnssd::Transport::Operation>
mdk::dnssd::MockTransport::browse(const std::string& reg_type, BrowseHandlers handlers) {
    record_call("browse:" + reg_type);

    std::vector<MockedService> matching;
    auto state = std::make_shared<BrowseState>();
    state->reg_type = reg_type;
    state->handlers = std::move(handlers);

    {
        std::lock_guard lock(mutex_);
        if (browse_failure_) {
            const auto message = *browse_failure_;
            browse_failure_.reset();
            MDK_THROW_EXCEPTION("{}", message);
        }
        erase_expired(browses_);
        browses_.push_back(state);
        for (auto& service : services_) {
            if (service.candidate.type == reg_type) {
                matching.push_back(service);
            }
        }
    }

    for (auto& service : matching) {
        emit_found(state, service.candidate, service.found_delay);
    }

    return std::make_unique<BrowseOperation>(state);
}

std::unique_ptr<mdk::dnssd::Transport::Operation> mdk::dnssd::MockTransport::resolve(
    const ServiceCandidate& candidate, const std::chrono::milliseconds timeout_hint, ResolveHandler handler
) {
    record_call("resolve:" + candidate.name);

    auto state = std::make_shared<ResolveState>();
    state->candidate = candidate;
    state->handler = std::move(handler);

    std::optional<MockedService> service;
    {
        std::lock_guard lock(mutex_);
        erase_expired(resolves_);
        resolves_.push_back(state);
        for (auto& s : services_) {
            if (s.candidate.name == candidate.name && s.candidate.type == candidate.type) {
                service = s;
                break;
            }
        }
    }

    if (service) {
        if (service->resolve_delay > timeout_hint) {
            run_after(io_context_, timeout_hint, [state] {
                complete(state, tl::unexpected(std::string("Resolve timed out")));
            });
        } else {
            run_after(io_context_, service->resolve_delay, [state, result = service->resolve_result] {
                complete(state, result);
            });
        }
    }

    return std::make_unique<ResolveOperation>(state);
}

void mdk::dnssd::MockTransport::publish(const Publication& publication, PublishHandler handler) {
    record_call("publish:" + publication.name);

    PublishBehavior behavior;
    uint64_t generation = 0;
    {
        std::lock_guard lock(mutex_);
        behavior = publish_behavior_;
        if (behavior.throw_message) {
            MDK_THROW_EXCEPTION("{}", *behavior.throw_message);
        }
        publish_handler_ = std::move(handler);
        generation = ++publish_generation_;
    }

    if (behavior.manual) {
        return;
    }

    tl::expected<std::string, std::string> result = behavior.final_name.value_or(publication.name);
    if (behavior.error) {
        result = tl::unexpected(*behavior.error);
    }

    run_after(io_context_, behavior.delay, [this, alive = std::weak_ptr<bool>(alive_), generation, result] {
        if (alive.expired()) {
            return;
        }
        finish_publish(generation, result);
    });
}

void mdk::dnssd::MockTransport::unpublish() {
    record_call("unpublish");
    std::lock_guard lock(mutex_);
    ++publish_generation_;
    publish_handler_ = nullptr;
}

bool mdk::dnssd::MockTransport::supports_txt_records() const {
    return supports_txt_;
}

size_t mdk::dnssd::MockTransport::tracked_operation_count() const {
    std::lock_guard lock(mutex_);
    erase_expired(browses_);
    erase_expired(resolves_);
    return browses_.size() + resolves_.size();
}

void mdk::dnssd::MockTransport::record_call(std::string call) {
    MDK_TRACE("MockTransport: {}", call);
    std::lock_guard lock(mutex_);
    calls_.push_back(std::move(call));
}

std::vector<std::shared_ptr<mdk::dnssd::MockTransport::BrowseState>>
mdk::dnssd::MockTransport::browses_for(const std::string& reg_type) {
    std::vector<std::shared_ptr<BrowseState>> result;
    std::lock_guard lock(mutex_);
    erase_expired(browses_);
    for (auto& weak : browses_) {
        auto state = weak.lock();
        if (state && state->active && state->reg_type == reg_type) {
            result.push_back(std::move(state));
        }
    }
    return result;
}

void mdk::dnssd::MockTransport::emit_found(
    const std::shared_ptr<BrowseState>& browse, const ServiceCandidate& candidate, const std::chrono::milliseconds delay
) {
    run_after(io_context_, delay, [browse, candidate] {
        if (browse->active && browse->handlers.on_found) {
            browse->handlers.on_found(candidate);
        }
    });
}

void mdk::dnssd::MockTransport::complete(
    const std::shared_ptr<ResolveState>& state, tl::expected<ResolvedService, std::string> result
) {
    if (!state->active.exchange(false)) {
        return;
    }
    auto handler = std::move(state->handler);
    state->handler = nullptr;
    if (handler) {
        handler(std::move(result));
    }
}

void mdk::dnssd::MockTransport::finish_publish(
    const uint64_t generation, tl::expected<std::string, std::string> result
) {
    PublishHandler handler;
    {
        std::lock_guard lock(mutex_);
        if (generation != publish_generation_ || !publish_handler_) {
            return;
        }
        handler = std::move(publish_handler_);
        publish_handler_ = nullptr;
    }
    handler(std::move(result));
}
