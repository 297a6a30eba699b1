/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "mdnskit/dnssd/dnssd_discovery_session.hpp"

#include "mdnskit/core/assert.hpp"
#include "mdnskit/core/log.hpp"
#include "mdnskit/dnssd/dnssd_name_matcher.hpp"

#include <algorithm>

mdk::dnssd::ServiceRecord mdk::dnssd::make_service_record(
    const ServiceCandidate& candidate, const ResolvedService& resolved, const ServiceType& type, const bool txt_supported
) {
    ServiceRecord record;
    record.name = candidate.name;
    record.type = type.full_type();
    record.domain = normalize_domain(candidate.domain);
    record.port = resolved.port;
    record.hosts = normalize_hosts(resolved.hosts);
    if (txt_supported && resolved.txt && !resolved.txt->empty()) {
        record.txt = resolved.txt;
    }
    return record;
}

mdk::dnssd::DiscoverySession::DiscoverySession(
    boost::asio::io_context& io_context, Transport& transport, Options options, CompletionHandler handler
) :
    transport_(transport),
    options_(std::move(options)),
    handler_(std::move(handler)),
    timeout_timer_(io_context),
    settle_timer_(io_context) {
    options_.timeout = std::max(options_.timeout, std::chrono::milliseconds::zero());
    options_.settle_window = std::max(options_.settle_window, std::chrono::milliseconds::zero());
    if (options_.target_name && options_.target_name->empty()) {
        options_.target_name.reset();
    }
}

mdk::dnssd::DiscoverySession::~DiscoverySession() {
    timeout_timer_.stop();
    settle_timer_.stop();
    resolves_.clear();
    browse_.reset();
}

void mdk::dnssd::DiscoverySession::start() {
    MDK_ASSERT_RETURN(state_ == State::idle, "Discovery session can only be started once");

    state_ = State::browsing;
    const auto reg_type = options_.type.full_type();

    MDK_DEBUG(
        "Discovery started for {} (target: {}, timeout: {}ms)", reg_type, options_.target_name.value_or("<none>"),
        options_.timeout.count()
    );

    timeout_timer_.once(options_.timeout, [this] {
        finish(FinishReason::timeout);
    });

    Transport::BrowseHandlers handlers;
    handlers.on_found = [this](const ServiceCandidate& candidate) {
        on_found(candidate);
    };
    handlers.on_lost = [this](const ServiceCandidate& candidate) {
        on_lost(candidate);
    };
    handlers.on_error = [this](const std::string& error_message) {
        on_browse_error(error_message);
    };

    try {
        auto browse = transport_.browse(reg_type, std::move(handlers));
        if (!terminated_) {
            browse_ = std::move(browse);
        }
    } catch (const std::exception& e) {
        on_browse_error(fmt::format("Failed to start browsing: {}", e.what()));
    }
}

void mdk::dnssd::DiscoverySession::cancel() {
    finish(FinishReason::cancelled);
}

mdk::dnssd::DiscoverySession::State mdk::dnssd::DiscoverySession::state() const {
    return state_;
}

mdk::dnssd::DiscoverySession::FinishReason mdk::dnssd::DiscoverySession::finish_reason() const {
    return finish_reason_;
}

bool mdk::dnssd::DiscoverySession::is_terminated() const {
    return terminated_;
}

size_t mdk::dnssd::DiscoverySession::pending_resolve_count() const {
    return pending_resolve_count_;
}

const mdk::dnssd::DiscoverySession::Options& mdk::dnssd::DiscoverySession::options() const {
    return options_;
}

void mdk::dnssd::DiscoverySession::on_found(const ServiceCandidate& candidate) {
    if (terminated_) {
        return;
    }

    if (options_.target_name && !instance_name_matches(candidate.name, *options_.target_name)) {
        MDK_TRACE("Ignoring {}: doesn't match {}", candidate.name, *options_.target_name);
        arm_settle_timer_if_idle();
        return;
    }

    auto key = candidate.key();
    if (!seen_candidates_.insert(key).second) {
        MDK_TRACE("Already resolving or resolved {} (interface {})", candidate.name, candidate.interface_index);
        arm_settle_timer_if_idle();
        return;
    }

    MDK_TRACE("Found {}, resolving", candidate.name);

    settle_timer_.stop();
    ++pending_resolve_count_;
    resolves_.emplace(key, nullptr);

    std::unique_ptr<Transport::Operation> resolve;
    try {
        resolve = transport_.resolve(
            candidate, options_.resolve_timeout,
            [this, candidate](tl::expected<ResolvedService, std::string> result) {
                on_resolved(candidate, std::move(result));
            }
        );
    } catch (const std::exception& e) {
        on_resolved(candidate, tl::unexpected(fmt::format("Failed to start resolve: {}", e.what())));
        return;
    }

    // The resolve might have completed already, in which case its entry is gone.
    if (const auto it = resolves_.find(key); it != resolves_.end()) {
        it->second = std::move(resolve);
    }
}

void mdk::dnssd::DiscoverySession::on_lost(const ServiceCandidate& candidate) {
    if (terminated_) {
        return;
    }
    // Results are a snapshot, a lost service stays in the results.
    MDK_TRACE("Lost {}", candidate.name);
}

void mdk::dnssd::DiscoverySession::on_browse_error(const std::string& error_message) {
    if (terminated_) {
        return;
    }
    MDK_WARNING("Browse error for {}: {}", options_.type.full_type(), error_message);
    if (!browse_error_) {
        browse_error_ = error_message;
    }
}

void mdk::dnssd::DiscoverySession::on_resolved(
    const ServiceCandidate& candidate, tl::expected<ResolvedService, std::string> result
) {
    if (terminated_) {
        MDK_TRACE("Discarding late resolve of {}", candidate.name);
        return;
    }

    const auto it = resolves_.find(candidate.key());
    if (it == resolves_.end()) {
        return;
    }

    // Keep the operation alive until this handler returns.
    const auto operation = std::move(it->second);
    resolves_.erase(it);

    MDK_ASSERT(pending_resolve_count_ > 0, "Pending resolve count must not be negative");
    if (pending_resolve_count_ > 0) {
        --pending_resolve_count_;
    }

    if (!result) {
        MDK_TRACE("Dropping {}: {}", candidate.name, result.error());
        seen_candidates_.erase(candidate.key());
    } else if (result->port == 0) {
        MDK_TRACE("Dropping {}: resolved without port", candidate.name);
        seen_candidates_.erase(candidate.key());
    } else {
        auto record = make_service_record(candidate, *result, options_.type, transport_.supports_txt_records());
        if (result_keys_.insert(record.dedup_key()).second) {
            MDK_TRACE("Resolved {}", record.description());
            results_.push_back(std::move(record));
        } else {
            MDK_TRACE("Discarding duplicate {}", record.description());
        }

        if (options_.target_name && instance_name_matches(candidate.name, *options_.target_name)) {
            finish(FinishReason::early_exit);
            return;
        }
    }

    arm_settle_timer_if_idle();
}

void mdk::dnssd::DiscoverySession::arm_settle_timer_if_idle() {
    if (terminated_ || pending_resolve_count_ > 0) {
        return;
    }
    settle_timer_.once(options_.settle_window, [this] {
        finish(FinishReason::settled);
    });
}

void mdk::dnssd::DiscoverySession::finish(const FinishReason reason) {
    if (terminated_) {
        return;
    }

    terminated_ = true;
    state_ = State::finished;
    finish_reason_ = reason;

    timeout_timer_.stop();
    settle_timer_.stop();
    browse_.reset();
    resolves_.clear();

    DiscoveryResult result;
    result.error = browse_error_.has_value();
    result.error_message = browse_error_;
    result.services = std::move(results_);
    result.services_found = result.services.size();
    results_.clear();

    MDK_DEBUG(
        "Discovery for {} finished ({}) with {} service(s)", options_.type.full_type(), to_string(reason),
        result.services_found
    );

    auto handler = std::move(handler_);
    handler_ = nullptr;
    if (handler) {
        handler(std::move(result));
    }
}

const char* mdk::dnssd::to_string(const DiscoverySession::State state) {
    switch (state) {
        case DiscoverySession::State::idle:
            return "idle";
        case DiscoverySession::State::browsing:
            return "browsing";
        case DiscoverySession::State::finished:
            return "finished";
    }
    return "unknown";
}

const char* mdk::dnssd::to_string(const DiscoverySession::FinishReason reason) {
    switch (reason) {
        case DiscoverySession::FinishReason::none:
            return "none";
        case DiscoverySession::FinishReason::early_exit:
            return "early_exit";
        case DiscoverySession::FinishReason::settled:
            return "settled";
        case DiscoverySession::FinishReason::timeout:
            return "timeout";
        case DiscoverySession::FinishReason::cancelled:
            return "cancelled";
    }
    return "unknown";
}
