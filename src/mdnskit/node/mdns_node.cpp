/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "mdnskit/node/mdns_node.hpp"

#include "mdnskit/core/assert.hpp"
#include "mdnskit/core/exception.hpp"
#include "mdnskit/core/log.hpp"
#include "mdnskit/core/platform.hpp"
#include "mdnskit/core/string.hpp"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/use_future.hpp>

#include <algorithm>

#if MDK_APPLE
    #include <pthread.h>
#endif

namespace {

constexpr auto k_shut_down_message = "Node is shut down";
constexpr auto k_no_transport_message = "No DNS-SD transport available";

template<class Result>
Result make_error_result(std::string message) {
    Result result;
    result.error = true;
    result.error_message = std::move(message);
    return result;
}

}  // namespace

mdk::MdnsNode::MdnsNode(Configuration configuration, const TransportFactory& transport_factory) :
    configuration_(std::move(configuration)), work_guard_(boost::asio::make_work_guard(io_context_)) {
    transport_ = transport_factory ? transport_factory(io_context_) : dnssd::Transport::create(io_context_);

    if (transport_) {
        advertisement_ =
            std::make_unique<dnssd::AdvertisementSession>(*transport_, configuration_.default_instance_name);
    } else {
        MDK_WARNING("{}, discovery and broadcast will fail", k_no_transport_message);
    }

    std::promise<std::thread::id> promise;
    auto f = promise.get_future();
    maintenance_thread_ = std::thread([this, p = std::move(promise)]() mutable {
        p.set_value(std::this_thread::get_id());
#if MDK_APPLE
        pthread_setname_np("mdns_node_maintenance");
#endif

        while (true) {
            try {
                while (!io_context_.stopped()) {
                    io_context_.run_for(std::chrono::seconds(1));
                }
                break;
            } catch (const std::exception& e) {
                MDK_ERROR("Unhandled exception on maintenance thread: {}", e.what());
                MDK_ASSERT_FALSE("Unhandled exception on maintenance thread");
            }
        }
    });
    maintenance_thread_id_ = f.get();
}

mdk::MdnsNode::~MdnsNode() {
    shutdown();
}

std::future<mdk::dnssd::DiscoveryResult> mdk::MdnsNode::discover(dnssd::DiscoveryRequest request) {
    auto promise = std::make_shared<std::promise<dnssd::DiscoveryResult>>();
    auto future = promise->get_future();

    std::lock_guard lock(shutdown_mutex_);
    if (shut_down_) {
        promise->set_value(make_error_result<dnssd::DiscoveryResult>(k_shut_down_message));
        return future;
    }

    boost::asio::post(io_context_, [this, promise, r = std::move(request)] {
        start_discovery(r, promise);
    });
    return future;
}

std::future<mdk::dnssd::BroadcastResult> mdk::MdnsNode::start_broadcast(dnssd::BroadcastRequest request) {
    auto promise = std::make_shared<std::promise<dnssd::BroadcastResult>>();
    auto future = promise->get_future();

    std::lock_guard lock(shutdown_mutex_);
    if (shut_down_) {
        promise->set_value(make_error_result<dnssd::BroadcastResult>(k_shut_down_message));
        return future;
    }

    boost::asio::post(io_context_, [this, promise, r = std::move(request)] {
        if (shut_down_) {
            promise->set_value(make_error_result<dnssd::BroadcastResult>(k_shut_down_message));
            return;
        }

        if (!advertisement_) {
            promise->set_value(make_error_result<dnssd::BroadcastResult>(k_no_transport_message));
            return;
        }

        const auto type = dnssd::parse_service_type(
            r.type.value_or(""), configuration_.type_parse_policy, configuration_.default_service_type
        );
        if (!type) {
            promise->set_value(make_error_result<dnssd::BroadcastResult>(type.error().message));
            return;
        }

        advertisement_->start(
            *type, r.name.value_or(""), r.domain.value_or(configuration_.default_domain), r.port, r.txt,
            [promise](tl::expected<std::string, dnssd::Error> result) {
                if (!result) {
                    promise->set_value(make_error_result<dnssd::BroadcastResult>(result.error().message));
                    return;
                }
                dnssd::BroadcastResult broadcast_result;
                broadcast_result.name = std::move(*result);
                broadcast_result.publishing = true;
                promise->set_value(std::move(broadcast_result));
            }
        );
    });
    return future;
}

std::future<mdk::dnssd::StopBroadcastResult> mdk::MdnsNode::stop_broadcast() {
    std::lock_guard lock(shutdown_mutex_);
    if (shut_down_) {
        std::promise<dnssd::StopBroadcastResult> promise;
        promise.set_value(make_error_result<dnssd::StopBroadcastResult>(k_shut_down_message));
        return promise.get_future();
    }

    auto work = [this]() -> dnssd::StopBroadcastResult {
        if (!advertisement_) {
            return {};
        }
        if (const auto result = advertisement_->stop(); !result) {
            auto stop_result = make_error_result<dnssd::StopBroadcastResult>(result.error().message);
            stop_result.publishing = advertisement_->is_publishing();
            return stop_result;
        }
        return {};
    };
    return boost::asio::dispatch(io_context_, boost::asio::use_future(work));
}

void mdk::MdnsNode::shutdown() {
    MDK_ASSERT_RETURN(
        std::this_thread::get_id() != maintenance_thread_id_, "shutdown() must not be called from the maintenance thread"
    );

    {
        std::lock_guard lock(shutdown_mutex_);
        if (shut_down_.exchange(true)) {
            return;
        }
    }

    MDK_DEBUG("Shutting down node");

    auto work = [this] {
        for (auto& session : discovery_sessions_) {
            session->cancel();
        }
        if (advertisement_) {
            if (const auto result = advertisement_->stop(); !result) {
                MDK_ERROR("Failed to stop advertisement: {}", result.error().message);
            }
        }
    };

    if (maintenance_thread_.joinable()) {
        boost::asio::dispatch(io_context_, boost::asio::use_future(work)).wait();
    }

    work_guard_.reset();
    io_context_.stop();
    if (maintenance_thread_.joinable()) {
        maintenance_thread_.join();
    }

    // Run the work which was queued before the flag was set, so that all futures get a value.
    io_context_.restart();
    try {
        io_context_.poll();
    } catch (const std::exception& e) {
        MDK_ERROR("Exception while shutting down: {}", e.what());
    }

    discovery_sessions_.clear();
    advertisement_.reset();
    transport_.reset();
}

const mdk::MdnsNode::Configuration& mdk::MdnsNode::get_configuration() const {
    return configuration_;
}

bool mdk::MdnsNode::has_transport() const {
    return transport_ != nullptr;
}

void mdk::MdnsNode::start_discovery(
    const dnssd::DiscoveryRequest& request, const std::shared_ptr<std::promise<dnssd::DiscoveryResult>>& promise
) {
    if (shut_down_) {
        promise->set_value(make_error_result<dnssd::DiscoveryResult>(k_shut_down_message));
        return;
    }

    if (!transport_) {
        promise->set_value(make_error_result<dnssd::DiscoveryResult>(k_no_transport_message));
        return;
    }

    auto type = dnssd::parse_service_type(
        request.type.value_or(""), configuration_.type_parse_policy, configuration_.default_service_type
    );
    if (!type) {
        promise->set_value(make_error_result<dnssd::DiscoveryResult>(type.error().message));
        return;
    }

    dnssd::DiscoverySession::Options options;
    options.type = std::move(*type);
    if (request.name) {
        if (const auto name = string_trim(*request.name); !name.empty()) {
            options.target_name = std::string(name);
        }
    }
    options.timeout = request.timeout_ms ? std::chrono::milliseconds(std::max<int64_t>(*request.timeout_ms, 0))
                                         : configuration_.default_timeout;
    options.settle_window = configuration_.settle_window;
    options.resolve_timeout = configuration_.resolve_timeout;

    auto session = std::make_unique<dnssd::DiscoverySession>(
        io_context_, *transport_, std::move(options),
        [this, promise](dnssd::DiscoveryResult result) {
            promise->set_value(std::move(result));
            // Not removed right away, the session is still on the stack.
            boost::asio::post(io_context_, [this] {
                remove_finished_discovery_sessions();
            });
        }
    );

    auto* session_ptr = session.get();
    discovery_sessions_.push_back(std::move(session));
    session_ptr->start();
}

void mdk::MdnsNode::remove_finished_discovery_sessions() {
    discovery_sessions_.erase(
        std::remove_if(
            discovery_sessions_.begin(), discovery_sessions_.end(),
            [](const std::unique_ptr<dnssd::DiscoverySession>& session) {
                return session->is_terminated();
            }
        ),
        discovery_sessions_.end()
    );
}

void mdk::tag_invoke(const boost::json::value_from_tag&, boost::json::value& jv, const MdnsNode::Configuration& config) {
    jv = {
        {"default_service_type", config.default_service_type},
        {"default_instance_name", config.default_instance_name},
        {"default_domain", config.default_domain},
        {"default_timeout", config.default_timeout.count()},
        {"settle_window", config.settle_window.count()},
        {"resolve_timeout", config.resolve_timeout.count()},
        {"type_parse_policy", dnssd::to_string(config.type_parse_policy)},
    };
}

mdk::MdnsNode::Configuration
mdk::tag_invoke(const boost::json::value_to_tag<MdnsNode::Configuration>&, const boost::json::value& jv) {
    const auto& obj = jv.as_object();
    MdnsNode::Configuration config;

    if (const auto* v = obj.if_contains("default_service_type")) {
        config.default_service_type = v->as_string();
    }
    if (const auto* v = obj.if_contains("default_instance_name")) {
        config.default_instance_name = v->as_string();
    }
    if (const auto* v = obj.if_contains("default_domain")) {
        config.default_domain = v->as_string();
    }
    if (const auto* v = obj.if_contains("default_timeout")) {
        config.default_timeout = std::chrono::milliseconds(v->to_number<int64_t>());
    }
    if (const auto* v = obj.if_contains("settle_window")) {
        config.settle_window = std::chrono::milliseconds(v->to_number<int64_t>());
    }
    if (const auto* v = obj.if_contains("resolve_timeout")) {
        config.resolve_timeout = std::chrono::milliseconds(v->to_number<int64_t>());
    }
    if (const auto* v = obj.if_contains("type_parse_policy")) {
        const auto& policy = v->as_string();
        if (policy == "lenient") {
            config.type_parse_policy = dnssd::TypeParsePolicy::lenient;
        } else if (policy == "strict") {
            config.type_parse_policy = dnssd::TypeParsePolicy::strict;
        } else {
            MDK_THROW_EXCEPTION("Invalid type_parse_policy: {}", std::string_view(policy));
        }
    }

    return config;
}
