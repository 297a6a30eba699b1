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

#include "mdnskit/core/json.hpp"
#include "mdnskit/dnssd/dnssd_advertisement_session.hpp"
#include "mdnskit/dnssd/dnssd_discovery_session.hpp"
#include "mdnskit/dnssd/dnssd_results.hpp"
#include "mdnskit/dnssd/dnssd_service_type.hpp"
#include "mdnskit/dnssd/dnssd_transport.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace mdk {

/**
 * Entry point of the library. A node advertises at most one service and runs any number of discoveries at the same
 * time. It owns an io_context which is run by a maintenance thread, all sessions and transport callbacks run there.
 * The public functions can be called from any thread (except the maintenance thread for shutdown()) and report their
 * outcome through a future, which never throws.
 */
class MdnsNode {
  public:
    /**
     * Holds the configuration of the node.
     */
    struct Configuration {
        /// The service type used when a request doesn't specify one.
        std::string default_service_type {dnssd::k_default_service_type};
        /// The instance name advertised when a broadcast request doesn't specify one.
        std::string default_instance_name {dnssd::k_default_instance_name};
        /// The domain advertised in when a broadcast request doesn't specify one.
        std::string default_domain {dnssd::k_default_domain};
        /// The time budget of a discovery when a request doesn't specify one.
        std::chrono::milliseconds default_timeout {3000};
        /// The time without activity after which a discovery is considered complete.
        std::chrono::milliseconds settle_window {350};
        /// The time after which a transport should give up resolving a single service.
        std::chrono::milliseconds resolve_timeout {5000};
        /// How to treat service types which can't be parsed.
        dnssd::TypeParsePolicy type_parse_policy {dnssd::TypeParsePolicy::lenient};
    };

    /// Creates the transport for a node. Receives the io_context of the node.
    using TransportFactory = std::function<std::unique_ptr<dnssd::Transport>(boost::asio::io_context& io_context)>;

    /**
     * @param configuration The configuration of the node.
     * @param transport_factory Creates the transport. When empty, dnssd::Transport::create is used.
     */
    explicit MdnsNode(Configuration configuration = {}, const TransportFactory& transport_factory = {});
    ~MdnsNode();

    MdnsNode(const MdnsNode&) = delete;
    MdnsNode& operator=(const MdnsNode&) = delete;

    /**
     * Discovers services on the network.
     * @param request The parameters of the discovery.
     * @return A future which is set when the discovery finished.
     */
    [[nodiscard]] std::future<dnssd::DiscoveryResult> discover(dnssd::DiscoveryRequest request);

    /**
     * Starts advertising a service, replacing the current advertisement.
     * @param request The parameters of the advertisement.
     * @return A future which is set when the service was registered or failed to register.
     */
    [[nodiscard]] std::future<dnssd::BroadcastResult> start_broadcast(dnssd::BroadcastRequest request);

    /**
     * Stops the current advertisement.
     * @return A future which is set when the advertisement stopped.
     */
    [[nodiscard]] std::future<dnssd::StopBroadcastResult> stop_broadcast();

    /**
     * Finishes all running discoveries with their results so far, stops the advertisement and stops the maintenance
     * thread. Later calls complete with an error. Blocks until done, does nothing when called again.
     */
    void shutdown();

    /**
     * @return The configuration of the node.
     */
    [[nodiscard]] const Configuration& get_configuration() const;

    /**
     * @return True if the node has a transport to work with.
     */
    [[nodiscard]] bool has_transport() const;

  private:
    const Configuration configuration_;
    boost::asio::io_context io_context_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
    std::unique_ptr<dnssd::Transport> transport_;
    std::unique_ptr<dnssd::AdvertisementSession> advertisement_;
    std::vector<std::unique_ptr<dnssd::DiscoverySession>> discovery_sessions_;
    std::thread maintenance_thread_;
    std::thread::id maintenance_thread_id_;
    std::mutex shutdown_mutex_;
    std::atomic<bool> shut_down_ {false};

    void start_discovery(
        const dnssd::DiscoveryRequest& request, const std::shared_ptr<std::promise<dnssd::DiscoveryResult>>& promise
    );
    void remove_finished_discovery_sessions();
};

void tag_invoke(const boost::json::value_from_tag&, boost::json::value& jv, const MdnsNode::Configuration& config);

MdnsNode::Configuration
tag_invoke(const boost::json::value_to_tag<MdnsNode::Configuration>&, const boost::json::value& jv);

}  // namespace mdk
