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

#include "dnssd_results.hpp"
#include "dnssd_service_type.hpp"
#include "dnssd_transport.hpp"
#include "mdnskit/core/net/timer/asio_timer.hpp"

#include <boost/asio/io_context.hpp>

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace mdk::dnssd {

/**
 * Builds the record for a resolved candidate: hosts are reduced to unique numeric addresses, the domain is dot
 * terminated, and the TXT record is only kept when the transport supports TXT records and it's not empty.
 * @param candidate The candidate as reported by the browse.
 * @param resolved The resolve result.
 * @param type The type of the discovery, used as the record type.
 * @param txt_supported Whether the transport supports TXT records.
 * @return The record.
 */
ServiceRecord make_service_record(
    const ServiceCandidate& candidate, const ResolvedService& resolved, const ServiceType& type, bool txt_supported
);

/**
 * Drives a single discovery: browses for a service type, resolves the candidates and collects the results until one of
 * the following happens, whichever comes first:
 *  - A target name is set and a candidate matching it resolved (early exit).
 *  - No new candidates were found and no resolves were in flight during the settle window.
 *  - The timeout elapsed.
 *  - cancel() was called.
 *
 * The completion handler is called exactly once, after which all transport operations are released. Results are
 * deduplicated by ServiceRecord::dedup_key(), the first resolved record wins.
 *
 * All functions must be called on the io_context thread, which is also where the completion handler is called.
 */
class DiscoverySession {
  public:
    enum class State { idle, browsing, finished };

    enum class FinishReason { none, early_exit, settled, timeout, cancelled };

    struct Options {
        ServiceType type;
        /// When set, only matching candidates are resolved and a match finishes the session.
        std::optional<std::string> target_name;
        std::chrono::milliseconds timeout {3000};
        std::chrono::milliseconds settle_window {350};
        std::chrono::milliseconds resolve_timeout {5000};
    };

    using CompletionHandler = std::function<void(DiscoveryResult result)>;

    DiscoverySession(
        boost::asio::io_context& io_context, Transport& transport, Options options, CompletionHandler handler
    );
    ~DiscoverySession();

    DiscoverySession(const DiscoverySession&) = delete;
    DiscoverySession& operator=(const DiscoverySession&) = delete;

    /**
     * Starts browsing and arms the timeout. A browse which fails to start does not fail the session, the error is
     * reported in the result when the timeout elapses.
     */
    void start();

    /**
     * Finishes the session with the results collected so far. Does nothing if already finished.
     */
    void cancel();

    [[nodiscard]] State state() const;
    [[nodiscard]] FinishReason finish_reason() const;
    [[nodiscard]] bool is_terminated() const;
    [[nodiscard]] size_t pending_resolve_count() const;
    [[nodiscard]] const Options& options() const;

  private:
    Transport& transport_;
    Options options_;
    CompletionHandler handler_;
    AsioTimer timeout_timer_;
    AsioTimer settle_timer_;
    State state_ {State::idle};
    FinishReason finish_reason_ {FinishReason::none};
    bool terminated_ {false};
    size_t pending_resolve_count_ {};
    std::optional<std::string> browse_error_;
    std::unique_ptr<Transport::Operation> browse_;
    std::map<std::string, std::unique_ptr<Transport::Operation>> resolves_;  // candidate key -> resolve
    std::set<std::string> seen_candidates_;
    std::set<std::string> result_keys_;
    std::vector<ServiceRecord> results_;

    void on_found(const ServiceCandidate& candidate);
    void on_lost(const ServiceCandidate& candidate);
    void on_browse_error(const std::string& error_message);
    void on_resolved(const ServiceCandidate& candidate, tl::expected<ResolvedService, std::string> result);
    void arm_settle_timer_if_idle();
    void finish(FinishReason reason);
};

const char* to_string(DiscoverySession::State state);
const char* to_string(DiscoverySession::FinishReason reason);

}  // namespace mdk::dnssd
