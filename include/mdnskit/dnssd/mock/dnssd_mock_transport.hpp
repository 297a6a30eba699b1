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

#include "mdnskit/dnssd/dnssd_transport.hpp"

#include <boost/asio/io_context.hpp>

#include <atomic>
#include <mutex>
#include <optional>
#include <vector>

namespace mdk::dnssd {

/**
 * A transport which simulates a network. Services are scripted with the mock_* functions, and every call made to the
 * transport is recorded. The mock_* and set_* functions are safe to call from any thread, their effect takes place on
 * the io_context.
 */
class MockTransport: public Transport {
  public:
    /**
     * Defines how publish() behaves.
     */
    struct PublishBehavior {
        /// Time after which the publish completes.
        std::chrono::milliseconds delay {};
        /// The name to report on success. The requested name is reported when empty.
        std::optional<std::string> final_name;
        /// When set, the publish completes with this error.
        std::optional<std::string> error;
        /// When set, publish() throws an mdk::Exception with this message.
        std::optional<std::string> throw_message;
        /// When true, the publish only completes through complete_publish().
        bool manual = false;
    };

    explicit MockTransport(boost::asio::io_context& io_context);
    ~MockTransport() override;

    /**
     * Adds a service to the simulated network. Browses for its type report it after `found_delay`, resolving it
     * completes with `resolve_result` after `resolve_delay`. Running browses for its type also report it.
     * @param candidate The service as reported by a browse.
     * @param resolve_result The outcome of resolving the service.
     * @param resolve_delay The time a resolve takes.
     * @param found_delay The time between starting a browse and the service being reported.
     */
    void mock_service(
        const ServiceCandidate& candidate, tl::expected<ResolvedService, std::string> resolve_result,
        std::chrono::milliseconds resolve_delay = {}, std::chrono::milliseconds found_delay = {}
    );

    /**
     * Reports given candidate to all running browses for its type, without adding it to the network. Resolving it
     * won't complete unless complete_resolve() is called.
     */
    void mock_discovering_service(const ServiceCandidate& candidate);

    /**
     * Reports given candidate as lost to all running browses for its type.
     */
    void mock_removing_service(const ServiceCandidate& candidate);

    /**
     * Reports an error to all running browses for given type.
     */
    void mock_browse_error(const std::string& reg_type, const std::string& error_message);

    /**
     * Makes the next browse() call throw with given message.
     */
    void mock_browse_failure(const std::string& error_message);

    /**
     * Completes all pending resolves for the candidate with given name.
     */
    void complete_resolve(const std::string& name, tl::expected<ResolvedService, std::string> result);

    /**
     * Sets how subsequent publish() calls behave.
     */
    void set_publish_behavior(PublishBehavior behavior);

    /**
     * Completes the pending publish, if any.
     */
    void complete_publish(tl::expected<std::string, std::string> result);

    /**
     * Sets the value returned by supports_txt_records().
     */
    void set_supports_txt_records(bool supported);

    /**
     * @return The calls made to this transport, in order. Entries look like "browse:_http._tcp.", "resolve:Printer",
     * "publish:My App" and "unpublish".
     */
    [[nodiscard]] std::vector<std::string> calls() const;

    /**
     * @return The number of browse operations which are still alive.
     */
    [[nodiscard]] size_t active_browse_count() const;

    /**
     * @return The number of resolve operations which are alive and not completed.
     */
    [[nodiscard]] size_t active_resolve_count() const;

    /**
     * @return The number of browse and resolve states the transport still keeps track of, alive or not.
     */
    [[nodiscard]] size_t tracked_operation_count() const;

    // Transport overrides
    std::unique_ptr<Operation> browse(const std::string& reg_type, BrowseHandlers handlers) override;
    std::unique_ptr<Operation>
    resolve(const ServiceCandidate& candidate, std::chrono::milliseconds timeout_hint, ResolveHandler handler) override;
    void publish(const Publication& publication, PublishHandler handler) override;
    void unpublish() override;
    [[nodiscard]] bool supports_txt_records() const override;

  private:
    struct BrowseState {
        std::string reg_type;
        BrowseHandlers handlers;
        std::atomic<bool> active {true};
    };

    struct ResolveState {
        ServiceCandidate candidate;
        ResolveHandler handler;
        std::atomic<bool> active {true};
    };

    struct MockedService {
        ServiceCandidate candidate;
        tl::expected<ResolvedService, std::string> resolve_result;
        std::chrono::milliseconds resolve_delay {};
        std::chrono::milliseconds found_delay {};
    };

    class BrowseOperation;
    class ResolveOperation;

    boost::asio::io_context& io_context_;
    mutable std::mutex mutex_;
    std::vector<std::string> calls_;
    std::vector<MockedService> services_;
    mutable std::vector<std::weak_ptr<BrowseState>> browses_;
    mutable std::vector<std::weak_ptr<ResolveState>> resolves_;
    std::optional<std::string> browse_failure_;
    PublishBehavior publish_behavior_;
    PublishHandler publish_handler_;
    uint64_t publish_generation_ = 0;
    std::atomic<bool> supports_txt_ {true};
    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);

    void record_call(std::string call);
    std::vector<std::shared_ptr<BrowseState>> browses_for(const std::string& reg_type);
    void emit_found(const std::shared_ptr<BrowseState>& browse, const ServiceCandidate& candidate, std::chrono::milliseconds delay);
    static void complete(const std::shared_ptr<ResolveState>& state, tl::expected<ResolvedService, std::string> result);
    void finish_publish(uint64_t generation, tl::expected<std::string, std::string> result);
};

}  // namespace mdk::dnssd
