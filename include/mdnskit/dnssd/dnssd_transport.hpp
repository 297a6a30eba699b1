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

#include "dnssd_service_record.hpp"
#include "mdnskit/core/expected.hpp"

#include <boost/asio/io_context.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace mdk::dnssd {

/**
 * A service instance reported by a browse, not yet resolved.
 */
struct ServiceCandidate {
    /// The instance name.
    std::string name;
    /// The service type as reported by the transport (i.e. _http._tcp.).
    std::string type;
    /// The domain as reported by the transport (i.e. local.).
    std::string domain;
    /// The interface the candidate was reported on. 0 means any.
    uint32_t interface_index {};

    /**
     * @return A key which identifies the candidate independent of the interface it was reported on.
     */
    [[nodiscard]] std::string key() const {
        return name + "|" + type + "|" + domain;
    }
};

/**
 * The connection details of a resolved candidate.
 */
struct ResolvedService {
    uint16_t port {};
    std::vector<std::string> hosts;
    std::optional<TxtRecord> txt;
};

/**
 * Interface to the layer which does the actual mDNS work. All handlers are called on the io_context the transport was
 * created with.
 */
class Transport {
  public:
    /**
     * A running browse or resolve. Destroying the operation stops it, after which none of its handlers will be called.
     */
    class Operation {
      public:
        virtual ~Operation() = default;
    };

    struct BrowseHandlers {
        std::function<void(const ServiceCandidate& candidate)> on_found;
        std::function<void(const ServiceCandidate& candidate)> on_lost;
        std::function<void(const std::string& error_message)> on_error;
    };

    /**
     * A service to advertise.
     */
    struct Publication {
        std::string name;
        /// The full service type (i.e. _http._tcp.).
        std::string type;
        std::string domain;
        uint16_t port {};
        TxtRecord txt;
    };

    /// Receives the resolved service or an error message. Called at most once.
    using ResolveHandler = std::function<void(tl::expected<ResolvedService, std::string> result)>;

    /// Receives the name the service was registered under or an error message. Called at most once.
    using PublishHandler = std::function<void(tl::expected<std::string, std::string> result)>;

    virtual ~Transport() = default;

    /**
     * Starts browsing for services of given type.
     * @param reg_type The full service type (i.e. _http._tcp.).
     * @param handlers The handlers to call for browse events.
     * @return The browse operation.
     * @throws mdk::Exception when the browse could not be started.
     */
    virtual std::unique_ptr<Operation> browse(const std::string& reg_type, BrowseHandlers handlers) = 0;

    /**
     * Resolves a candidate into port, addresses and TXT record.
     * @param candidate The candidate to resolve.
     * @param timeout_hint The time after which the transport should give up and report an error.
     * @param handler The handler to call with the result.
     * @return The resolve operation.
     * @throws mdk::Exception when the resolve could not be started.
     */
    virtual std::unique_ptr<Operation>
    resolve(const ServiceCandidate& candidate, std::chrono::milliseconds timeout_hint, ResolveHandler handler) = 0;

    /**
     * Registers a service. The transport holds at most one registration, call unpublish() first.
     * The name passed to the handler might differ from the requested name if the transport renamed the service to
     * resolve a conflict. This name is authoritative.
     * @param publication The service to register.
     * @param handler The handler to call with the result.
     * @throws mdk::Exception when the registration could not be started.
     */
    virtual void publish(const Publication& publication, PublishHandler handler) = 0;

    /**
     * Removes the registration, if any. A pending publish handler will not be called anymore. Idempotent.
     */
    virtual void unpublish() = 0;

    /**
     * @return True if resolved services carry TXT records.
     */
    [[nodiscard]] virtual bool supports_txt_records() const = 0;

    /**
     * Creates the most appropriate transport implementation for the platform.
     * @param io_context The context to call handlers on.
     * @return The created transport, or nullptr if no implementation is available.
     */
    static std::unique_ptr<Transport> create(boost::asio::io_context& io_context);
};

}  // namespace mdk::dnssd
