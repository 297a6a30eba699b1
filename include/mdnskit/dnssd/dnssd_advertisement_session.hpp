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

#include "dnssd_error.hpp"
#include "dnssd_service_type.hpp"
#include "dnssd_transport.hpp"
#include "mdnskit/core/expected.hpp"

#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace mdk::dnssd {

/// The instance name used when none is given.
constexpr auto k_default_instance_name = "mdnskit";

/**
 * Owns the single advertisement of a node. Starting a new advertisement replaces the current one: the transport is
 * always asked to unpublish before it's asked to publish again.
 *
 * All functions must be called on the io_context thread of the transport.
 */
class AdvertisementSession {
  public:
    /// Receives the name the service was registered under, or an error.
    using StartHandler = std::function<void(tl::expected<std::string, Error> result)>;

    /**
     * @param transport The transport to publish with. Must outlive this instance.
     * @param default_instance_name The name to advertise under when no name is given.
     */
    explicit AdvertisementSession(Transport& transport, std::string default_instance_name = k_default_instance_name);
    ~AdvertisementSession();

    AdvertisementSession(const AdvertisementSession&) = delete;
    AdvertisementSession& operator=(const AdvertisementSession&) = delete;

    /**
     * Starts advertising a service, stopping the current advertisement first. A start which is still pending completes
     * with a cancelled error.
     * @param type The service type.
     * @param name The instance name. Surrounding whitespace is removed, when empty the default instance name is used.
     * @param domain The domain. When empty, local. is used.
     * @param port The port, must be within 1 and 65535. The transport is not contacted for an invalid port.
     * @param txt The TXT record, if any.
     * @param handler Called with the registered name or an error. Might be called before this function returns.
     */
    void start(
        const ServiceType& type, std::string_view name, std::string_view domain, int64_t port,
        const std::optional<TxtRecord>& txt, StartHandler handler
    );

    /**
     * Stops the advertisement. A start which is still pending completes with a cancelled error.
     * Succeeds when nothing is advertised.
     * @return An error if the transport failed to unpublish.
     */
    tl::expected<void, Error> stop();

    /**
     * @return The advertisement which is active, with the name it was registered under.
     */
    [[nodiscard]] const std::optional<Transport::Publication>& current_publication() const;

    /**
     * @return True if an advertisement is active.
     */
    [[nodiscard]] bool is_publishing() const;

    /**
     * @return True if a start is waiting for the transport.
     */
    [[nodiscard]] bool is_pending() const;

  private:
    Transport& transport_;
    std::string default_instance_name_;
    std::optional<Transport::Publication> current_;
    std::optional<Transport::Publication> pending_;
    StartHandler pending_handler_;
    bool registered_ = false;  // True while the transport holds a registration, pending or active.
    uint64_t generation_ = 0;

    void cancel_pending(const std::string& reason);
    tl::expected<void, Error> release();
    void on_published(uint64_t generation, tl::expected<std::string, std::string> result);
};

}  // namespace mdk::dnssd
