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

#include "bonjour.hpp"

#if MDK_HAS_DNSSD

    #include "bonjour_scoped_dns_service_ref.hpp"
    #include "bonjour_shared_connection.hpp"
    #include "mdnskit/dnssd/dnssd_transport.hpp"

    #include <boost/asio/ip/tcp.hpp>

namespace mdk::dnssd {

/**
 * Transport on top of the dns_sd.h API (Apple Bonjour on macOS and Windows, or a compatibility library on Linux).
 * All operations share one connection to the responder. Its socket is watched on the io_context, so every dns_sd
 * callback runs on the thread(s) running the io_context. It is assumed that the io_context is run by a single thread.
 */
class BonjourTransport: public Transport {
  public:
    /**
     * @param io_context The context to use for processing the results of the responder.
     * @throws mdk::Exception if the responder could not be reached.
     */
    explicit BonjourTransport(boost::asio::io_context& io_context);
    ~BonjourTransport() override;

    std::unique_ptr<Operation> browse(const std::string& reg_type, BrowseHandlers handlers) override;
    std::unique_ptr<Operation>
    resolve(const ServiceCandidate& candidate, std::chrono::milliseconds timeout_hint, ResolveHandler handler) override;
    void publish(const Publication& publication, PublishHandler handler) override;
    void unpublish() override;
    [[nodiscard]] bool supports_txt_records() const override;

  private:
    class BrowseOperation;
    class ResolveOperation;

    boost::asio::io_context& io_context_;
    BonjourSharedConnection shared_connection_;
    boost::asio::ip::tcp::socket service_socket_;
    BonjourScopedDnsServiceRef registration_;
    PublishHandler publish_handler_;
    uint64_t publish_generation_ = 0;
    size_t process_results_failed_attempts_ = 0;
    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);

    void async_process_results();

    static void DNSSD_API register_reply(
        DNSServiceRef service_ref, DNSServiceFlags flags, DNSServiceErrorType error_code, const char* service_name,
        const char* reg_type, const char* reply_domain, void* context
    );
};

}  // namespace mdk::dnssd

#endif
