/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "mdnskit/dnssd/bonjour/bonjour_transport.hpp"

#if MDK_HAS_DNSSD

    #include "mdnskit/core/assert.hpp"
    #include "mdnskit/core/log.hpp"
    #include "mdnskit/core/net/timer/asio_timer.hpp"
    #include "mdnskit/dnssd/bonjour/bonjour_txt_record.hpp"

    #include <boost/asio/post.hpp>

namespace {

std::string address_to_string(const sockaddr* address) {
    char ip_addr[INET6_ADDRSTRLEN] = {};
    const void* ip_addr_data = nullptr;

    if (address->sa_family == AF_INET) {
        ip_addr_data = &reinterpret_cast<const sockaddr_in*>(address)->sin_addr;
    } else if (address->sa_family == AF_INET6) {
        ip_addr_data = &reinterpret_cast<const sockaddr_in6*>(address)->sin6_addr;
    } else {
        return {};
    }

    // Winsock version requires the const cast.
    if (inet_ntop(address->sa_family, const_cast<void*>(ip_addr_data), ip_addr, INET6_ADDRSTRLEN) == nullptr) {
        return {};
    }
    return ip_addr;
}

}  // namespace

class mdk::dnssd::BonjourTransport::BrowseOperation: public Operation {
  public:
    BrowseOperation(boost::asio::io_context& io_context, BrowseHandlers handlers) :
        io_context_(io_context), handlers_(std::move(handlers)) {}

    ~BrowseOperation() override {
        service_ref_.reset();
    }

    void start(DNSServiceRef shared_connection, const std::string& reg_type) {
        DNSServiceRef browse_ref = shared_connection;
        DNSSD_THROW_IF_ERROR(
            DNSServiceBrowse(
                &browse_ref, kDNSServiceFlagsShareConnection, kDNSServiceInterfaceIndexAny, reg_type.c_str(), nullptr,
                browse_reply, this
            ),
            "Browse error"
        );
        service_ref_ = browse_ref;
    }

  private:
    boost::asio::io_context& io_context_;
    BrowseHandlers handlers_;
    BonjourScopedDnsServiceRef service_ref_;
    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);

    // Handlers are invoked through the io_context, so that they are free to destroy this operation.
    template<class Fn>
    void post(Fn&& fn) {
        boost::asio::post(io_context_, [alive = std::weak_ptr<bool>(alive_), fn = std::forward<Fn>(fn)] {
            if (alive.expired()) {
                return;
            }
            fn();
        });
    }

    static void DNSSD_API browse_reply(
        [[maybe_unused]] DNSServiceRef browse_service_ref, const DNSServiceFlags flags, const uint32_t interface_index,
        const DNSServiceErrorType error_code, const char* name, const char* type, const char* domain, void* context
    ) {
        auto* op = static_cast<BrowseOperation*>(context);

        if (error_code != kDNSServiceErr_NoError) {
            op->post([op, msg = fmt::format("Browse reply error: {}", dns_service_error_to_string(error_code))] {
                if (op->handlers_.on_error) {
                    op->handlers_.on_error(msg);
                }
            });
            return;
        }

        MDK_TRACE("browse_reply name={} type={} domain={} interface_index={}", name, type, domain, interface_index);

        ServiceCandidate candidate {name, type, domain, interface_index};
        if (flags & kDNSServiceFlagsAdd) {
            op->post([op, candidate = std::move(candidate)] {
                if (op->handlers_.on_found) {
                    op->handlers_.on_found(candidate);
                }
            });
        } else {
            op->post([op, candidate = std::move(candidate)] {
                if (op->handlers_.on_lost) {
                    op->handlers_.on_lost(candidate);
                }
            });
        }
    }
};

/**
 * Resolves a service into host target, port and TXT record, then looks up the addresses of the host target.
 */
class mdk::dnssd::BonjourTransport::ResolveOperation: public Operation {
  public:
    ResolveOperation(boost::asio::io_context& io_context, ResolveHandler handler) :
        io_context_(io_context), timer_(io_context), handler_(std::move(handler)) {}

    ~ResolveOperation() override {
        timer_.stop();
        get_addr_ref_.reset();
        resolve_ref_.reset();
    }

    void start(
        DNSServiceRef shared_connection, const ServiceCandidate& candidate, const std::chrono::milliseconds timeout
    ) {
        shared_connection_ = shared_connection;

        DNSServiceRef resolve_ref = shared_connection;
        DNSSD_THROW_IF_ERROR(
            DNSServiceResolve(
                &resolve_ref, kDNSServiceFlagsShareConnection, candidate.interface_index, candidate.name.c_str(),
                candidate.type.c_str(), candidate.domain.c_str(), resolve_reply, this
            ),
            "Resolve error"
        );
        resolve_ref_ = resolve_ref;

        timer_.once(timeout, [this] {
            if (resolved_) {
                // Port is known, report the addresses found so far.
                complete(result_);
            } else {
                complete(tl::unexpected(std::string("Resolve timed out")));
            }
        });
    }

  private:
    boost::asio::io_context& io_context_;
    AsioTimer timer_;
    ResolveHandler handler_;
    DNSServiceRef shared_connection_ = nullptr;
    BonjourScopedDnsServiceRef resolve_ref_;
    BonjourScopedDnsServiceRef get_addr_ref_;
    ResolvedService result_;
    bool resolved_ = false;
    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);

    void complete(tl::expected<ResolvedService, std::string> result) {
        if (!handler_) {
            return;
        }
        timer_.stop();
        auto handler = std::move(handler_);
        handler_ = nullptr;
        boost::asio::post(
            io_context_,
            [alive = std::weak_ptr<bool>(alive_), handler = std::move(handler), result = std::move(result)]() mutable {
                if (alive.expired()) {
                    return;
                }
                handler(std::move(result));
            }
        );
    }

    static void DNSSD_API resolve_reply(
        [[maybe_unused]] DNSServiceRef service_ref, [[maybe_unused]] DNSServiceFlags flags,
        const uint32_t interface_index, const DNSServiceErrorType error_code, [[maybe_unused]] const char* fullname,
        const char* host_target, const uint16_t port, const uint16_t txt_len, const unsigned char* txt_record,
        void* context
    ) {
        auto* op = static_cast<ResolveOperation*>(context);

        if (error_code != kDNSServiceErr_NoError) {
            op->complete(tl::unexpected(fmt::format("Resolve error: {}", dns_service_error_to_string(error_code))));
            return;
        }

        if (op->resolved_) {
            return;
        }

        op->resolved_ = true;
        op->result_.port = ntohs(port);
        op->result_.txt = BonjourTxtRecord::get_txt_record_from_raw_bytes(txt_record, txt_len);

        MDK_TRACE("resolve_reply host_target={} port={} interface_index={}", host_target, op->result_.port, interface_index);

        DNSServiceRef get_addr_ref = op->shared_connection_;
        const auto result = DNSServiceGetAddrInfo(
            &get_addr_ref, kDNSServiceFlagsShareConnection | kDNSServiceFlagsTimeout, interface_index,
            kDNSServiceProtocol_IPv4 | kDNSServiceProtocol_IPv6, host_target, get_addr_info_reply, op
        );

        if (result != kDNSServiceErr_NoError) {
            MDK_WARNING("Get addr info error: {}", dns_service_error_to_string(result));
            op->complete(op->result_);
            return;
        }

        op->get_addr_ref_ = get_addr_ref;
    }

    static void DNSSD_API get_addr_info_reply(
        [[maybe_unused]] DNSServiceRef sd_ref, const DNSServiceFlags flags, [[maybe_unused]] uint32_t interface_index,
        const DNSServiceErrorType error_code, [[maybe_unused]] const char* hostname, const struct sockaddr* address,
        [[maybe_unused]] uint32_t ttl, void* context
    ) {
        auto* op = static_cast<ResolveOperation*>(context);

        if (error_code == kDNSServiceErr_Timeout) {
            op->complete(op->result_);
            return;
        }

        if (error_code != kDNSServiceErr_NoError) {
            if (op->result_.hosts.empty()) {
                op->complete(tl::unexpected(fmt::format("Get addr info error: {}", dns_service_error_to_string(error_code))));
            } else {
                op->complete(op->result_);
            }
            return;
        }

        if (flags & kDNSServiceFlagsAdd) {
            auto text = address_to_string(address);
            if (!text.empty()) {
                op->result_.hosts.push_back(std::move(text));
            }
        }

        if (!(flags & kDNSServiceFlagsMoreComing) && !op->result_.hosts.empty()) {
            op->complete(op->result_);
        }
    }
};

mdk::dnssd::BonjourTransport::BonjourTransport(boost::asio::io_context& io_context) :
    io_context_(io_context), service_socket_(io_context) {
    const int service_fd = DNSServiceRefSockFD(shared_connection_.service_ref());

    if (service_fd < 0) {
        MDK_THROW_EXCEPTION("Invalid file descriptor");
    }

    service_socket_.assign(boost::asio::ip::tcp::v6(), service_fd);
    async_process_results();
}

mdk::dnssd::BonjourTransport::~BonjourTransport() {
    unpublish();

    // The descriptor belongs to the shared connection, which closes it.
    boost::system::error_code ec;
    service_socket_.release(ec);
    if (ec) {
        MDK_ERROR("Failed to release service socket: {}", ec.message());
    }
    shared_connection_.reset();
}

std::unique_ptr<mdk::dnssd::Transport::Operation>
mdk::dnssd::BonjourTransport::browse(const std::string& reg_type, BrowseHandlers handlers) {
    auto op = std::make_unique<BrowseOperation>(io_context_, std::move(handlers));
    op->start(shared_connection_.service_ref(), reg_type);
    return op;
}

std::unique_ptr<mdk::dnssd::Transport::Operation> mdk::dnssd::BonjourTransport::resolve(
    const ServiceCandidate& candidate, const std::chrono::milliseconds timeout_hint, ResolveHandler handler
) {
    auto op = std::make_unique<ResolveOperation>(io_context_, std::move(handler));
    op->start(shared_connection_.service_ref(), candidate, timeout_hint);
    return op;
}

void mdk::dnssd::BonjourTransport::publish(const Publication& publication, PublishHandler handler) {
    MDK_ASSERT(!publication.type.empty(), "Service type must not be empty");
    MDK_ASSERT(publication.port != 0, "Port must not be 0");

    unpublish();

    const BonjourTxtRecord record(publication.txt);

    DNSServiceRef service_ref = shared_connection_.service_ref();
    const auto result = DNSServiceRegister(
        &service_ref, kDNSServiceFlagsShareConnection, kDNSServiceInterfaceIndexAny,
        publication.name.empty() ? nullptr : publication.name.c_str(), publication.type.c_str(),
        publication.domain.empty() ? nullptr : publication.domain.c_str(), nullptr, htons(publication.port),
        record.length(), record.bytes_ptr(), register_reply, this
    );

    DNSSD_THROW_IF_ERROR(result, "Failed to register service");

    registration_ = service_ref;
    publish_handler_ = std::move(handler);
}

void mdk::dnssd::BonjourTransport::unpublish() {
    ++publish_generation_;
    publish_handler_ = nullptr;
    registration_.reset();
}

bool mdk::dnssd::BonjourTransport::supports_txt_records() const {
    return true;
}

void mdk::dnssd::BonjourTransport::async_process_results() {
    service_socket_.async_wait(boost::asio::ip::tcp::socket::wait_read, [this](const boost::system::error_code& ec) {
        if (ec) {
            if (ec != boost::asio::error::operation_aborted) {
                MDK_ERROR("Error in async_wait_for_results: {}", ec.message());
            }
            return;
        }

        const auto result = DNSServiceProcessResult(shared_connection_.service_ref());

        if (result != kDNSServiceErr_NoError) {
            MDK_ERROR("DNSServiceError: {}", dns_service_error_to_string(result));
            if (++process_results_failed_attempts_ > 10) {
                MDK_ERROR("Too many failed attempts to process results, stopping");
                return;
            }
        } else {
            process_results_failed_attempts_ = 0;
        }

        async_process_results();
    });
}

void mdk::dnssd::BonjourTransport::register_reply(
    [[maybe_unused]] DNSServiceRef service_ref, const DNSServiceFlags flags, const DNSServiceErrorType error_code,
    const char* service_name, const char* reg_type, [[maybe_unused]] const char* reply_domain, void* context
) {
    MDK_ASSERT_RETURN(context != nullptr, "Expected non-null context");

    auto* transport = static_cast<BonjourTransport*>(context);
    if (!transport->publish_handler_) {
        MDK_TRACE("Ignoring register reply for {} ({})", service_name, reg_type);
        return;
    }

    tl::expected<std::string, std::string> result;
    if (error_code != kDNSServiceErr_NoError) {
        result = tl::unexpected(fmt::format("Failed to register service: {}", dns_service_error_to_string(error_code)));
    } else if (!(flags & kDNSServiceFlagsAdd)) {
        result = tl::unexpected(std::string("Service registration was removed"));
    } else {
        result = std::string(service_name);
    }

    auto handler = std::move(transport->publish_handler_);
    transport->publish_handler_ = nullptr;

    // Deferred, so the registration isn't released from within its own callback.
    boost::asio::post(
        transport->io_context_,
        [alive = std::weak_ptr<bool>(transport->alive_), transport, generation = transport->publish_generation_,
         handler = std::move(handler), result = std::move(result)] {
            if (alive.expired() || generation != transport->publish_generation_) {
                return;
            }
            if (!result) {
                transport->registration_.reset();
            }
            handler(result);
        }
    );
}

#endif
