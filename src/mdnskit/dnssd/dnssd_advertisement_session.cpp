/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "mdnskit/dnssd/dnssd_advertisement_session.hpp"

#include "mdnskit/core/assert.hpp"
#include "mdnskit/core/log.hpp"
#include "mdnskit/core/string.hpp"

mdk::dnssd::AdvertisementSession::AdvertisementSession(Transport& transport, std::string default_instance_name) :
    transport_(transport), default_instance_name_(std::move(default_instance_name)) {}

mdk::dnssd::AdvertisementSession::~AdvertisementSession() {
    if (const auto result = stop(); !result) {
        MDK_ERROR("Failed to stop advertisement: {}", result.error().message);
    }
}

void mdk::dnssd::AdvertisementSession::start(
    const ServiceType& type, const std::string_view name, const std::string_view domain, const int64_t port,
    const std::optional<TxtRecord>& txt, StartHandler handler
) {
    MDK_ASSERT_RETURN(handler != nullptr, "Expected a valid handler");

    if (port < 1 || port > 65535) {
        handler(tl::unexpected(Error::validation(fmt::format("Invalid port: {}", port))));
        return;
    }

    cancel_pending("Superseded by a new advertisement");

    if (auto result = release(); !result) {
        handler(tl::unexpected(result.error()));
        return;
    }

    Transport::Publication publication;
    publication.name = std::string(string_trim(name));
    if (publication.name.empty()) {
        publication.name = default_instance_name_;
    }
    publication.type = type.full_type();
    publication.domain = normalize_domain(domain);
    publication.port = static_cast<uint16_t>(port);
    if (txt) {
        publication.txt = *txt;
    }

    MDK_DEBUG("Publishing {} {} on port {}", publication.name, publication.type, publication.port);

    pending_ = publication;
    pending_handler_ = std::move(handler);
    registered_ = true;
    const auto generation = ++generation_;

    try {
        transport_.publish(publication, [this, generation](tl::expected<std::string, std::string> result) {
            on_published(generation, std::move(result));
        });
    } catch (const std::exception& e) {
        on_published(generation, tl::unexpected(std::string(e.what())));
    }
}

tl::expected<void, mdk::dnssd::Error> mdk::dnssd::AdvertisementSession::stop() {
    cancel_pending("Advertisement stopped");
    return release();
}

const std::optional<mdk::dnssd::Transport::Publication>&
mdk::dnssd::AdvertisementSession::current_publication() const {
    return current_;
}

bool mdk::dnssd::AdvertisementSession::is_publishing() const {
    return current_.has_value();
}

bool mdk::dnssd::AdvertisementSession::is_pending() const {
    return pending_.has_value();
}

void mdk::dnssd::AdvertisementSession::cancel_pending(const std::string& reason) {
    if (!pending_) {
        return;
    }

    MDK_DEBUG("Cancelling pending publish of {}: {}", pending_->name, reason);

    // The transport still holds the registration, release() takes care of it.
    pending_.reset();
    ++generation_;

    auto handler = std::move(pending_handler_);
    pending_handler_ = nullptr;
    if (handler) {
        handler(tl::unexpected(Error::cancelled(reason)));
    }
}

tl::expected<void, mdk::dnssd::Error> mdk::dnssd::AdvertisementSession::release() {
    current_.reset();
    if (!registered_) {
        return {};
    }

    MDK_DEBUG("Unpublishing");
    registered_ = false;

    try {
        transport_.unpublish();
    } catch (const std::exception& e) {
        return tl::unexpected(Error::publish(fmt::format("Failed to unpublish: {}", e.what())));
    }
    return {};
}

void mdk::dnssd::AdvertisementSession::on_published(
    const uint64_t generation, tl::expected<std::string, std::string> result
) {
    if (generation != generation_ || !pending_) {
        MDK_TRACE("Ignoring stale publish completion");
        return;
    }

    auto publication = std::move(*pending_);
    pending_.reset();
    auto handler = std::move(pending_handler_);
    pending_handler_ = nullptr;

    if (!result) {
        MDK_ERROR("Failed to publish {}: {}", publication.name, result.error());
        registered_ = false;
        try {
            transport_.unpublish();
        } catch (const std::exception& e) {
            MDK_ERROR("Failed to unpublish: {}", e.what());
        }
        if (handler) {
            handler(tl::unexpected(Error::publish(result.error())));
        }
        return;
    }

    publication.name = *result;
    MDK_INFO("Publishing {} as \"{}\" on port {}", publication.type, publication.name, publication.port);
    current_ = std::move(publication);

    if (handler) {
        handler(current_->name);
    }
}
