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

#include <string>
#include <utility>

namespace mdk::dnssd {

/**
 * Error reported by the dnssd layer. Runtime conditions which are part of normal operation (no services found, a single
 * candidate not resolving) are not errors.
 */
struct Error {
    enum class Kind {
        /// Malformed caller input like an out of range port or an unparseable service type.
        validation,
        /// The transport refused or failed an advertisement.
        publish,
        /// A single candidate failed to resolve.
        resolve,
        /// The transport failed to start or continue browsing.
        browse,
        /// No transport is available on this platform.
        transport_unavailable,
        /// The operation was superseded or cancelled before it completed.
        cancelled,
    };

    Kind kind {Kind::validation};
    std::string message;

    static Error validation(std::string msg) {
        return {Kind::validation, std::move(msg)};
    }

    static Error publish(std::string msg) {
        return {Kind::publish, std::move(msg)};
    }

    static Error browse(std::string msg) {
        return {Kind::browse, std::move(msg)};
    }

    static Error transport_unavailable(std::string msg) {
        return {Kind::transport_unavailable, std::move(msg)};
    }

    static Error cancelled(std::string msg) {
        return {Kind::cancelled, std::move(msg)};
    }

    friend bool operator==(const Error& lhs, const Error& rhs) {
        return lhs.kind == rhs.kind && lhs.message == rhs.message;
    }

    friend bool operator!=(const Error& lhs, const Error& rhs) {
        return !(lhs == rhs);
    }
};

inline const char* to_string(const Error::Kind kind) {
    switch (kind) {
        case Error::Kind::validation:
            return "validation";
        case Error::Kind::publish:
            return "publish";
        case Error::Kind::resolve:
            return "resolve";
        case Error::Kind::browse:
            return "browse";
        case Error::Kind::transport_unavailable:
            return "transport_unavailable";
        case Error::Kind::cancelled:
            return "cancelled";
    }
    return "unknown";
}

}  // namespace mdk::dnssd
