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

#include "mdnskit/core/platform.hpp"
#include "mdnskit/core/exception.hpp"

// MDK_ENABLE_DNSSD_COMPAT is set by the build when a dns_sd compatibility library (like Avahi's libdns_sd) was found.
#if MDK_APPLE || MDK_WINDOWS
    #define MDK_HAS_DNSSD 1
#elif defined(MDK_ENABLE_DNSSD_COMPAT) && MDK_ENABLE_DNSSD_COMPAT
    #define MDK_HAS_DNSSD 1
#else
    #define MDK_HAS_DNSSD 0
#endif

#if MDK_HAS_DNSSD

    #if MDK_WINDOWS
        #define _WINSOCKAPI_  // Prevents inclusion of winsock.h in windows.h
        #include <Ws2tcpip.h>
        #include <winsock2.h>
    #else
        #include <arpa/inet.h>
    #endif

    #include <dns_sd.h>

    #define DNSSD_THROW_IF_ERROR(result, msg)                                                  \
        if ((result) != kDNSServiceErr_NoError) {                                              \
            MDK_THROW_EXCEPTION("{}: {}", msg, mdk::dnssd::dns_service_error_to_string(result)); \
        }

namespace mdk::dnssd {

/**
 * @return True if the mDNS responder can be reached.
 */
bool is_bonjour_service_running();

/**
 * @return A readable description of given DNS-SD error code.
 */
const char* dns_service_error_to_string(DNSServiceErrorType error) noexcept;

}  // namespace mdk::dnssd

#endif
