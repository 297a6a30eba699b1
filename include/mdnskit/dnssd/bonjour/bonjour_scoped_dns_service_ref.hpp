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

namespace mdk::dnssd {

/**
 * RAII wrapper around DNSServiceRef.
 */
class BonjourScopedDnsServiceRef {
  public:
    BonjourScopedDnsServiceRef() = default;
    ~BonjourScopedDnsServiceRef();

    explicit BonjourScopedDnsServiceRef(const DNSServiceRef& service_ref) noexcept;

    BonjourScopedDnsServiceRef(const BonjourScopedDnsServiceRef&) = delete;
    BonjourScopedDnsServiceRef& operator=(const BonjourScopedDnsServiceRef& other) = delete;

    BonjourScopedDnsServiceRef(BonjourScopedDnsServiceRef&& other) noexcept;
    BonjourScopedDnsServiceRef& operator=(BonjourScopedDnsServiceRef&& other) noexcept;

    /**
     * Takes ownership of given DNSServiceRef, deallocating the one currently held.
     * @param service_ref The DNSServiceRef to assign to this instance.
     * @return A reference to this instance.
     */
    BonjourScopedDnsServiceRef& operator=(DNSServiceRef service_ref);

    /**
     * @return The contained DNSServiceRef.
     */
    [[nodiscard]] DNSServiceRef service_ref() const noexcept;

    /**
     * Deallocates the contained DNSServiceRef, if any.
     */
    void reset() noexcept;

  private:
    DNSServiceRef service_ref_ = nullptr;
};

}  // namespace mdk::dnssd

#endif
