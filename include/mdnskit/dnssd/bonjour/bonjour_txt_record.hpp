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
#include "mdnskit/dnssd/dnssd_service_record.hpp"

#if MDK_HAS_DNSSD

namespace mdk::dnssd {

/**
 * Owns a TXTRecordRef and converts between TXT record bytes and TxtRecord.
 */
class BonjourTxtRecord {
  public:
    /**
     * Builds the record from given key/value pairs.
     * @throws mdk::Exception if a pair doesn't fit into the record.
     */
    explicit BonjourTxtRecord(const TxtRecord& txt_record);
    ~BonjourTxtRecord();

    BonjourTxtRecord(const BonjourTxtRecord&) = delete;
    BonjourTxtRecord& operator=(const BonjourTxtRecord&) = delete;

    /**
     * Sets a value inside the TXT record.
     * @param key Key.
     * @param value Value, at most 255 bytes.
     * @throws mdk::Exception on failure.
     */
    void set_value(const std::string& key, const std::string& value);

    /**
     * @return The length of the TXT record data.
     */
    [[nodiscard]] uint16_t length() const noexcept;

    /**
     * @return A pointer to the TXT record data, valid for as long as this instance lives.
     */
    [[nodiscard]] const void* bytes_ptr() const noexcept;

    /**
     * Parses raw TXT record bytes. Entries with an empty key are skipped.
     * @param txt_record The record data.
     * @param txt_record_length The length of the record data.
     * @return The parsed key/value pairs.
     */
    static TxtRecord get_txt_record_from_raw_bytes(const unsigned char* txt_record, uint16_t txt_record_length);

  private:
    TXTRecordRef txt_record_ref_ {};
};

}  // namespace mdk::dnssd

#endif
