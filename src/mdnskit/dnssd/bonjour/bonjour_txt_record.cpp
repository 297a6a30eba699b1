/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "mdnskit/dnssd/bonjour/bonjour_txt_record.hpp"

#if MDK_HAS_DNSSD

    #include <limits>

mdk::dnssd::BonjourTxtRecord::BonjourTxtRecord(const TxtRecord& txt_record) {
    // Passing 0 and nullptr makes TXTRecordCreate allocate the buffer.
    TXTRecordCreate(&txt_record_ref_, 0, nullptr);

    try {
        for (auto& [key, value] : txt_record) {
            set_value(key, value);
        }
    } catch (...) {
        TXTRecordDeallocate(&txt_record_ref_);
        throw;
    }
}

mdk::dnssd::BonjourTxtRecord::~BonjourTxtRecord() {
    TXTRecordDeallocate(&txt_record_ref_);
}

void mdk::dnssd::BonjourTxtRecord::set_value(const std::string& key, const std::string& value) {
    if (value.size() > std::numeric_limits<uint8_t>::max()) {
        MDK_THROW_EXCEPTION("TXT record value for key \"{}\" is too long", key);
    }
    DNSSD_THROW_IF_ERROR(
        TXTRecordSetValue(&txt_record_ref_, key.c_str(), static_cast<uint8_t>(value.size()), value.c_str()),
        "Failed to set txt record value"
    );
}

uint16_t mdk::dnssd::BonjourTxtRecord::length() const noexcept {
    return TXTRecordGetLength(&txt_record_ref_);
}

const void* mdk::dnssd::BonjourTxtRecord::bytes_ptr() const noexcept {
    return TXTRecordGetBytesPtr(&txt_record_ref_);
}

mdk::dnssd::TxtRecord mdk::dnssd::BonjourTxtRecord::get_txt_record_from_raw_bytes(
    const unsigned char* txt_record, const uint16_t txt_record_length
) {
    TxtRecord result;

    constexpr uint16_t key_buffer_length = 256;
    char key[key_buffer_length];
    uint8_t value_length = 0;
    const void* value = nullptr;

    const auto count = TXTRecordGetCount(txt_record_length, txt_record);
    for (uint16_t i = 0; i < count; i++) {
        const auto error = TXTRecordGetItemAtIndex(
            txt_record_length, txt_record, i, key_buffer_length, key, &value_length, &value
        );
        if (error != kDNSServiceErr_NoError || key[0] == '\0') {
            continue;
        }
        std::string str_value;
        if (value != nullptr) {
            str_value.assign(static_cast<const char*>(value), value_length);
        }
        result.emplace(key, std::move(str_value));
    }

    return result;
}

#endif
