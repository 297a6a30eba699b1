/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "mdnskit/core/string.hpp"
#include "mdnskit/core/string_parser.hpp"

#include <catch2/catch_all.hpp>

TEST_CASE("string | starts_with and ends_with") {
    REQUIRE(mdk::string_starts_with("Printer (2)", "Printer"));
    REQUIRE(mdk::string_starts_with("Printer", ""));
    REQUIRE_FALSE(mdk::string_starts_with("Print", "Printer"));
    REQUIRE(mdk::string_ends_with("_http._tcp.", "."));
    REQUIRE_FALSE(mdk::string_ends_with(".", "tcp."));
}

TEST_CASE("string | trim") {
    REQUIRE(mdk::string_trim("  Printer \t\n") == "Printer");
    REQUIRE(mdk::string_trim("Printer") == "Printer");
    REQUIRE(mdk::string_trim(" \t ").empty());
    REQUIRE(mdk::string_trim("").empty());
}

TEST_CASE("string | compare_case_insensitive") {
    REQUIRE(mdk::string_compare_case_insensitive("TCP", "tcp"));
    REQUIRE_FALSE(mdk::string_compare_case_insensitive("tcp", "udp"));
    REQUIRE_FALSE(mdk::string_compare_case_insensitive("tcp", "tcpx"));
}

TEST_CASE("string | to_lower") {
    REQUIRE(mdk::string_to_lower("HTTP") == "http");
    REQUIRE(mdk::string_to_lower("HTTP", 2) == "htTP");
    REQUIRE(mdk::string_to_lower("").empty());
}

TEST_CASE("StringParser") {
    SECTION("Read delimited parts") {
        mdk::StringParser parser("_http._tcp");
        REQUIRE(parser.skip('_'));
        REQUIRE(parser.read_until('.') == "http");
        REQUIRE_FALSE(parser.skip('.'));
        REQUIRE(parser.skip('_'));
        REQUIRE(parser.read_until_end() == "tcp");
        REQUIRE(parser.exhausted());
        REQUIRE_FALSE(parser.read_until('.').has_value());
        REQUIRE_FALSE(parser.read_until_end().has_value());
    }

    SECTION("Delimiter not found") {
        mdk::StringParser parser("0.1.2.3");
        REQUIRE(parser.read_until('4') == "0.1.2.3");
        REQUIRE(parser.exhausted());
    }

    SECTION("Skip on empty string") {
        mdk::StringParser parser("");
        REQUIRE_FALSE(parser.skip('_'));
        REQUIRE(parser.exhausted());
    }
}
