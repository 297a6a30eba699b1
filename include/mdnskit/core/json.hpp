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

#include "expected.hpp"

#include <boost/json.hpp>
#include <boost/json/value_to.hpp>
#include <boost/json/value_from.hpp>

#include <string_view>

namespace mdk {

/**
 * Parses given string as json and converts it into T using the tag_invoke overloads for T.
 * @tparam T The type to convert into.
 * @param json_str The json text.
 * @return The converted value, or the error code of the parse or conversion.
 */
template<typename T>
boost::system::result<T> parse_json(const std::string_view json_str) {
    boost::system::error_code ec;
    const auto jv = boost::json::parse(json_str, ec);
    if (ec) {
        return ec;
    }
    return boost::json::try_value_to<T>(jv);
}

}  // namespace mdk
