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
#include <string_view>

namespace mdk::dnssd {

/**
 * Removes the uniqueness suffix a responder appends to an instance name on a conflict, for example "My App (2)" becomes
 * "My App". Names without such a suffix are returned unchanged.
 * @param name The instance name.
 * @return The name without suffix.
 */
std::string normalize_instance_name(std::string_view name);

/**
 * Tests whether a discovered instance name satisfies a name filter. Both names are normalized first, after which the
 * candidate matches when it equals the target or starts with it. Note that a short target therefore also matches
 * unrelated names sharing the prefix ("My" matches "MyOtherService").
 * @param candidate The discovered instance name.
 * @param target The filter. An empty filter matches everything.
 * @return True if the candidate matches.
 */
bool instance_name_matches(std::string_view candidate, std::string_view target);

}  // namespace mdk::dnssd
