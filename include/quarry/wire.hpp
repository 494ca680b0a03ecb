#pragma once

/** \file wire.hpp
 *  \brief Wire-format document type shared by the compilers, documents and storage.
 *
 * nlohmann::ordered_json keeps keys in insertion order. Some consumers care
 * about key order ($maxDistance must trail the geo operator it modifies), and
 * equality between two wire documents is order-sensitive.
 */

#include <nlohmann/json.hpp>

#include <string>
#include <utility>
#include <vector>

namespace quarry {

using wire_value = nlohmann::ordered_json;
using query_doc = wire_value;   /**< nested query document */
using update_doc = wire_value;  /**< update document keyed by "$operator" */

/** \brief Caller-supplied `field__op=value` pairs, in call order. */
using keyword_args = std::vector<std::pair<std::string, wire_value>>;

} // namespace quarry
