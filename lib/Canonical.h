#ifndef POWLEDGER_CANONICAL_H
#define POWLEDGER_CANONICAL_H

#include "Utilities.h"

#include <nlohmann/json.hpp>
#include <string>

namespace pwl {
namespace canonical {

constexpr int32_t E_ENCODE = 1; // Tree holds a string that is not valid UTF-8

/**
 * Convert a JSON tree to its canonical form.
 *
 * Objects at every depth come out with keys in bytewise ascending order,
 * whatever order they were inserted in. Arrays keep their element order.
 *
 * @param value Tree in any key order
 * @return Key-sorted tree
 */
nlohmann::json normalize(const nlohmann::ordered_json &value);

/**
 * Render a tree canonically: sorted keys, no whitespace.
 * Identical logical content always yields identical bytes.
 * @return Encoded text, or E_ENCODE when a string is not valid UTF-8
 */
Roe<std::string> encode(const nlohmann::json &value);
Roe<std::string> encode(const nlohmann::ordered_json &value);

} // namespace canonical
} // namespace pwl

#endif // POWLEDGER_CANONICAL_H
