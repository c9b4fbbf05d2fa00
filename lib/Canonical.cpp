#include "Canonical.h"

namespace pwl {
namespace canonical {

nlohmann::json normalize(const nlohmann::ordered_json &value) {
  if (value.is_object()) {
    // nlohmann::json keeps object members in a std::map
    nlohmann::json out = nlohmann::json::object();
    for (auto it = value.begin(); it != value.end(); ++it) {
      out[it.key()] = normalize(it.value());
    }
    return out;
  }
  if (value.is_array()) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto &child : value) {
      out.push_back(normalize(child));
    }
    return out;
  }

  switch (value.type()) {
  case nlohmann::ordered_json::value_t::null:
    return nullptr;
  case nlohmann::ordered_json::value_t::boolean:
    return value.get<bool>();
  case nlohmann::ordered_json::value_t::number_integer:
    return value.get<int64_t>();
  case nlohmann::ordered_json::value_t::number_unsigned:
    return value.get<uint64_t>();
  case nlohmann::ordered_json::value_t::number_float:
    return value.get<double>();
  case nlohmann::ordered_json::value_t::string:
    return value.get<std::string>();
  default:
    // binary and discarded values have no canonical form
    return nullptr;
  }
}

Roe<std::string> encode(const nlohmann::json &value) {
  try {
    return value.dump();
  } catch (const nlohmann::json::type_error &e) {
    return Error(E_ENCODE, std::string("Cannot encode value: ") + e.what());
  }
}

Roe<std::string> encode(const nlohmann::ordered_json &value) {
  return encode(normalize(value));
}

} // namespace canonical
} // namespace pwl
