#pragma once

#include <core/event.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace Sessionizer {

// Shared text encodings for the PostgreSQL layer (COPY input and query output).

inline std::string bool_to_pg(bool v) {
    return v ? "t" : "f";
}

// PostgreSQL prints booleans as t/f; accept the long forms too
inline std::optional<bool> pg_to_bool(const std::string& s) {
    if (s == "t" || s == "true") return true;
    if (s == "f" || s == "false") return false;
    return std::nullopt;
}

// Payload fields as a JSON object for the jsonb column, in column order.
// Invalid UTF-8 is replaced rather than failing the whole COPY.
inline std::string payload_to_json(const Payload& payload) {
    nlohmann::ordered_json obj = nlohmann::ordered_json::object();
    for (const auto& [name, value] : payload) {
        obj[name] = value;
    }
    return obj.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}

// Inverse of payload_to_json; non-string values keep their JSON text
inline Payload payload_from_json(const std::string& text) {
    Payload out;
    auto obj = nlohmann::ordered_json::parse(text);
    for (auto& [name, value] : obj.items()) {
        out.emplace_back(name, value.is_string() ? value.get<std::string>() : value.dump());
    }
    return out;
}

} // namespace Sessionizer
