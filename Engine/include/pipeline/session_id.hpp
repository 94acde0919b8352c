#pragma once

#include <core/config.hpp>
#include <core/event.hpp>
#include <string>

namespace Sessionizer {

/**
 * @brief Derive the session identifier from (user_id, product_code, session start).
 *
 * Composite: escape(user) "#" escape(product) "#" start, where '\' and '#' inside ids are
 * prefixed with '\'. Digest: 32 hex chars of BLAKE3 over the length-framed fields.
 * Both are pure functions of their inputs.
 */
std::string derive_session_id(SessionIdFormat format,
                              const std::string& user_id,
                              const std::string& product_code,
                              Timestamp session_start);

/**
 * @brief Backslash-escape '\' and '#'.
 */
std::string escape_id_component(const std::string& value);

} // namespace Sessionizer
