/**
 * @file config.hpp
 * @brief Engine configuration and per-run parameters
 */

#pragma once

#include <utils/time.hpp>
#include <export.hpp>
#include <set>
#include <string>

namespace Sessionizer {

// Upper bound on every day window (about a century)
constexpr int kMaxWindowDays = 36500;

enum class SchemaPolicy {
    RejectRows,   // drop offending rows, report them, continue
    RejectBatch   // fail the run on the first offending row
};

enum class SessionIdFormat {
    Composite,    // escaped "user#product#start"
    Digest        // hex BLAKE3 digest of the framed fields
};

/**
 * @brief Engine configuration
 *
 * Defaults match the daily job: 30 minute timeout, actions {a, b, c},
 * 5 day lookback plus one context day, 14 day retention of lookback data.
 */
struct SESSIONIZER_API EngineConfig {
    Duration session_timeout = std::chrono::minutes(30);
    std::set<std::string> action_codes = {"a", "b", "c"};

    int lookback_days = 5;
    int extended_lookback_days = 6;
    int retention_days = 14;

    SchemaPolicy schema_policy = SchemaPolicy::RejectRows;
    SessionIdFormat session_id_format = SessionIdFormat::Composite;

    std::string raw_dir = "raw";
    std::string table = "ods.sessioned_event";

    int threads = 0;  // 0 = OpenMP default

    /**
     * @brief Defaults overridden by SESSIONIZER_* environment variables.
     * @throws ConfigError on unparsable values
     */
    static EngineConfig load_from_env();

    /**
     * @throws ConfigError when the windows cannot guarantee correct boundaries
     */
    void validate() const;

    std::string describe() const;
};

struct RunParams {
    Date process_date;
    bool is_first_run = false;
    bool dry_run = false;
};

SchemaPolicy parse_schema_policy(const std::string& text);
SessionIdFormat parse_session_id_format(const std::string& text);

/**
 * @brief Split a comma separated list, trimming blanks and dropping empty items.
 */
std::set<std::string> parse_code_list(const std::string& text);

} // namespace Sessionizer
