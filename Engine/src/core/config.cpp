#include <core/config.hpp>
#include <core/errors.hpp>
#include <utils/logger.hpp>
#include <cctype>
#include <cstdlib>
#include <sstream>

namespace Sessionizer {

namespace {

int parse_int(const std::string& name, const std::string& value) {
    try {
        size_t used = 0;
        int v = std::stoi(value, &used);
        if (used != value.size()) throw std::invalid_argument(value);
        return v;
    } catch (const std::exception&) {
        throw ConfigError(name + ": expected an integer, got '" + value + "'");
    }
}

const char* env(const char* name) {
    const char* v = std::getenv(name);
    return (v && *v) ? v : nullptr;
}

} // namespace

SchemaPolicy parse_schema_policy(const std::string& text) {
    if (text == "rows") return SchemaPolicy::RejectRows;
    if (text == "batch") return SchemaPolicy::RejectBatch;
    throw ConfigError("Unknown schema policy '" + text + "' (expected rows|batch)");
}

SessionIdFormat parse_session_id_format(const std::string& text) {
    if (text == "composite") return SessionIdFormat::Composite;
    if (text == "digest") return SessionIdFormat::Digest;
    throw ConfigError("Unknown session id format '" + text + "' (expected composite|digest)");
}

std::set<std::string> parse_code_list(const std::string& text) {
    std::set<std::string> codes;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        size_t b = 0, e = item.size();
        while (b < e && std::isspace(static_cast<unsigned char>(item[b]))) ++b;
        while (e > b && std::isspace(static_cast<unsigned char>(item[e - 1]))) --e;
        if (e > b) codes.insert(item.substr(b, e - b));
    }
    return codes;
}

EngineConfig EngineConfig::load_from_env() {
    EngineConfig config;

    if (const char* v = env("SESSIONIZER_SESSION_TIMEOUT")) {
        auto d = TimeUtil::parse_duration(v);
        if (!d) throw ConfigError(std::string("SESSIONIZER_SESSION_TIMEOUT: invalid duration '") + v + "'");
        config.session_timeout = *d;
    }
    if (const char* v = env("SESSIONIZER_ACTION_CODES")) config.action_codes = parse_code_list(v);
    if (const char* v = env("SESSIONIZER_LOOKBACK_DAYS")) config.lookback_days = parse_int("SESSIONIZER_LOOKBACK_DAYS", v);
    if (const char* v = env("SESSIONIZER_EXTENDED_LOOKBACK_DAYS")) {
        config.extended_lookback_days = parse_int("SESSIONIZER_EXTENDED_LOOKBACK_DAYS", v);
    }
    if (const char* v = env("SESSIONIZER_RETENTION_DAYS")) config.retention_days = parse_int("SESSIONIZER_RETENTION_DAYS", v);
    if (const char* v = env("SESSIONIZER_SCHEMA_POLICY")) config.schema_policy = parse_schema_policy(v);
    if (const char* v = env("SESSIONIZER_SESSION_ID_FORMAT")) config.session_id_format = parse_session_id_format(v);
    if (const char* v = env("SESSIONIZER_RAW_DIR")) config.raw_dir = v;
    if (const char* v = env("SESSIONIZER_TABLE")) config.table = v;
    if (const char* v = env("SESSIONIZER_THREADS")) config.threads = parse_int("SESSIONIZER_THREADS", v);

    if (const char* v = env("SESSIONIZER_LOG_LEVEL")) {
        if (!Logger::set_level(v)) Logger::warn(std::string("Ignoring unknown SESSIONIZER_LOG_LEVEL '") + v + "'");
    }

    return config;
}

void EngineConfig::validate() const {
    if (session_timeout <= Duration::zero()) {
        throw ConfigError("session_timeout must be positive");
    }
    if (lookback_days < 0) {
        throw ConfigError("lookback_days must not be negative");
    }
    if (extended_lookback_days <= lookback_days) {
        throw ConfigError("extended_lookback_days (" + std::to_string(extended_lookback_days) +
                          ") must exceed lookback_days (" + std::to_string(lookback_days) + ")");
    }
    if (retention_days < extended_lookback_days) {
        throw ConfigError("retention_days must cover extended_lookback_days");
    }
    if (retention_days > kMaxWindowDays) {
        throw ConfigError("retention_days must not exceed " + std::to_string(kMaxWindowDays));
    }
    // The context days must be able to hold the predecessor that decides a boundary
    const Duration context_span = Days(extended_lookback_days - lookback_days);
    if (context_span < session_timeout) {
        throw ConfigError("session_timeout " + TimeUtil::format_duration(session_timeout) +
                          " exceeds the context span of " +
                          std::to_string(extended_lookback_days - lookback_days) + " day(s)");
    }
    if (threads < 0) {
        throw ConfigError("threads must not be negative");
    }
    if (table.empty()) {
        throw ConfigError("table must not be empty");
    }
}

std::string EngineConfig::describe() const {
    std::ostringstream out;
    out << "timeout=" << TimeUtil::format_duration(session_timeout)
        << " actions={";
    bool first = true;
    for (const auto& code : action_codes) {
        out << (first ? "" : ",") << code;
        first = false;
    }
    out << "} lookback=" << lookback_days << "d"
        << " extended=" << extended_lookback_days << "d"
        << " retention=" << retention_days << "d"
        << " policy=" << (schema_policy == SchemaPolicy::RejectRows ? "rows" : "batch")
        << " ids=" << (session_id_format == SessionIdFormat::Composite ? "composite" : "digest")
        << " table=" << table;
    return out.str();
}

} // namespace Sessionizer
