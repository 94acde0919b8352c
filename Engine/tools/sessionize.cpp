#include <pipeline/session_engine.hpp>
#include <ingestion/csv_batch_reader.hpp>
#include <storage/postgres_session_store.hpp>
#include <database/postgres_connection.hpp>
#include <core/errors.hpp>
#include <utils/logger.hpp>
#include <iostream>
#include <memory>
#include <stdexcept>

using namespace Sessionizer;

namespace {

enum ExitCode {
    EXIT_OK = 0,
    EXIT_UNEXPECTED = 1,
    EXIT_USAGE = 2,
    EXIT_SCHEMA = 3,
    EXIT_SCOPE = 4,
    EXIT_CONFLICT = 5
};

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " --process-date YYYY-MM-DD [options]\n"
              << "\nOptions:\n"
              << "  --first-run                  Bootstrap: replace the layer with this batch\n"
              << "  --dry-run                    Compute and report, write nothing\n"
              << "  --session-timeout DUR        Inactivity timeout (e.g. 1800, 30m, 1h)\n"
              << "  --action-codes a,b,c         Event ids counted as user actions\n"
              << "  --lookback-days N            Days recomputed before the process date\n"
              << "  --extended-lookback-days N   Days loaded for predecessors\n"
              << "  --retention-days N           Oldest day the raw layer still holds\n"
              << "  --raw-dir DIR                Directory of <date>.csv batches\n"
              << "  --table NAME                 Cleaned layer table (schema.table)\n"
              << "  --reject-batch               Fail the run on any invalid row\n"
              << "  --digest-ids                 Hex BLAKE3 session ids\n"
              << "  --threads N                  Worker threads (0 = all cores)\n"
              << "  --conninfo STR               libpq connection string (default: PG* env)\n"
              << "\nDefaults come from SESSIONIZER_* environment variables.\n";
}

int parse_count(const std::string& flag, const std::string& value) {
    try {
        size_t used = 0;
        int v = std::stoi(value, &used);
        if (used != value.size()) throw std::invalid_argument(value);
        return v;
    } catch (const std::exception&) {
        throw ConfigError(flag + ": expected an integer, got '" + value + "'");
    }
}

} // namespace

int main(int argc, char** argv) {
    EngineConfig config;
    RunParams params;
    std::string conninfo;
    bool have_date = false;

    try {
        config = EngineConfig::load_from_env();

        for (int i = 1; i < argc; ++i) {
            const std::string arg = argv[i];
            auto value = [&]() -> std::string {
                if (i + 1 >= argc) throw ConfigError(arg + " requires a value");
                return argv[++i];
            };

            if (arg == "--help" || arg == "-h") {
                print_usage(argv[0]);
                return EXIT_OK;
            } else if (arg == "--process-date") {
                const std::string text = value();
                auto d = TimeUtil::parse_date(text);
                if (!d) throw ConfigError("--process-date: invalid date '" + text + "'");
                params.process_date = *d;
                have_date = true;
            } else if (arg == "--first-run") {
                params.is_first_run = true;
            } else if (arg == "--dry-run") {
                params.dry_run = true;
            } else if (arg == "--session-timeout") {
                const std::string text = value();
                auto d = TimeUtil::parse_duration(text);
                if (!d) throw ConfigError("--session-timeout: invalid duration '" + text + "'");
                config.session_timeout = *d;
            } else if (arg == "--action-codes") {
                config.action_codes = parse_code_list(value());
            } else if (arg == "--lookback-days") {
                config.lookback_days = parse_count(arg, value());
            } else if (arg == "--extended-lookback-days") {
                config.extended_lookback_days = parse_count(arg, value());
            } else if (arg == "--retention-days") {
                config.retention_days = parse_count(arg, value());
            } else if (arg == "--raw-dir") {
                config.raw_dir = value();
            } else if (arg == "--table") {
                config.table = value();
            } else if (arg == "--reject-batch") {
                config.schema_policy = SchemaPolicy::RejectBatch;
            } else if (arg == "--digest-ids") {
                config.session_id_format = SessionIdFormat::Digest;
            } else if (arg == "--threads") {
                config.threads = parse_count(arg, value());
            } else if (arg == "--conninfo") {
                conninfo = value();
            } else {
                throw ConfigError("Unknown option '" + arg + "'");
            }
        }

        if (!have_date) throw ConfigError("--process-date is required");
        config.validate();
    } catch (const ConfigError& e) {
        Logger::error(e.what());
        print_usage(argv[0]);
        return EXIT_USAGE;
    }

    try {
        std::unique_ptr<PostgresConnection> db = conninfo.empty()
            ? std::make_unique<PostgresConnection>()
            : std::make_unique<PostgresConnection>(conninfo);
        if (!db->is_connected()) {
            Logger::error("Failed to connect to database.");
            return EXIT_UNEXPECTED;
        }

        CsvBatchReader source(config.raw_dir, config.schema_policy);
        PostgresSessionStore store(*db, config.table);
        SessionEngine engine(config, source, store);

        RunReport report = engine.run(params);

        std::cout << "\n=== Session Run Complete ===\n" << report.describe() << "\n";
        return EXIT_OK;
    } catch (const SchemaViolationError& e) {
        Logger::error(std::string("Schema violation: ") + e.what());
        return EXIT_SCHEMA;
    } catch (const ScopeResolutionError& e) {
        Logger::error(std::string("Scope resolution failed: ") + e.what());
        for (const auto& key : e.keys()) Logger::error("  " + key.to_string());
        return EXIT_SCOPE;
    } catch (const MergeConflictError& e) {
        Logger::error(std::string("Merge conflict: ") + e.what());
        return EXIT_CONFLICT;
    } catch (const ConfigError& e) {
        Logger::error(e.what());
        return EXIT_USAGE;
    } catch (const std::exception& e) {
        Logger::error(std::string("Error: ") + e.what());
        return EXIT_UNEXPECTED;
    }
}
