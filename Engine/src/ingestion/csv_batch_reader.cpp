#include <ingestion/csv_batch_reader.hpp>
#include <utils/logger.hpp>
#include <array>
#include <fstream>
#include <map>

namespace Sessionizer {

namespace fs = std::filesystem;

namespace {

constexpr std::array<const char*, 4> k_required = {"user_id", "event_id", "product_code", "timestamp"};

bool is_blank(const std::vector<std::string>& fields) {
    return fields.size() == 1 && fields[0].empty();
}

} // namespace

CsvBatchReader::CsvBatchReader(fs::path raw_dir, SchemaPolicy policy)
    : raw_dir_(std::move(raw_dir)), policy_(policy) {}

fs::path CsvBatchReader::path_for(Date process_date) const {
    return raw_dir_ / (TimeUtil::format_date(process_date) + ".csv");
}

RawBatch CsvBatchReader::read(Date process_date) {
    const fs::path path = path_for(process_date);
    std::ifstream file(path, std::ios::binary);
    if (!file) throw SessionizerError("Failed to open raw batch: " + path.string());

    Logger::debug("Reading " + path.string());
    return parse(file, path.string());
}

bool CsvBatchReader::read_record(std::istream& in, std::vector<std::string>& fields, size_t& line) {
    fields.clear();
    std::string text;
    if (!std::getline(in, text)) return false;
    ++line;
    const size_t first_line = line;

    std::string field;
    bool quoted = false;
    size_t i = 0;

    while (true) {
        if (i >= text.size()) {
            if (!quoted) break;
            // Quoted field continues on the next physical line
            field.push_back('\n');
            if (!std::getline(in, text)) {
                throw SchemaViolationError("Unterminated quoted field starting at line " + std::to_string(first_line),
                                           {{first_line, "unterminated quoted field"}});
            }
            ++line;
            i = 0;
            continue;
        }

        const char c = text[i++];
        if (quoted) {
            if (c == '"') {
                if (i < text.size() && text[i] == '"') {
                    field.push_back('"');
                    ++i;
                } else {
                    quoted = false;
                }
            } else {
                field.push_back(c);
            }
        } else if (c == '"') {
            quoted = true;
        } else if (c == ',') {
            fields.push_back(std::move(field));
            field.clear();
        } else if (c == '\r' && i == text.size()) {
            // CRLF line ending
        } else {
            field.push_back(c);
        }
    }

    fields.push_back(std::move(field));
    return true;
}

RawBatch CsvBatchReader::parse(std::istream& in, const std::string& source) const {
    RawBatch batch;
    size_t line = 0;
    std::vector<std::string> header;

    if (!read_record(in, header, line) || is_blank(header)) {
        Logger::warn(source + " is empty");
        return batch;
    }

    // UTF-8 byte order mark
    if (header[0].size() >= 3 && header[0].compare(0, 3, "\xEF\xBB\xBF") == 0) {
        header[0].erase(0, 3);
    }

    std::map<std::string, size_t> column_index;
    for (size_t i = 0; i < header.size(); ++i) {
        if (!column_index.emplace(header[i], i).second) {
            throw SchemaViolationError(source + ": duplicate column '" + header[i] + "'",
                                       {{1, "duplicate column " + header[i]}});
        }
    }

    std::array<size_t, k_required.size()> req{};
    for (size_t r = 0; r < k_required.size(); ++r) {
        auto it = column_index.find(k_required[r]);
        if (it == column_index.end()) {
            throw SchemaViolationError(source + ": missing required column '" + std::string(k_required[r]) + "'",
                                       {{1, std::string("missing column ") + k_required[r]}});
        }
        req[r] = it->second;
    }

    std::vector<size_t> payload_columns;
    for (size_t i = 0; i < header.size(); ++i) {
        bool required = false;
        for (size_t r : req) required = required || r == i;
        if (!required) payload_columns.push_back(i);
    }

    std::vector<std::string> fields;
    while (true) {
        size_t record_line = line + 1;
        if (!read_record(in, fields, line)) break;
        if (is_blank(fields)) continue;
        ++batch.raw_rows;

        std::string reason;
        std::optional<Timestamp> ts;
        if (fields.size() != header.size()) {
            reason = "expected " + std::to_string(header.size()) + " fields, found " + std::to_string(fields.size());
        } else {
            for (size_t r = 0; r < k_required.size() && reason.empty(); ++r) {
                if (fields[req[r]].empty()) reason = std::string("empty ") + k_required[r];
            }
            if (reason.empty()) {
                ts = TimeUtil::parse_timestamp(fields[req[3]]);
                if (!ts) reason = "unparsable timestamp '" + fields[req[3]] + "'";
            }
        }

        if (!reason.empty()) {
            if (policy_ == SchemaPolicy::RejectBatch) {
                throw SchemaViolationError(source + ":" + std::to_string(record_line) + ": " + reason,
                                           {{record_line, reason}});
            }
            batch.rejected.push_back({record_line, reason});
            continue;
        }

        Event e;
        e.user_id = fields[req[0]];
        e.event_id = fields[req[1]];
        e.product_code = fields[req[2]];
        e.timestamp = *ts;
        Payload payload;
        payload.reserve(payload_columns.size());
        for (size_t i : payload_columns) {
            payload.emplace_back(header[i], fields[i]);
        }
        e.payload = std::move(payload);
        batch.events.push_back(std::move(e));
    }

    Logger::debug(source + ": " + std::to_string(batch.raw_rows) + " row(s), " +
                  std::to_string(batch.rejected.size()) + " rejected");
    return batch;
}

} // namespace Sessionizer
