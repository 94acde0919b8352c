/**
 * @file csv_batch_reader.hpp
 * @brief Raw batch files: <raw_dir>/<YYYY-MM-DD>.csv with a header row
 */

#pragma once

#include <ingestion/batch_source.hpp>
#include <core/config.hpp>
#include <export.hpp>
#include <filesystem>
#include <istream>
#include <string>
#include <vector>

namespace Sessionizer {

/**
 * @brief Reads one CSV file per process date.
 *
 * Required columns: user_id, event_id, product_code, timestamp (any order).
 * Every other column becomes a payload field, in header order.
 * Quoting follows RFC 4180: fields may be enclosed in double quotes, a doubled
 * quote inside stands for one quote, and quoted fields may span lines.
 */
class SESSIONIZER_API CsvBatchReader : public BatchSource {
public:
    CsvBatchReader(std::filesystem::path raw_dir, SchemaPolicy policy);

    RawBatch read(Date process_date) override;

    /**
     * @brief Parse an already opened stream (source names the input in diagnostics).
     */
    RawBatch parse(std::istream& in, const std::string& source) const;

    std::filesystem::path path_for(Date process_date) const;

    /**
     * @brief Split one CSV record; reads further lines while a quoted field is open.
     * @return false at end of input
     * @throws SchemaViolationError on an unterminated quoted field
     */
    static bool read_record(std::istream& in, std::vector<std::string>& fields, size_t& line);

private:
    std::filesystem::path raw_dir_;
    SchemaPolicy policy_;
};

} // namespace Sessionizer
