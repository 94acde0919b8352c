#include <database/bulk_copy.hpp>
#include <utils/logger.hpp>

namespace Sessionizer {

BulkCopy::BulkCopy(PostgresConnection& db) noexcept
    : db_(db) {}

BulkCopy::~BulkCopy() {
    if (!in_copy_) return;
    try {
        db_.copy_end("BulkCopy destroyed before flush");
    } catch (const DatabaseError&) {
        // Expected: the server reports the aborted COPY as an error
    } catch (const std::exception& e) {
        Logger::warn(std::string("BulkCopy abort failed: ") + e.what());
    }
}

void BulkCopy::begin_table(const std::string& table_name, const std::vector<std::string>& columns) {
    if (in_copy_) throw std::runtime_error("BulkCopy: begin_table called while COPY is active");

    table_name_ = table_name;
    columns_ = columns;
    buffered_rows_ = 0;
    buffer_.str("");
    buffer_.clear();
}

std::string BulkCopy::quote_identifier(const std::string& id) {
    std::string out;
    out.reserve(id.size() + 2);
    out.push_back('"');
    for (char c : id) {
        if (c == '"') out.append("\"\"");
        else out.push_back(c);
    }
    out.push_back('"');
    return out;
}

std::string BulkCopy::quote_qualified(const std::string& name) {
    auto dot_pos = name.find('.');
    if (dot_pos == std::string::npos) {
        return quote_identifier(name);
    }
    return quote_identifier(name.substr(0, dot_pos)) + "." + quote_identifier(name.substr(dot_pos + 1));
}

void BulkCopy::escape_value_into_buffer(const std::string& value) {
    for (char c : value) {
        if (c == '\0') continue;
        switch (c) {
            case '\\': buffer_ << "\\\\"; break;
            case '\t': buffer_ << "\\t";  break;
            case '\n': buffer_ << "\\n";  break;
            case '\r': buffer_ << "\\r";  break;
            default:   buffer_ << c;      break;
        }
    }
}

void BulkCopy::start_copy_if_needed() {
    if (in_copy_) return;

    if (columns_.empty()) {
        throw std::runtime_error("BulkCopy: columns not set. Call begin_table() first.");
    }

    std::ostringstream copy_sql;
    copy_sql << "COPY " << quote_qualified(table_name_) << " (";
    for (size_t i = 0; i < columns_.size(); ++i) {
        if (i) copy_sql << ", ";
        copy_sql << quote_identifier(columns_[i]);
    }
    copy_sql << ") FROM STDIN";

    db_.execute(copy_sql.str());
    in_copy_ = true;
}

void BulkCopy::send_buffer() {
    std::string data = buffer_.str();
    if (!data.empty()) {
        db_.copy_data(data.c_str(), static_cast<int>(data.size()));
    }
    buffer_.str("");
    buffer_.clear();
    buffered_rows_ = 0;
}

void BulkCopy::add_row(const std::vector<Field>& values) {
    start_copy_if_needed();

    const size_t ncols = columns_.size();
    for (size_t i = 0; i < ncols; ++i) {
        if (i) buffer_ << '\t';
        if (i < values.size() && values[i]) {
            escape_value_into_buffer(*values[i]);
        } else {
            buffer_ << "\\N";
        }
    }
    buffer_ << '\n';

    if (++buffered_rows_ >= DEFAULT_FLUSH_ROWS) {
        send_buffer();
    }
}

void BulkCopy::flush() {
    if (!in_copy_) return;

    send_buffer();
    in_copy_ = false;
    db_.copy_end(nullptr);
}

} // namespace Sessionizer
