#include <database/bulk_copy.hpp>
#include <utils/logger.hpp>
#include <stdexcept>

namespace RdfPg {

std::atomic<uint64_t> BulkCopy::s_counter_{0};

BulkCopy::BulkCopy(PostgresConnection& db) noexcept : db_(db) {}

BulkCopy::~BulkCopy() {
    try {
        flush();
    } catch (const std::exception& e) {
        Logger::warn(std::string("BulkCopy: flush on destruction failed: ") + e.what());
    }
}

void BulkCopy::begin_table(const std::string& table_name, const std::vector<std::string>& columns) {
    if (in_copy_) throw std::runtime_error("BulkCopy: flush() before starting another table");

    table_name_ = table_name;
    columns_ = columns;
    row_count_ = 0;

    buffer_.str("");
    buffer_.clear();

    temp_table_name_ = "tmp_" + table_name_ + "_" + std::to_string(++s_counter_);
}

std::string BulkCopy::quote_identifier(const std::string& id) const {
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

std::string BulkCopy::column_list() const {
    std::string cols;
    for (size_t i = 0; i < columns_.size(); ++i) {
        if (i) cols += ", ";
        cols += quote_identifier(columns_[i]);
    }
    return cols;
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

    std::string temp = quote_identifier(temp_table_name_);

    db_.execute("CREATE TEMP TABLE IF NOT EXISTS " + temp +
                " (LIKE " + quote_identifier(table_name_) + " INCLUDING DEFAULTS) ON COMMIT PRESERVE ROWS");
    db_.execute("TRUNCATE " + temp);
    db_.execute("COPY " + temp + " (" + column_list() + ") FROM STDIN");
    in_copy_ = true;
}

void BulkCopy::add_row(const std::vector<std::optional<std::string>>& values) {
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
    ++row_count_;

    if ((row_count_ % DEFAULT_FLUSH_ROWS) == 0) {
        std::string data = buffer_.str();
        if (!data.empty()) {
            db_.copy_data(data.c_str(), static_cast<int>(data.size()));
            buffer_.str("");
            buffer_.clear();
        }
    }
}

void BulkCopy::flush() {
    if (!in_copy_) return;

    // Leave copy mode before anything can throw so the destructor doesn't retry
    in_copy_ = false;

    std::string data = buffer_.str();
    buffer_.str("");
    buffer_.clear();
    if (!data.empty()) {
        db_.copy_data(data.c_str(), static_cast<int>(data.size()));
    }

    db_.copy_end(nullptr);

    std::string cols = column_list();
    std::string temp = quote_identifier(temp_table_name_);

    db_.execute("INSERT INTO " + quote_identifier(table_name_) + " (" + cols + ") "
                "SELECT " + cols + " FROM " + temp +
                " EXCEPT SELECT " + cols + " FROM " + quote_identifier(table_name_));
    db_.execute("DROP TABLE IF EXISTS " + temp);

    row_count_ = 0;
}

} // namespace RdfPg
