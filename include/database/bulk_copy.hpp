#pragma once

#include <database/postgres_connection.hpp>
#include <atomic>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace RdfPg {

/**
 * @brief Simple helper to stream many rows into Postgres using COPY.
 *
 * Usage:
 *   BulkCopy bc(conn);
 *   bc.begin_table("table", {"col1","col2",...});
 *   for (...) bc.add_row({...});
 *   bc.flush(); // or rely on destructor to flush as a best-effort
 *
 * Notes:
 * - begin_table must be called before add_row.
 * - flush() finishes the COPY and inserts the data.
 * - Column names are quoted; pass them exactly as stored (lower case).
 * - This class is not thread-safe; use one instance per connection/thread.
 *
 * Rows are COPYed into a temp table, then merged with
 * INSERT ... SELECT ... EXCEPT SELECT ..., so rows already present in the
 * target (or repeated in the batch) are not inserted twice.
 */
class BulkCopy {
public:
    explicit BulkCopy(PostgresConnection& db) noexcept;
    ~BulkCopy();

    // Prepare for a target table and column list. Call once before add_row.
    void begin_table(const std::string& table_name, const std::vector<std::string>& columns);

    // Add a row. Missing trailing values and nullopt become NULL.
    void add_row(const std::vector<std::optional<std::string>>& values);

    // Flush remaining rows, finish COPY, and insert into the target table.
    void flush();

private:
    void start_copy_if_needed();

    void escape_value_into_buffer(const std::string& value);
    std::string quote_identifier(const std::string& id) const;
    std::string column_list() const;

    PostgresConnection& db_;
    std::ostringstream buffer_;

    std::string table_name_;
    std::vector<std::string> columns_;
    std::string temp_table_name_;
    size_t row_count_ = 0;
    bool in_copy_ = false;

    static std::atomic<uint64_t> s_counter_;
    static constexpr size_t DEFAULT_FLUSH_ROWS = 50000;
};

} // namespace RdfPg
