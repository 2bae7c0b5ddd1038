/**
 * @file postgres_connection.hpp
 * @brief PostgreSQL connection and query interface
 */

#pragma once

#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <libpq-fe.h>

namespace RdfPg {

/**
 * @brief Backend unreachable or authentication failure
 */
class ConnectionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Statement rejected by the backend (malformed SQL, type mismatch, ...)
 */
class QueryError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// One result row in text format. SQL NULL reads as an empty string.
using Row = std::vector<std::string>;

/**
 * @brief Pull-style source of result rows
 */
class RowSource {
public:
    virtual ~RowSource() = default;

    /**
     * @brief Fetch the next row
     * @return false once the source is exhausted
     */
    virtual bool next(Row& row) = 0;
};

class ResultStream;

/**
 * @brief PostgreSQL connection wrapper
 *
 * Every query is sent with native bound parameters ($1, $2, ...) through
 * PQexecParams; values are never spliced into the statement text.
 */
class PostgresConnection {
public:
    /**
     * @brief Connect with explicit connection string
     * @throws ConnectionError when the backend rejects the connection
     */
    explicit PostgresConnection(const std::string& conninfo);

    ~PostgresConnection();

    // No copy
    PostgresConnection(const PostgresConnection&) = delete;
    PostgresConnection& operator=(const PostgresConnection&) = delete;

    // Move OK
    PostgresConnection(PostgresConnection&& other) noexcept;
    PostgresConnection& operator=(PostgresConnection&& other) noexcept;

    /**
     * @brief Check if connected
     */
    bool is_connected() const;

    /**
     * @brief Execute query (no results expected)
     */
    void execute(const std::string& sql);

    /**
     * @brief Execute query with parameters (no results)
     */
    void execute(const std::string& sql, const std::vector<std::string>& params);

    /**
     * @brief Execute query and return the first column of the first row
     */
    std::optional<std::string> query_single(const std::string& sql, const std::vector<std::string>& params);

    /**
     * @brief Execute query with params and iterate rows
     * @param callback Called for each row: callback(row_data)
     */
    void query(const std::string& sql, const std::vector<std::string>& params,
               std::function<void(const Row&)> callback);

    /**
     * @brief Execute query in single-row mode and hand back a lazy row stream
     *
     * The connection is busy until the stream is exhausted or destroyed.
     */
    ResultStream stream(const std::string& sql, const std::vector<std::string>& params);

    /**
     * @brief Send a chunk of COPY FROM STDIN data
     */
    void copy_data(const char* buffer, int nbytes);

    /**
     * @brief Finish a COPY FROM STDIN, optionally aborting it with an error message
     */
    void copy_end(const char* error_msg);

    /**
     * @brief Escape a value as a SQL string literal (for DDL that takes no parameters)
     */
    std::string quote_literal(const std::string& value) const;

    void begin();
    void commit();
    void rollback();

    /**
     * @brief RAII transaction guard
     *
     * Rolls back on destruction unless committed. Savepoints let a single
     * failing statement be undone without aborting the whole transaction.
     */
    class Transaction {
    public:
        explicit Transaction(PostgresConnection& conn);
        ~Transaction();

        Transaction(const Transaction&) = delete;
        Transaction& operator=(const Transaction&) = delete;

        void commit();

        /**
         * @brief Run one statement under a savepoint
         * @return false if the statement failed and was rolled back to the savepoint
         */
        bool try_execute(const std::string& sql, std::string* error = nullptr);

    private:
        PostgresConnection& conn_;
        bool committed_ = false;
    };

private:
    friend class ResultStream;

    void connect(const std::string& conninfo);
    void disconnect();
    void ensure_ready() const;
    void check_result(PGresult* result);
    PGresult* exec_params(const std::string& sql, const std::vector<std::string>& params);

    PGconn* conn_ = nullptr;
    std::string last_error_;
    bool streaming_ = false;
};

/**
 * @brief Lazily fetched rows of one single-row-mode query
 *
 * Move-only. Destroying an unfinished stream drains the remaining rows so
 * the connection can be reused.
 */
class ResultStream : public RowSource {
public:
    ResultStream(ResultStream&& other) noexcept;
    ResultStream& operator=(ResultStream&& other) = delete;
    ResultStream(const ResultStream&) = delete;
    ResultStream& operator=(const ResultStream&) = delete;
    ~ResultStream() override;

    bool next(Row& row) override;

private:
    friend class PostgresConnection;
    explicit ResultStream(PostgresConnection* conn);

    void drain() noexcept;

    PostgresConnection* conn_;
    bool done_ = false;
};

} // namespace RdfPg
