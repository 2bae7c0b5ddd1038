/**
 * @file postgres_connection.cpp
 * @brief PostgreSQL connection implementation
 */

#include <database/postgres_connection.hpp>
#include <utils/logger.hpp>
#include <utility>

namespace RdfPg {

PostgresConnection::PostgresConnection(const std::string& conninfo) {
    connect(conninfo);
}

PostgresConnection::~PostgresConnection() {
    disconnect();
}

PostgresConnection::PostgresConnection(PostgresConnection&& other) noexcept
    : conn_(other.conn_), last_error_(std::move(other.last_error_)), streaming_(other.streaming_) {
    other.conn_ = nullptr;
    other.streaming_ = false;
}

PostgresConnection& PostgresConnection::operator=(PostgresConnection&& other) noexcept {
    if (this != &other) {
        disconnect();
        conn_ = other.conn_;
        last_error_ = std::move(other.last_error_);
        streaming_ = other.streaming_;
        other.conn_ = nullptr;
        other.streaming_ = false;
    }
    return *this;
}

void PostgresConnection::connect(const std::string& conninfo) {
    conn_ = PQconnectdb(conninfo.c_str());

    if (PQstatus(conn_) != CONNECTION_OK) {
        last_error_ = PQerrorMessage(conn_);
        PQfinish(conn_);
        conn_ = nullptr;
        throw ConnectionError("PostgreSQL connection failed: " + last_error_);
    }
}

void PostgresConnection::disconnect() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

bool PostgresConnection::is_connected() const {
    return conn_ && PQstatus(conn_) == CONNECTION_OK;
}

void PostgresConnection::ensure_ready() const {
    if (!is_connected()) {
        throw ConnectionError("Not connected to database");
    }
    if (streaming_) {
        throw QueryError("Connection is busy streaming a result set");
    }
}

void PostgresConnection::check_result(PGresult* result) {
    ExecStatusType status = PQresultStatus(result);

    if (status != PGRES_COMMAND_OK && status != PGRES_TUPLES_OK &&
        status != PGRES_SINGLE_TUPLE && status != PGRES_COPY_IN) {
        last_error_ = PQerrorMessage(conn_);
        PQclear(result);
        throw QueryError("PostgreSQL query failed: " + last_error_);
    }
}

PGresult* PostgresConnection::exec_params(const std::string& sql, const std::vector<std::string>& params) {
    ensure_ready();

    if (Logger::enabled(Logger::Level::Debug)) {
        Logger::debug(sql + (params.empty() ? "" : " [" + std::to_string(params.size()) + " params]"));
    }

    std::vector<const char*> param_values;
    param_values.reserve(params.size());
    for (const auto& p : params) {
        param_values.push_back(p.c_str());
    }

    PGresult* result = PQexecParams(
        conn_,
        sql.c_str(),
        static_cast<int>(params.size()),
        nullptr,
        param_values.data(),
        nullptr,
        nullptr,
        0  // Text format
    );

    check_result(result);
    return result;
}

void PostgresConnection::execute(const std::string& sql) {
    execute(sql, {});
}

void PostgresConnection::execute(const std::string& sql, const std::vector<std::string>& params) {
    PGresult* result = exec_params(sql, params);
    PQclear(result);
}

std::optional<std::string> PostgresConnection::query_single(const std::string& sql, const std::vector<std::string>& params) {
    PGresult* result = exec_params(sql, params);

    std::optional<std::string> value;

    if (PQntuples(result) > 0 && PQnfields(result) > 0 && !PQgetisnull(result, 0, 0)) {
        value = PQgetvalue(result, 0, 0);
    }

    PQclear(result);
    return value;
}

void PostgresConnection::query(const std::string& sql, const std::vector<std::string>& params,
                               std::function<void(const Row&)> callback) {
    PGresult* result = exec_params(sql, params);

    int nrows = PQntuples(result);
    int nfields = PQnfields(result);

    try {
        for (int i = 0; i < nrows; ++i) {
            Row row;
            row.reserve(nfields);

            for (int j = 0; j < nfields; ++j) {
                row.push_back(PQgetvalue(result, i, j));
            }

            callback(row);
        }
    } catch (const std::exception&) {
        PQclear(result);
        throw;
    }

    PQclear(result);
}

ResultStream PostgresConnection::stream(const std::string& sql, const std::vector<std::string>& params) {
    ensure_ready();

    if (Logger::enabled(Logger::Level::Debug)) {
        Logger::debug("stream: " + sql);
    }

    std::vector<const char*> param_values;
    param_values.reserve(params.size());
    for (const auto& p : params) {
        param_values.push_back(p.c_str());
    }

    if (PQsendQueryParams(conn_, sql.c_str(), static_cast<int>(params.size()), nullptr,
                          param_values.data(), nullptr, nullptr, 0) == 0) {
        last_error_ = PQerrorMessage(conn_);
        throw QueryError("PQsendQueryParams failed: " + last_error_);
    }

    streaming_ = true;
    ResultStream rows(this);

    if (PQsetSingleRowMode(conn_) == 0) {
        throw QueryError("PQsetSingleRowMode failed");
    }

    return rows;
}

void PostgresConnection::copy_data(const char* buffer, int nbytes) {
    if (!is_connected()) {
        throw ConnectionError("Not connected to database");
    }

    int result = PQputCopyData(conn_, buffer, nbytes);
    if (result == -1) {
        last_error_ = PQerrorMessage(conn_);
        throw QueryError("COPY data failed: " + last_error_);
    }
}

void PostgresConnection::copy_end(const char* error_msg) {
    if (!is_connected()) {
        throw ConnectionError("Not connected to database");
    }

    int result = PQputCopyEnd(conn_, error_msg);
    if (result == -1) {
        last_error_ = PQerrorMessage(conn_);
        throw QueryError("COPY end failed: " + last_error_);
    }

    // After sending end, we must get the final result
    PGresult* res = PQgetResult(conn_);
    check_result(res);
    PQclear(res);

    // Consume the trailing NULL result
    while ((res = PQgetResult(conn_)) != nullptr) {
        PQclear(res);
    }
}

std::string PostgresConnection::quote_literal(const std::string& value) const {
    if (!conn_) {
        throw ConnectionError("Not connected to database");
    }

    char* escaped = PQescapeLiteral(conn_, value.c_str(), value.size());
    if (!escaped) {
        throw QueryError("PQescapeLiteral failed: " + std::string(PQerrorMessage(conn_)));
    }

    std::string out(escaped);
    PQfreemem(escaped);
    return out;
}

void PostgresConnection::begin() {
    execute("BEGIN");
}

void PostgresConnection::commit() {
    execute("COMMIT");
}

void PostgresConnection::rollback() {
    execute("ROLLBACK");
}

// Transaction RAII
PostgresConnection::Transaction::Transaction(PostgresConnection& conn) : conn_(conn) {
    conn_.begin();
}

PostgresConnection::Transaction::~Transaction() {
    if (!committed_) {
        try {
            conn_.rollback();
        } catch (const std::exception& e) {
            Logger::warn(std::string("Rollback during unwind failed: ") + e.what());
        }
    }
}

void PostgresConnection::Transaction::commit() {
    conn_.commit();
    committed_ = true;
}

bool PostgresConnection::Transaction::try_execute(const std::string& sql, std::string* error) {
    conn_.execute("SAVEPOINT rdfpg_step");
    try {
        conn_.execute(sql);
    } catch (const QueryError& e) {
        if (error) *error = e.what();
        conn_.execute("ROLLBACK TO SAVEPOINT rdfpg_step");
        return false;
    }
    conn_.execute("RELEASE SAVEPOINT rdfpg_step");
    return true;
}

// ResultStream
ResultStream::ResultStream(PostgresConnection* conn) : conn_(conn) {}

ResultStream::ResultStream(ResultStream&& other) noexcept
    : conn_(other.conn_), done_(other.done_) {
    other.conn_ = nullptr;
    other.done_ = true;
}

ResultStream::~ResultStream() {
    drain();
}

bool ResultStream::next(Row& row) {
    if (done_ || !conn_) return false;

    PGresult* res;
    while ((res = PQgetResult(conn_->conn_)) != nullptr) {
        ExecStatusType status = PQresultStatus(res);

        if (status == PGRES_SINGLE_TUPLE) {
            int nfields = PQnfields(res);
            row.clear();
            row.reserve(nfields);
            for (int i = 0; i < nfields; ++i) {
                row.push_back(PQgetvalue(res, 0, i));
            }
            PQclear(res);
            return true;
        }

        if (status != PGRES_TUPLES_OK) {
            // PGRES_TUPLES_OK marks the end of the result set
            try {
                conn_->check_result(res);
            } catch (const QueryError&) {
                drain();
                throw;
            }
        }
        PQclear(res);
    }

    done_ = true;
    conn_->streaming_ = false;
    return false;
}

void ResultStream::drain() noexcept {
    if (!conn_ || done_) return;

    PGresult* res;
    while ((res = PQgetResult(conn_->conn_)) != nullptr) {
        PQclear(res);
    }
    done_ = true;
    conn_->streaming_ = false;
}

} // namespace RdfPg
