/**
 * @file store_config.hpp
 * @brief Backend connection configuration for a triple store
 */

#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>

namespace RdfPg {

/**
 * @brief Missing required key, malformed port or unreadable configuration
 */
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Connection settings for the PostgreSQL backend
 *
 * Required: user, dbname. Optional: password (default empty), host,
 * port (default 5432), sslmode.
 */
struct StoreConfig {
    static constexpr int DEFAULT_PORT = 5432;

    std::string user;
    std::string dbname;
    std::string password;
    std::optional<std::string> host;
    int port = DEFAULT_PORT;
    std::optional<std::string> sslmode;

    /**
     * @brief Parse a "key1=val1 key2=val2 ..." configuration string
     *
     * As in a libpq conninfo, a value may be single-quoted to hold spaces,
     * with \' and \\ escaping a quote and a backslash inside the quotes.
     * @throws ConfigError on a missing required key, a bad port or an
     *         unterminated quote
     */
    static StoreConfig parse(const std::string& config_string);

    /**
     * @brief Read the same keys from a JSON object
     */
    static StoreConfig from_json(const nlohmann::json& doc);

    /**
     * @brief Read a JSON configuration file
     */
    static StoreConfig load_file(const std::string& path);

    /**
     * @brief Render as a libpq connection string
     */
    std::string to_conninfo() const;

    static int parse_port(const std::string& text);
};

} // namespace RdfPg
