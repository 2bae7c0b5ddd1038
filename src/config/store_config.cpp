/**
 * @file store_config.cpp
 * @brief Configuration parsing and libpq connection string rendering
 */

#include <config/store_config.hpp>
#include <utils/logger.hpp>
#include <cctype>
#include <fstream>
#include <map>
#include <sstream>

namespace RdfPg {

namespace {

// libpq conninfo quoting: wrap in single quotes, escape \ and '
std::string conninfo_value(const std::string& value) {
    std::string out;
    out.reserve(value.size() + 2);
    out.push_back('\'');
    for (char c : value) {
        if (c == '\\' || c == '\'') out.push_back('\\');
        out.push_back(c);
    }
    out.push_back('\'');
    return out;
}

std::string trim(const std::string& s) {
    size_t start = 0;
    size_t end = s.size();
    while (start < end && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

StoreConfig from_map(const std::map<std::string, std::string>& kv) {
    StoreConfig config;

    for (const char* key : {"user", "dbname"}) {
        if (!kv.count(key)) {
            throw ConfigError(std::string("Missing required configuration key: ") + key);
        }
    }

    for (const auto& [key, value] : kv) {
        if (key == "user") config.user = value;
        else if (key == "dbname") config.dbname = value;
        else if (key == "password") config.password = value;
        else if (key == "host") config.host = value;
        else if (key == "port") config.port = StoreConfig::parse_port(value);
        else if (key == "sslmode") config.sslmode = value;
        else Logger::warn("Ignoring unknown configuration key: " + key);
    }

    return config;
}

} // namespace

int StoreConfig::parse_port(const std::string& text) {
    std::string value = trim(text);
    if (value.empty()) {
        throw ConfigError("PostgreSQL port must be a valid integer");
    }

    long port = 0;
    for (char c : value) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw ConfigError("PostgreSQL port must be a valid integer: " + value);
        }
        port = port * 10 + (c - '0');
        if (port > 65535) {
            throw ConfigError("PostgreSQL port out of range: " + value);
        }
    }

    if (port == 0) {
        throw ConfigError("PostgreSQL port out of range: " + value);
    }
    return static_cast<int>(port);
}

StoreConfig StoreConfig::parse(const std::string& config_string) {
    std::map<std::string, std::string> kv;

    const size_t n = config_string.size();
    size_t i = 0;
    auto skip_space = [&] {
        while (i < n && std::isspace(static_cast<unsigned char>(config_string[i]))) ++i;
    };

    while (true) {
        skip_space();
        if (i >= n) break;

        size_t start = i;
        while (i < n && config_string[i] != '=' && !std::isspace(static_cast<unsigned char>(config_string[i]))) ++i;
        std::string key = config_string.substr(start, i - start);

        if (i >= n || config_string[i] != '=') {
            Logger::warn("Ignoring malformed configuration entry: " + key);
            continue;
        }
        ++i;

        std::string value;
        if (i < n && config_string[i] == '\'') {
            ++i;
            bool closed = false;
            while (i < n) {
                char c = config_string[i++];
                if (c == '\\' && i < n) {
                    value.push_back(config_string[i++]);
                } else if (c == '\'') {
                    closed = true;
                    break;
                } else {
                    value.push_back(c);
                }
            }
            if (!closed) {
                throw ConfigError("Unterminated quoted value for configuration key: " + key);
            }
        } else {
            while (i < n && !std::isspace(static_cast<unsigned char>(config_string[i]))) {
                value.push_back(config_string[i++]);
            }
        }

        kv[key] = value;
    }

    return from_map(kv);
}

StoreConfig StoreConfig::from_json(const nlohmann::json& doc) {
    if (!doc.is_object()) {
        throw ConfigError("Store configuration must be a JSON object");
    }

    std::map<std::string, std::string> kv;
    for (const auto& [key, value] : doc.items()) {
        if (value.is_string()) {
            kv[key] = value.get<std::string>();
        } else if (value.is_number_integer()) {
            kv[key] = std::to_string(value.get<long long>());
        } else {
            throw ConfigError("Configuration key '" + key + "' must be a string or integer");
        }
    }

    return from_map(kv);
}

StoreConfig StoreConfig::load_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigError("Cannot open configuration file: " + path);
    }

    nlohmann::json doc;
    try {
        file >> doc;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("Malformed configuration file " + path + ": " + e.what());
    }

    return from_json(doc);
}

std::string StoreConfig::to_conninfo() const {
    std::ostringstream conninfo;

    conninfo << "dbname=" << conninfo_value(dbname)
             << " user=" << conninfo_value(user)
             << " password=" << conninfo_value(password);

    if (host) {
        conninfo << " host=" << conninfo_value(*host);
    }
    conninfo << " port=" << port;
    if (sslmode) {
        conninfo << " sslmode=" << conninfo_value(*sslmode);
    }

    return conninfo.str();
}

} // namespace RdfPg
