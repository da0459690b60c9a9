#pragma once

#include <string>
#include <memory>
#include <nlohmann/json.hpp>
#include <sqlite3.h>
#include <mutex>
#include <unordered_map>

namespace zc {

/**
 * @brief Persistent key/value store for engine settings
 *
 * Values are stored as JSON text in the `config` table of a SQLite
 * database and cached in memory. Zone and line state is never stored here.
 */
class ConfigManager {
public:
    /**
     * @brief Get the singleton instance
     *
     * @return ConfigManager& The singleton instance
     */
    static ConfigManager& getInstance();

    /**
     * @brief Open (or create) the settings database
     *
     * Any previously opened database is closed first. ":memory:" opens a
     * private in-memory database.
     *
     * @param dbPath Path to SQLite database file
     * @return true if initialization succeeded, false otherwise
     */
    bool initialize(const std::string& dbPath);

    /**
     * @brief Close the database and drop the cache
     */
    void close();

    /**
     * @brief Get the value stored for a key
     *
     * @param key Setting key
     * @return nlohmann::json Stored value, null if not found
     */
    nlohmann::json getConfig(const std::string& key);

    /**
     * @brief Store a value for a key, replacing any previous value
     *
     * @return true if successful, false otherwise
     */
    bool setConfig(const std::string& key, const nlohmann::json& value);

    /**
     * @brief Remove a key
     *
     * @return true if successful (including when the key did not exist)
     */
    bool deleteConfig(const std::string& key);

    /**
     * @brief All stored settings as one object
     */
    nlohmann::json getAllConfig();

    bool isReady() const;
    std::string getDatabasePath() const;

private:
    ConfigManager();
    ~ConfigManager();

    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;
    ConfigManager(ConfigManager&&) = delete;
    ConfigManager& operator=(ConfigManager&&) = delete;

    struct StatementDeleter {
        void operator()(sqlite3_stmt* stmt) const { sqlite3_finalize(stmt); }
    };
    using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

    Statement prepare(const char* sql);
    bool createTables();
    bool executeSQL(const char* sql);
    std::string getLastError() const;
    void closeLocked();
    void loadCache();

    sqlite3* db_;                              ///< SQLite database handle
    std::string dbPath_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, nlohmann::json> cache_;
};

} // namespace zc
