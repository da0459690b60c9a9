#include "config_manager.h"
#include "logger.h"
#include <filesystem>

namespace zc {

ConfigManager::ConfigManager()
    : db_(nullptr) {
}

ConfigManager::~ConfigManager() {
    closeLocked();
}

ConfigManager& ConfigManager::getInstance() {
    static ConfigManager instance;
    return instance;
}

bool ConfigManager::initialize(const std::string& dbPath) {
    std::lock_guard<std::mutex> lock(mutex_);

    closeLocked();
    dbPath_ = dbPath;

    if (dbPath_ != ":memory:") {
        auto dir = std::filesystem::path(dbPath_).parent_path();
        std::error_code ec;
        if (!dir.empty() && !std::filesystem::exists(dir, ec)) {
            std::filesystem::create_directories(dir, ec);
            if (ec) {
                LOG_ERROR("ConfigManager", "Cannot create directory " + dir.string() + ": " + ec.message());
                return false;
            }
        }
    }

    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    if (sqlite3_open_v2(dbPath_.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
        LOG_ERROR("ConfigManager", "Cannot open database " + dbPath_ + ": " + getLastError());
        closeLocked();
        return false;
    }

    char* errMsg = nullptr;
    if (sqlite3_exec(db_, "PRAGMA journal_mode = WAL; PRAGMA synchronous = NORMAL;",
                     nullptr, nullptr, &errMsg) != SQLITE_OK) {
        LOG_WARN("ConfigManager", "Failed to set pragmas: " + std::string(errMsg ? errMsg : "unknown error"));
        sqlite3_free(errMsg);
    }

    if (!createTables()) {
        LOG_ERROR("ConfigManager", "Failed to create tables");
        closeLocked();
        return false;
    }

    loadCache();
    LOG_INFO("ConfigManager", "Settings database opened at " + dbPath_ +
             " (" + std::to_string(cache_.size()) + " keys)");
    return true;
}

void ConfigManager::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closeLocked();
}

void ConfigManager::closeLocked() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
    cache_.clear();
}

ConfigManager::Statement ConfigManager::prepare(const char* sql) {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR("ConfigManager", "Failed to prepare query: " + getLastError());
        sqlite3_finalize(stmt);
        return Statement();
    }
    return Statement(stmt);
}

bool ConfigManager::createTables() {
    return executeSQL(
        "CREATE TABLE IF NOT EXISTS config ("
        "   key TEXT PRIMARY KEY,"
        "   value TEXT NOT NULL,"
        "   updated_at INTEGER NOT NULL"
        ");");
}

bool ConfigManager::executeSQL(const char* sql) {
    char* errMsg = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &errMsg) != SQLITE_OK) {
        LOG_ERROR("ConfigManager", "SQL error: " + std::string(errMsg ? errMsg : "unknown error"));
        sqlite3_free(errMsg);
        return false;
    }
    return true;
}

std::string ConfigManager::getLastError() const {
    if (!db_) {
        return "Database not initialized";
    }
    return sqlite3_errmsg(db_);
}

void ConfigManager::loadCache() {
    cache_.clear();

    Statement stmt = prepare("SELECT key, value FROM config;");
    if (!stmt) {
        return;
    }

    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        std::string key = reinterpret_cast<const char*>(sqlite3_column_text(stmt.get(), 0));
        std::string text = reinterpret_cast<const char*>(sqlite3_column_text(stmt.get(), 1));

        try {
            cache_[key] = nlohmann::json::parse(text);
        } catch (const nlohmann::json::parse_error& e) {
            LOG_WARN("ConfigManager", "Stored value of " + key + " is not JSON, keeping it as text: " + e.what());
            cache_[key] = text;
        }
    }
}

nlohmann::json ConfigManager::getConfig(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = cache_.find(key);
    if (it != cache_.end()) {
        return it->second;
    }
    return nlohmann::json();
}

bool ConfigManager::setConfig(const std::string& key, const nlohmann::json& value) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!db_) {
        LOG_ERROR("ConfigManager", "Database not initialized");
        return false;
    }

    Statement stmt = prepare(
        "INSERT INTO config (key, value, updated_at) "
        "VALUES (?, ?, strftime('%s','now')) "
        "ON CONFLICT (key) DO UPDATE SET "
        "value = excluded.value, "
        "updated_at = excluded.updated_at;");
    if (!stmt) {
        return false;
    }

    const std::string text = value.dump();
    sqlite3_bind_text(stmt.get(), 1, key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt.get(), 2, text.c_str(), -1, SQLITE_TRANSIENT);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        LOG_ERROR("ConfigManager", "Failed to store " + key + ": " + getLastError());
        return false;
    }

    cache_[key] = value;
    return true;
}

bool ConfigManager::deleteConfig(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!db_) {
        LOG_ERROR("ConfigManager", "Database not initialized");
        return false;
    }

    Statement stmt = prepare("DELETE FROM config WHERE key = ?;");
    if (!stmt) {
        return false;
    }

    sqlite3_bind_text(stmt.get(), 1, key.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        LOG_ERROR("ConfigManager", "Failed to delete " + key + ": " + getLastError());
        return false;
    }

    cache_.erase(key);
    return true;
}

nlohmann::json ConfigManager::getAllConfig() {
    std::lock_guard<std::mutex> lock(mutex_);

    nlohmann::json result = nlohmann::json::object();
    for (const auto& pair : cache_) {
        result[pair.first] = pair.second;
    }
    return result;
}

bool ConfigManager::isReady() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return db_ != nullptr;
}

std::string ConfigManager::getDatabasePath() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dbPath_;
}

} // namespace zc
