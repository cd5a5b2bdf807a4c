/*
 * warden C++17 - Incident archive Implementation
 */
#include <warden/security/incident_store.hpp>
#include <warden/core/logger.hpp>
#include <warden/core/utils.hpp>

namespace warden {

IncidentStore::IncidentStore() : db_(nullptr) {}

IncidentStore::~IncidentStore() {
    close();
}

bool IncidentStore::open(const std::string& db_path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }

    if (!create_parent_directory(db_path)) {
        LOG_ERROR("[IncidentStore] Failed to create parent directory for '%s'", db_path.c_str());
        return false;
    }

    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        LOG_ERROR("[IncidentStore] Failed to open database '%s': %s",
                  db_path.c_str(), db_ ? sqlite3_errmsg(db_) : "out of memory");
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    exec_sql("PRAGMA journal_mode=WAL");
    exec_sql("PRAGMA synchronous=NORMAL");
    exec_sql("PRAGMA busy_timeout=5000");

    if (!init_tables()) {
        LOG_ERROR("[IncidentStore] Failed to initialize tables");
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    LOG_INFO("[IncidentStore] Database opened: %s", db_path.c_str());
    return true;
}

void IncidentStore::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool IncidentStore::exec_sql(const std::string& sql) {
    if (!db_) return false;

    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        LOG_ERROR("[IncidentStore] SQL error: %s\n  Query: %s",
                  err_msg ? err_msg : "unknown", sql.c_str());
        if (err_msg) sqlite3_free(err_msg);
        return false;
    }
    return true;
}

bool IncidentStore::init_tables() {
    bool ok = exec_sql(
        "CREATE TABLE IF NOT EXISTS incidents ("
        "  id TEXT PRIMARY KEY,"
        "  timestamp INTEGER NOT NULL,"
        "  type TEXT NOT NULL,"
        "  severity TEXT NOT NULL,"
        "  source TEXT NOT NULL,"
        "  project_id TEXT,"
        "  description TEXT NOT NULL,"
        "  status TEXT NOT NULL,"
        "  resolved_at INTEGER,"
        "  payload TEXT NOT NULL"
        ")"
    );
    if (!ok) return false;

    exec_sql("CREATE INDEX IF NOT EXISTS idx_incidents_timestamp ON incidents(timestamp)");
    exec_sql("CREATE INDEX IF NOT EXISTS idx_incidents_project ON incidents(project_id)");
    return true;
}

bool IncidentStore::insert(const SecurityIncident& incident) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return false;

    const char* sql =
        "INSERT INTO incidents (id, timestamp, type, severity, source, project_id,"
        " description, status, resolved_at, payload)"
        " VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERROR("[IncidentStore] insert prepare failed: %s", sqlite3_errmsg(db_));
        return false;
    }

    std::string type = to_string(incident.incident_type);
    std::string severity = to_string(incident.severity);
    std::string status = to_string(incident.status);
    std::string description = sanitize_utf8(incident.description);
    std::string payload = dump_json(to_json(incident));

    sqlite3_bind_text(stmt, 1, incident.id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 2, incident.timestamp_ms);
    sqlite3_bind_text(stmt, 3, type.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 4, severity.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 5, incident.source_system.c_str(), -1, SQLITE_TRANSIENT);
    if (incident.project_id) {
        sqlite3_bind_text(stmt, 6, incident.project_id->c_str(), -1, SQLITE_TRANSIENT);
    } else {
        sqlite3_bind_null(stmt, 6);
    }
    sqlite3_bind_text(stmt, 7, description.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 8, status.c_str(), -1, SQLITE_TRANSIENT);
    if (incident.resolved_at_ms) {
        sqlite3_bind_int64(stmt, 9, *incident.resolved_at_ms);
    } else {
        sqlite3_bind_null(stmt, 9);
    }
    sqlite3_bind_text(stmt, 10, payload.c_str(), -1, SQLITE_TRANSIENT);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        LOG_ERROR("[IncidentStore] insert step failed: %s", sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

bool IncidentStore::update(const SecurityIncident& incident) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return false;

    const char* sql = "UPDATE incidents SET status = ?, resolved_at = ?, payload = ? WHERE id = ?";
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERROR("[IncidentStore] update prepare failed: %s", sqlite3_errmsg(db_));
        return false;
    }

    std::string status = to_string(incident.status);
    std::string payload = dump_json(to_json(incident));
    sqlite3_bind_text(stmt, 1, status.c_str(), -1, SQLITE_TRANSIENT);
    if (incident.resolved_at_ms) {
        sqlite3_bind_int64(stmt, 2, *incident.resolved_at_ms);
    } else {
        sqlite3_bind_null(stmt, 2);
    }
    sqlite3_bind_text(stmt, 3, payload.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 4, incident.id.c_str(), -1, SQLITE_TRANSIENT);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        LOG_ERROR("[IncidentStore] update step failed: %s", sqlite3_errmsg(db_));
        return false;
    }
    return sqlite3_changes(db_) > 0;
}

std::optional<Json> IncidentStore::load(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return std::nullopt;

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, "SELECT payload FROM incidents WHERE id = ?", -1, &stmt, nullptr);
    if (rc != SQLITE_OK) return std::nullopt;
    sqlite3_bind_text(stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT);

    std::optional<Json> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        Json parsed = Json::parse(text ? text : "", nullptr, false);
        if (!parsed.is_discarded()) {
            result = parsed;
        }
    }
    sqlite3_finalize(stmt);
    return result;
}

std::vector<Json> IncidentStore::recent(int limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Json> out;
    if (!db_) return out;

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_,
        "SELECT payload FROM incidents ORDER BY timestamp DESC, rowid DESC LIMIT ?",
        -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERROR("[IncidentStore] recent prepare failed: %s", sqlite3_errmsg(db_));
        return out;
    }
    sqlite3_bind_int(stmt, 1, limit);
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        Json parsed = Json::parse(text ? text : "", nullptr, false);
        if (!parsed.is_discarded()) {
            out.push_back(parsed);
        }
    }
    sqlite3_finalize(stmt);
    return out;
}

int64_t IncidentStore::count() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return 0;

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM incidents", -1, &stmt, nullptr) != SQLITE_OK) {
        return 0;
    }
    int64_t n = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        n = sqlite3_column_int64(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return n;
}

} // namespace warden
