/*
 * warden C++17 - Incident archive
 *
 * SQLite table holding every incident ever created. Rows are inserted on
 * creation and updated on status change; nothing is ever deleted.
 */
#ifndef warden_SECURITY_INCIDENT_STORE_HPP
#define warden_SECURITY_INCIDENT_STORE_HPP

#include <warden/security/incident.hpp>

#include <string>
#include <vector>
#include <mutex>
#include <optional>
#include <sqlite3.h>

namespace warden {

class IncidentStore {
public:
    IncidentStore();
    ~IncidentStore();

    IncidentStore(const IncidentStore&) = delete;
    IncidentStore& operator=(const IncidentStore&) = delete;

    bool open(const std::string& db_path);
    void close();
    bool is_open() const { return db_ != nullptr; }

    bool insert(const SecurityIncident& incident);
    bool update(const SecurityIncident& incident);

    // Stored JSON rendering of one incident
    std::optional<Json> load(const std::string& id);

    // Newest first
    std::vector<Json> recent(int limit);
    int64_t count();

private:
    bool exec_sql(const std::string& sql);
    bool init_tables();

    sqlite3* db_;
    std::mutex mutex_;
};

} // namespace warden

#endif // warden_SECURITY_INCIDENT_STORE_HPP
