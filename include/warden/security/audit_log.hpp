#ifndef warden_SECURITY_AUDIT_LOG_HPP
#define warden_SECURITY_AUDIT_LOG_HPP

#include <warden/security/incident.hpp>

#include <string>
#include <mutex>

namespace warden {

// Append-only NDJSON incident log, one line per incident
class AuditLog {
public:
    explicit AuditLog(const std::string& path);

    bool record(const SecurityIncident& incident);

    const std::string& path() const { return path_; }

private:
    std::string path_;
    std::mutex mutex_;
};

} // namespace warden

#endif // warden_SECURITY_AUDIT_LOG_HPP
