/*
 * warden C++17 - Security events
 *
 * The inbound event taxonomy. Leaf subsystems push events into a shared
 * EventQueue; the orchestrator drains it and dispatches each event with
 * std::visit, so adding an event kind is a compile-time checked change.
 */
#ifndef warden_SECURITY_EVENTS_HPP
#define warden_SECURITY_EVENTS_HPP

#include <warden/security/records.hpp>

#include <string>
#include <vector>
#include <deque>
#include <mutex>
#include <variant>
#include <optional>
#include <cstdint>

namespace warden {

// PathGuard classified an attack
struct TraversalAttemptEvent {
    PathTraversalAttempt attempt;
};

// PathGuard rejected a path without classifying an attack
struct UnsafePathEvent {
    std::string attempt_id;
    SafePath result;
    std::optional<std::string> project_id;
    Operation operation;
};

// BoundaryEngine matched a deny/quarantine rule
struct ViolationDetectedEvent {
    BoundaryViolation violation;
};

// BoundaryEngine saw a boundary's content hash change with no recorded activity
struct IntegrityViolationEvent {
    std::string boundary_id;
    BoundaryType boundary_type;
    std::string root_path;
    std::string expected_hash;
    std::string actual_hash;
    std::optional<std::string> project_id;
};

struct ThreatDetectedEvent {
    std::string project_id;
    std::string rule_id;
    std::string threat_category;
    Severity severity;
    double confidence;
    std::string pattern;
    std::vector<std::string> matched_activity;
};

// A project's integrity score dropped below the compromise threshold
struct BoundaryCompromisedEvent {
    std::string project_id;
    std::string boundary_id;
    double integrity_score;
    int verification_failures;
};

struct ProjectQuarantinedEvent {
    std::string project_id;
    std::string reason;
};

struct SecurityAlertEvent {
    std::string project_id;
    std::string source;
    std::string message;
    Severity severity;
};

// ZeroTrustIsolation refused a per-access check
struct UnauthorizedAccessEvent {
    std::string project_id;
    Operation operation;
    std::string target_path;
    std::string reason;
};

using EventPayload = std::variant<
    TraversalAttemptEvent,
    UnsafePathEvent,
    ViolationDetectedEvent,
    IntegrityViolationEvent,
    ThreatDetectedEvent,
    BoundaryCompromisedEvent,
    ProjectQuarantinedEvent,
    SecurityAlertEvent,
    UnauthorizedAccessEvent>;

struct SecurityEvent {
    uint64_t id;
    int64_t timestamp_ms;
    EventPayload payload;
};

// Event kind name ("traversalAttempt", "violationDetected", ...)
std::string event_kind(const EventPayload& payload);

Json to_json(const SecurityEvent& event);

class EventQueue {
public:
    EventQueue();

    // Returns the id assigned to the event (ids increase monotonically)
    uint64_t push(EventPayload payload);

    // Id of the most recently pushed event (0 if none)
    uint64_t last_id() const;

    std::vector<SecurityEvent> drain();
    size_t size() const;
    bool empty() const;

private:
    mutable std::mutex mutex_;
    std::deque<SecurityEvent> queue_;
    uint64_t next_id_;
};

} // namespace warden

#endif // warden_SECURITY_EVENTS_HPP
