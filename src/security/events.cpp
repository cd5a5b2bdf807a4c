/*
 * warden C++17 - Security Events
 */
#include <warden/security/events.hpp>
#include <warden/core/utils.hpp>
#include <iterator>

namespace warden {

namespace {

Json optional_string(const std::optional<std::string>& v) {
    return v ? Json(*v) : Json();
}

struct KindVisitor {
    std::string operator()(const TraversalAttemptEvent&) const { return "traversalAttempt"; }
    std::string operator()(const UnsafePathEvent&) const { return "unsafePath"; }
    std::string operator()(const ViolationDetectedEvent&) const { return "violationDetected"; }
    std::string operator()(const IntegrityViolationEvent&) const { return "integrityViolation"; }
    std::string operator()(const ThreatDetectedEvent&) const { return "threatDetected"; }
    std::string operator()(const BoundaryCompromisedEvent&) const { return "boundaryCompromised"; }
    std::string operator()(const ProjectQuarantinedEvent&) const { return "projectQuarantined"; }
    std::string operator()(const SecurityAlertEvent&) const { return "securityAlert"; }
    std::string operator()(const UnauthorizedAccessEvent&) const { return "unauthorizedAccess"; }
};

struct JsonVisitor {
    Json operator()(const TraversalAttemptEvent& e) const {
        return to_json(e.attempt);
    }
    Json operator()(const UnsafePathEvent& e) const {
        Json j = to_json(e.result);
        j["attempt_id"] = e.attempt_id;
        j["project_id"] = optional_string(e.project_id);
        j["operation"] = to_string(e.operation);
        return j;
    }
    Json operator()(const ViolationDetectedEvent& e) const {
        return to_json(e.violation);
    }
    Json operator()(const IntegrityViolationEvent& e) const {
        return Json{
            {"boundary_id", e.boundary_id},
            {"boundary_type", to_string(e.boundary_type)},
            {"root_path", sanitize_utf8(e.root_path)},
            {"expected_hash", e.expected_hash},
            {"actual_hash", e.actual_hash},
            {"project_id", optional_string(e.project_id)}
        };
    }
    Json operator()(const ThreatDetectedEvent& e) const {
        Json activity = Json::array();
        for (const auto& a : e.matched_activity) {
            activity.push_back(sanitize_utf8(a));
        }
        return Json{
            {"project_id", e.project_id},
            {"rule_id", e.rule_id},
            {"threat_category", e.threat_category},
            {"severity", to_string(e.severity)},
            {"confidence", e.confidence},
            {"pattern", e.pattern},
            {"matched_activity", activity}
        };
    }
    Json operator()(const BoundaryCompromisedEvent& e) const {
        return Json{
            {"project_id", e.project_id},
            {"boundary_id", e.boundary_id},
            {"integrity_score", e.integrity_score},
            {"verification_failures", e.verification_failures}
        };
    }
    Json operator()(const ProjectQuarantinedEvent& e) const {
        return Json{{"project_id", e.project_id}, {"reason", e.reason}};
    }
    Json operator()(const SecurityAlertEvent& e) const {
        return Json{
            {"project_id", e.project_id},
            {"source", e.source},
            {"message", sanitize_utf8(e.message)},
            {"severity", to_string(e.severity)}
        };
    }
    Json operator()(const UnauthorizedAccessEvent& e) const {
        return Json{
            {"project_id", e.project_id},
            {"operation", to_string(e.operation)},
            {"target_path", sanitize_utf8(e.target_path)},
            {"reason", e.reason}
        };
    }
};

} // anonymous namespace

std::string event_kind(const EventPayload& payload) {
    return std::visit(KindVisitor(), payload);
}

Json to_json(const SecurityEvent& event) {
    Json j;
    j["event_id"] = event.id;
    j["kind"] = event_kind(event.payload);
    j["timestamp"] = format_timestamp_ms(event.timestamp_ms);
    j["data"] = std::visit(JsonVisitor(), event.payload);
    return j;
}

// ============================================================================
// EventQueue
// ============================================================================

EventQueue::EventQueue() : next_id_(1) {}

uint64_t EventQueue::push(EventPayload payload) {
    std::lock_guard<std::mutex> lock(mutex_);
    SecurityEvent event;
    event.id = next_id_++;
    event.timestamp_ms = current_timestamp_ms();
    event.payload = std::move(payload);
    queue_.push_back(std::move(event));
    return queue_.back().id;
}

uint64_t EventQueue::last_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return next_id_ - 1;
}

std::vector<SecurityEvent> EventQueue::drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SecurityEvent> out(std::make_move_iterator(queue_.begin()),
                                   std::make_move_iterator(queue_.end()));
    queue_.clear();
    return out;
}

size_t EventQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

bool EventQueue::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.empty();
}

} // namespace warden
