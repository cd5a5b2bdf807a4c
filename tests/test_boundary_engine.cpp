#include "test_util.hpp"

#include <warden/security/boundary_engine.hpp>
#include <warden/security/path_guard.hpp>
#include <warden/core/utils.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <unistd.h>

using namespace warden;

class BoundaryEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_ = test::make_security_config(tmp_);
        guard_ = std::make_unique<PathGuard>(config_, events_);
        engine_ = std::make_unique<BoundaryEngine>(config_, *guard_, events_);

        p1_ = join_path(config_.sandbox_roots.front(), "p1");
        p2_ = join_path(config_.sandbox_roots.front(), "p2");
        ensure_directory(p1_);
        ensure_directory(p2_);
        guard_->register_project_root("p1", p1_);
        guard_->register_project_root("p2", p2_);
        engine_->add_project_boundary("p1", p1_, false);
        engine_->add_project_boundary("p2", p2_, true);
    }

    std::vector<ViolationDetectedEvent> violation_events() {
        std::vector<ViolationDetectedEvent> out;
        for (auto& ev : events_.drain()) {
            if (auto* v = std::get_if<ViolationDetectedEvent>(&ev.payload)) {
                out.push_back(*v);
            }
        }
        return out;
    }

    test::TempDir tmp_;
    SecurityConfig config_;
    EventQueue events_;
    std::unique_ptr<PathGuard> guard_;
    std::unique_ptr<BoundaryEngine> engine_;
    std::string p1_;
    std::string p2_;
};

// ============================================================================
// Registry
// ============================================================================

TEST_F(BoundaryEngineTest, DefaultBoundariesAreSeeded) {
    std::vector<std::string> ids = engine_->boundary_ids();
    EXPECT_NE(std::find(ids.begin(), ids.end(), "framework_core"), ids.end());
    EXPECT_NE(std::find(ids.begin(), ids.end(), "quarantine"), ids.end());
    EXPECT_TRUE(is_directory(config_.quarantine_dir()));
}

TEST_F(BoundaryEngineTest, ProjectBoundaryCarriesItsRuleSet) {
    std::optional<FileSystemBoundary> b = engine_->boundary("project_p1");
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(b->boundary_type, BoundaryType::PROJECT_SANDBOX);
    EXPECT_EQ(b->root_path, p1_);
    ASSERT_TRUE(b->project_id.has_value());
    EXPECT_EQ(*b->project_id, "p1");
    ASSERT_EQ(b->access_rules.size(), 4u);
    EXPECT_EQ(b->forbidden_paths,
              (std::vector<std::string>{join_path(p1_, ".warden/**"), join_path(p1_, ".warden-framework/**")}));

    // Executables are only denied where the project does not allow them
    EXPECT_EQ(b->access_rules[3].rule_id, "proj_deny_executables");
    EXPECT_TRUE(b->access_rules[3].enabled);
    std::optional<FileSystemBoundary> b2 = engine_->boundary("project_p2");
    ASSERT_TRUE(b2.has_value());
    EXPECT_EQ(b2->access_rules[3].rule_id, "proj_deny_executables");
    EXPECT_FALSE(b2->access_rules[3].enabled);

    EXPECT_THROW(engine_->add_project_boundary("p1", p1_, false), std::invalid_argument);
}

TEST_F(BoundaryEngineTest, RemoveProjectBoundary) {
    EXPECT_TRUE(engine_->remove_project_boundary("p2"));
    EXPECT_FALSE(engine_->boundary("project_p2").has_value());
    EXPECT_FALSE(engine_->remove_project_boundary("p2"));
    EXPECT_THROW(engine_->add_rule("project_p2", BoundaryRule()), std::out_of_range);
}

TEST_F(BoundaryEngineTest, ProjectForPathUsesMostSpecificSandbox) {
    EXPECT_EQ(engine_->project_for_path(join_path(p1_, "src/a.ts")), std::optional<std::string>("p1"));
    EXPECT_FALSE(engine_->project_for_path(join_path(config_.framework_root, "core.bin")).has_value());
}

TEST_F(BoundaryEngineTest, ExecutableDetection) {
    EXPECT_TRUE(BoundaryEngine::is_executable_path("/nonexistent/deploy.SH"));
    EXPECT_TRUE(BoundaryEngine::is_executable_path("/nonexistent/setup.ps1"));
    EXPECT_FALSE(BoundaryEngine::is_executable_path("/nonexistent/readme.md"));
}

// ============================================================================
// Filesystem events
// ============================================================================

TEST_F(BoundaryEngineTest, CrossProjectWriteIsRemoved) {
    std::string target = join_path(p2_, "notes.txt");
    ASSERT_TRUE(test::touch(target));

    std::optional<BoundaryViolation> v =
        engine_->handle_filesystem_event(FileEvent(target, FileOperation::CREATE, std::string("p1")));
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->violation_type, "cross_boundary_write");
    EXPECT_EQ(v->rule_id, "proj_deny_cross_access");
    EXPECT_EQ(v->boundary_id, "project_p2");
    EXPECT_EQ(v->severity, Severity::HIGH);
    EXPECT_EQ(v->remediation_action, "delete_artifact");
    EXPECT_EQ(v->source_path, p1_);
    ASSERT_TRUE(v->project_id.has_value());
    EXPECT_EQ(*v->project_id, "p1");
    EXPECT_TRUE(v->blocked);
    EXPECT_FALSE(file_exists(target));

    std::vector<ViolationDetectedEvent> evs = violation_events();
    ASSERT_EQ(evs.size(), 1u);
    EXPECT_EQ(evs[0].violation.id, v->id);
    EXPECT_EQ(engine_->total_violations(), 1u);
}

TEST_F(BoundaryEngineTest, OwnWritesAreAllowed) {
    std::string target = join_path(p1_, "src/index.ts");
    ASSERT_TRUE(test::touch(target));
    EXPECT_FALSE(engine_->handle_filesystem_event(
        FileEvent(target, FileOperation::CREATE, std::string("p1"))).has_value());
    EXPECT_TRUE(file_exists(target));
    EXPECT_TRUE(events_.empty());
}

TEST_F(BoundaryEngineTest, ExecutableCreationDependsOnProjectPolicy) {
    std::string denied = join_path(p1_, "run.sh");
    std::string allowed = join_path(p2_, "run.sh");
    ASSERT_TRUE(test::touch(denied, "#!/bin/sh\n"));
    ASSERT_TRUE(test::touch(allowed, "#!/bin/sh\n"));

    std::optional<BoundaryViolation> v =
        engine_->handle_filesystem_event(FileEvent(denied, FileOperation::CREATE));
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->violation_type, "executable_creation");
    ASSERT_TRUE(v->project_id.has_value());
    EXPECT_EQ(*v->project_id, "p1");
    EXPECT_FALSE(file_exists(denied));

    EXPECT_FALSE(engine_->handle_filesystem_event(FileEvent(allowed, FileOperation::CREATE)).has_value());
    EXPECT_TRUE(file_exists(allowed));
}

TEST_F(BoundaryEngineTest, ForbiddenPathsInsideProject) {
    std::string forbidden = join_path(p1_, ".warden/state.json");
    std::string marker = join_path(p1_, ".warden-project.json");
    ASSERT_TRUE(test::touch(forbidden));
    ASSERT_TRUE(test::touch(marker));

    std::optional<BoundaryViolation> v =
        engine_->handle_filesystem_event(FileEvent(forbidden, FileOperation::CREATE));
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->rule_id, "forbidden_path");
    EXPECT_EQ(v->violation_type, "forbidden_path_access");
    EXPECT_FALSE(file_exists(forbidden));

    EXPECT_FALSE(engine_->handle_filesystem_event(FileEvent(marker, FileOperation::MODIFY)).has_value());
}

TEST_F(BoundaryEngineTest, EscapingSymlinkIsQuarantined) {
    std::string outside = tmp_.sub("outside");
    ASSERT_TRUE(ensure_directory(outside));
    std::string link = join_path(p1_, "escape");
    ASSERT_EQ(symlink(outside.c_str(), link.c_str()), 0);

    std::optional<BoundaryViolation> v =
        engine_->handle_filesystem_event(FileEvent(link, FileOperation::CREATE));
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->rule_id, "proj_prevent_traversal");
    EXPECT_EQ(v->violation_type, "path_traversal");
    EXPECT_EQ(v->severity, Severity::CRITICAL);
    EXPECT_EQ(v->remediation_action, "quarantine_artifact");
    EXPECT_FALSE(is_symlink(link));
    EXPECT_TRUE(is_directory(outside));
}

TEST_F(BoundaryEngineTest, AdvisoryRulesOnlyLog) {
    engine_->add_rule("project_p2", BoundaryRule("p2_audit_deletes", "**", join_path(p2_, "**"),
                                                 RuleAction::DENY, EnforcementLevel::ADVISORY,
                                                 {Condition::DELETE_OPERATION}, 0));
    std::optional<BoundaryViolation> v =
        engine_->handle_filesystem_event(FileEvent(join_path(p2_, "old.txt"), FileOperation::DELETE));
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->remediation_action, "log_violation");
    EXPECT_FALSE(v->blocked);

    std::string log;
    ASSERT_TRUE(read_file(config_.violations_log_path(), log));
    EXPECT_NE(log.find(v->id), std::string::npos);

    EXPECT_TRUE(engine_->set_rule_enabled("project_p2", "p2_audit_deletes", false));
    EXPECT_FALSE(engine_->handle_filesystem_event(
        FileEvent(join_path(p2_, "old.txt"), FileOperation::DELETE)).has_value());
}

TEST_F(BoundaryEngineTest, EventsOutsideEveryBoundaryAreIgnored) {
    EXPECT_FALSE(engine_->handle_filesystem_event(
        FileEvent(tmp_.sub("elsewhere/x.sh"), FileOperation::CREATE, std::string("p1"))).has_value());
    EXPECT_EQ(engine_->last_activity_seq(), 0u);
}

// ============================================================================
// Access gate
// ============================================================================

TEST_F(BoundaryEngineTest, GateRejectsUnsafePathsFirst) {
    AccessDecision d = engine_->validate_file_access("../p2/secret.txt", Operation::READ, "p1");
    EXPECT_FALSE(d.allowed);
    EXPECT_EQ(d.reason, "Path traversal attempt detected: basic_traversal");
    EXPECT_FALSE(d.violation.has_value());

    d = engine_->validate_file_access(join_path(p2_, "secret.txt"), Operation::READ, "p1");
    EXPECT_FALSE(d.allowed);
    EXPECT_EQ(d.reason, "Path outside allowed roots: " + join_path(p2_, "secret.txt"));
}

TEST_F(BoundaryEngineTest, GateAppliesBoundaryRules) {
    AccessDecision d = engine_->validate_file_access("src/app.ts", Operation::WRITE, "p1");
    EXPECT_TRUE(d.allowed);
    EXPECT_EQ(d.reason, "No matching rule");

    d = engine_->validate_file_access("build.sh", Operation::WRITE, "p1");
    EXPECT_FALSE(d.allowed);
    EXPECT_EQ(d.reason, "Denied by rule proj_deny_executables (executable_creation)");
    ASSERT_TRUE(d.violation.has_value());
    EXPECT_EQ(d.violation->remediation_action, "access_denied");
    EXPECT_TRUE(d.violation->blocked);

    // Running a script is a read of an executable, not a creation
    d = engine_->validate_file_access("build.sh", Operation::EXECUTE, "p1");
    EXPECT_TRUE(d.allowed);

    d = engine_->validate_file_access(".warden/state.json", Operation::WRITE, "p1");
    EXPECT_FALSE(d.allowed);
    EXPECT_EQ(d.reason, "Denied by rule forbidden_path (forbidden_path_access)");
}

TEST_F(BoundaryEngineTest, GateAllowsUngovernedRoots) {
    guard_->add_allowed_root(tmp_.sub("scratch"));
    AccessDecision d = engine_->validate_file_access(tmp_.sub("scratch/a.txt"), Operation::WRITE, "p1");
    EXPECT_TRUE(d.allowed);
    EXPECT_EQ(d.reason, "No boundary governs path");
}

TEST_F(BoundaryEngineTest, SharedResourcesAreReadOnlyForProjects) {
    std::string assets = tmp_.sub("assets");
    ASSERT_TRUE(ensure_directory(assets));
    EXPECT_EQ(engine_->add_shared_resource("assets", assets), "shared_assets");

    AccessDecision read = engine_->validate_file_access(join_path(assets, "logo.png"), Operation::READ, "p1");
    EXPECT_TRUE(read.allowed);
    EXPECT_EQ(read.reason, "Allowed by rule shared_read_only");

    AccessDecision write = engine_->validate_file_access(join_path(assets, "logo.png"), Operation::WRITE, "p1");
    EXPECT_FALSE(write.allowed);
    ASSERT_TRUE(write.violation.has_value());
    EXPECT_EQ(write.violation->severity, Severity::MEDIUM);
    EXPECT_EQ(write.violation->violation_type, "cross_boundary_write");
}

TEST_F(BoundaryEngineTest, GateDecisionsAreJournaled) {
    uint64_t before = engine_->last_activity_seq();
    engine_->validate_file_access("src/app.ts", Operation::READ, "p1");
    engine_->validate_file_access("../../etc/passwd", Operation::READ, "p1");

    std::vector<ActivityRecord> recs = engine_->activity_since(before);
    ASSERT_EQ(recs.size(), 2u);
    EXPECT_TRUE(recs[0].allowed);
    EXPECT_TRUE(recs[0].gate);
    EXPECT_EQ(recs[0].zone, "project_sandbox");
    EXPECT_FALSE(recs[1].allowed);
    EXPECT_NE(recs[1].descriptor().find("gate=yes allowed=no"), std::string::npos);
    EXPECT_EQ(engine_->last_activity_seq(), before + 2);
}

// ============================================================================
// Integrity and health
// ============================================================================

TEST_F(BoundaryEngineTest, IntegrityDetectsSilentChanges) {
    EXPECT_THROW(engine_->check_integrity("project_missing"), std::out_of_range);

    ASSERT_TRUE(test::touch(join_path(p1_, "a.txt"), "one"));
    EXPECT_TRUE(engine_->check_integrity("project_p1"));
    EXPECT_FALSE(engine_->boundary("project_p1")->integrity_hash.empty());
    events_.drain();

    ASSERT_TRUE(test::touch(join_path(p1_, "a.txt"), "tampered"));
    EXPECT_FALSE(engine_->check_integrity("project_p1"));

    std::vector<SecurityEvent> evs = events_.drain();
    ASSERT_EQ(evs.size(), 1u);
    const auto* iv = std::get_if<IntegrityViolationEvent>(&evs[0].payload);
    ASSERT_NE(iv, nullptr);
    EXPECT_EQ(iv->boundary_id, "project_p1");
    EXPECT_NE(iv->expected_hash, iv->actual_hash);

    // Rebaselined after reporting
    EXPECT_TRUE(engine_->check_integrity("project_p1"));
}

TEST_F(BoundaryEngineTest, ObservedActivityRebaselines) {
    ASSERT_TRUE(test::touch(join_path(p1_, "a.txt"), "one"));
    ASSERT_TRUE(engine_->check_integrity("project_p1"));

    std::string added = join_path(p1_, "b.txt");
    ASSERT_TRUE(test::touch(added, "two"));
    EXPECT_FALSE(engine_->handle_filesystem_event(FileEvent(added, FileOperation::CREATE)).has_value());
    EXPECT_TRUE(engine_->check_integrity("project_p1"));
    EXPECT_TRUE(events_.empty());
}

TEST_F(BoundaryEngineTest, HealthDropsWithViolationRate) {
    EXPECT_DOUBLE_EQ(engine_->health_score(), 100.0);

    std::string target = join_path(p2_, "x.txt");
    ASSERT_TRUE(test::touch(target));
    engine_->handle_filesystem_event(FileEvent(target, FileOperation::CREATE, std::string("p1")));
    EXPECT_DOUBLE_EQ(engine_->health_score(), 85.0);

    for (int i = 0; i < 4; ++i) {
        engine_->handle_filesystem_event(FileEvent(target, FileOperation::CREATE, std::string("p1")));
    }
    EXPECT_EQ(engine_->total_violations(), 5u);
    EXPECT_DOUBLE_EQ(engine_->health_score(), 70.0);

    Json report = engine_->export_report();
    EXPECT_EQ(report["violations_by_type"]["cross_boundary_write"], 5);
    EXPECT_EQ(engine_->violations(std::string("project_p2")).size(), 5u);
    EXPECT_TRUE(engine_->violations(std::string("project_p1")).empty());
}

// ============================================================================
// Watcher
// ============================================================================

TEST_F(BoundaryEngineTest, WatchedCrossProjectWriteIsDebouncedThenEnforced) {
    if (!engine_->start()) {
        GTEST_SKIP() << "inotify unavailable";
    }
    engine_->set_execution_context(std::string("p1"));

    std::string target = join_path(p2_, "dropped.txt");
    ASSERT_TRUE(test::touch(target, "payload"));

    int64_t now = monotonic_ms();
    engine_->poll(now);
    EXPECT_TRUE(engine_->has_pending_events(p2_));
    EXPECT_TRUE(file_exists(target));

    engine_->poll(now + config_.debounce_ms + 10);
    EXPECT_FALSE(engine_->has_pending_events(p2_));
    EXPECT_FALSE(file_exists(target));

    std::vector<ViolationDetectedEvent> evs = violation_events();
    ASSERT_EQ(evs.size(), 1u);
    EXPECT_EQ(evs[0].violation.violation_type, "cross_boundary_write");

    engine_->stop();
    EXPECT_FALSE(engine_->running());
}
