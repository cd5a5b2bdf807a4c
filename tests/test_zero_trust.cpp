#include "test_util.hpp"

#include <warden/security/zero_trust.hpp>
#include <warden/security/boundary_engine.hpp>
#include <warden/security/path_guard.hpp>
#include <warden/core/utils.hpp>

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>

using namespace warden;

class ZeroTrustTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_ = test::make_security_config(tmp_);
        guard_ = std::make_unique<PathGuard>(config_, events_);
        engine_ = std::make_unique<BoundaryEngine>(config_, *guard_, events_);
        zt_ = std::make_unique<ZeroTrustIsolation>(config_, *guard_, *engine_, events_);
    }

    std::string sandbox(const std::string& name) const {
        return join_path(config_.sandbox_roots.front(), name);
    }

    template <typename T>
    std::vector<T> drain_of() {
        std::vector<T> out;
        for (auto& ev : events_.drain()) {
            if (auto* p = std::get_if<T>(&ev.payload)) out.push_back(*p);
        }
        return out;
    }

    test::TempDir tmp_;
    SecurityConfig config_;
    EventQueue events_;
    std::unique_ptr<PathGuard> guard_;
    std::unique_ptr<BoundaryEngine> engine_;
    std::unique_ptr<ZeroTrustIsolation> zt_;
};

// ============================================================================
// Catalogs
// ============================================================================

TEST(ZeroTrustCatalogTest, ChecksScaleWithSecurityLevel) {
    std::vector<VerificationCheck> standard = ZeroTrustIsolation::checks_for(SecurityLevel::STANDARD);
    ASSERT_EQ(standard.size(), 3u);
    EXPECT_EQ(standard[0].check_name, "filesystem_integrity");
    EXPECT_EQ(standard[0].interval_ms, 60000);
    EXPECT_EQ(standard[0].failure_threshold, 3);
    EXPECT_EQ(standard[0].failure_action, FailureAction::QUARANTINE);
    EXPECT_EQ(standard[1].frequency, CheckFrequency::CONTINUOUS);
    EXPECT_EQ(standard[2].failure_action, FailureAction::ALERT);

    std::vector<VerificationCheck> enhanced = ZeroTrustIsolation::checks_for(SecurityLevel::ENHANCED);
    ASSERT_EQ(enhanced.size(), 4u);
    EXPECT_EQ(enhanced[0].interval_ms, 30000);
    EXPECT_EQ(enhanced[2].check_name, "privilege_escalation");
    EXPECT_EQ(enhanced[2].failure_action, FailureAction::BLOCK);

    std::vector<VerificationCheck> maximum = ZeroTrustIsolation::checks_for(SecurityLevel::MAXIMUM);
    ASSERT_EQ(maximum.size(), 4u);
    EXPECT_EQ(maximum[0].interval_ms, 15000);
    EXPECT_EQ(maximum[2].failure_action, FailureAction::QUARANTINE);
    EXPECT_EQ(maximum[3].frequency, CheckFrequency::ON_CHANGE);
    EXPECT_EQ(maximum[3].failure_action, FailureAction::BLOCK);
}

TEST(ZeroTrustCatalogTest, MechanismsScaleWithSecurityLevel) {
    EXPECT_EQ(ZeroTrustIsolation::mechanisms_for(SecurityLevel::STANDARD).size(), 2u);
    EXPECT_EQ(ZeroTrustIsolation::mechanisms_for(SecurityLevel::ENHANCED).size(), 4u);

    std::vector<EnforcementMechanism> maximum = ZeroTrustIsolation::mechanisms_for(SecurityLevel::MAXIMUM);
    ASSERT_EQ(maximum.size(), 5u);
    EXPECT_EQ(maximum[0].strength, MechanismStrength::CRYPTOGRAPHIC);
    EXPECT_EQ(maximum.back().mechanism, "network_segmentation");
}

// ============================================================================
// Project lifecycle
// ============================================================================

TEST_F(ZeroTrustTest, CreatePreparesTheProjectDirectory) {
    ProjectIsolationBoundary b = zt_->create_project_isolation("p1", sandbox("p1"), SecurityLevel::STANDARD);
    EXPECT_EQ(b.project_id, "p1");
    EXPECT_EQ(b.root_path, sandbox("p1"));
    EXPECT_EQ(b.engine_boundary_id, "project_p1");
    EXPECT_EQ(b.verification_checks.size(), 3u);
    EXPECT_DOUBLE_EQ(b.metrics.boundary_integrity_score, 100.0);

    std::string gitignore;
    ASSERT_TRUE(read_file(join_path(sandbox("p1"), ".gitignore"), gitignore));
    EXPECT_NE(gitignore.find(".warden/\n"), std::string::npos);
    EXPECT_NE(gitignore.find(".warden-*\n"), std::string::npos);
    EXPECT_NE(gitignore.find("*.warden.log\n"), std::string::npos);

    std::string marker;
    ASSERT_TRUE(read_file(join_path(sandbox("p1"), ".warden-project.json"), marker));
    Json parsed = Json::parse(marker);
    EXPECT_EQ(parsed["projectId"], "p1");
    EXPECT_EQ(parsed["isolationLevel"], "standard");

    EXPECT_TRUE(zt_->has_project("p1"));
    EXPECT_EQ(guard_->project_root("p1"), sandbox("p1"));

    // Standard projects may create executables
    std::optional<FileSystemBoundary> eb = engine_->boundary("project_p1");
    ASSERT_TRUE(eb.has_value());
    EXPECT_FALSE(eb->access_rules[3].enabled);
}

TEST_F(ZeroTrustTest, GitignoreIsExtendedNotReplaced) {
    ASSERT_TRUE(test::touch(join_path(sandbox("p1"), ".gitignore"), "node_modules/\n.warden/\n"));
    zt_->create_project_isolation("p1", sandbox("p1"), SecurityLevel::STANDARD);

    std::string gitignore;
    ASSERT_TRUE(read_file(join_path(sandbox("p1"), ".gitignore"), gitignore));
    EXPECT_EQ(gitignore, "node_modules/\n.warden/\n.warden-*\n*.warden.log\n");
}

TEST_F(ZeroTrustTest, CreateRejectsBadRequests) {
    zt_->create_project_isolation("p1", sandbox("p1"), SecurityLevel::STANDARD);

    EXPECT_THROW(zt_->create_project_isolation("../x", sandbox("x"), SecurityLevel::STANDARD),
                 std::invalid_argument);
    EXPECT_THROW(zt_->create_project_isolation("p1", sandbox("p1b"), SecurityLevel::STANDARD),
                 std::invalid_argument);
    EXPECT_THROW(zt_->create_project_isolation("p2", sandbox("p1/nested"), SecurityLevel::STANDARD),
                 std::invalid_argument);
    EXPECT_THROW(zt_->create_project_isolation("p3", config_.sandbox_roots.front(), SecurityLevel::STANDARD),
                 std::invalid_argument);
    EXPECT_THROW(zt_->create_project_isolation("p4", join_path(config_.framework_root, "p4"),
                                               SecurityLevel::STANDARD),
                 std::invalid_argument);
    EXPECT_THROW(zt_->create_project_isolation("p5", "/etc/p5", SecurityLevel::STANDARD),
                 std::invalid_argument);

    EXPECT_EQ(zt_->project_ids(), std::vector<std::string>{"p1"});
}

TEST_F(ZeroTrustTest, RemoveTearsDownEveryLayer) {
    zt_->create_project_isolation("p1", sandbox("p1"), SecurityLevel::STANDARD);
    EXPECT_TRUE(zt_->remove_project_isolation("p1"));
    EXPECT_FALSE(zt_->has_project("p1"));
    EXPECT_FALSE(engine_->boundary("project_p1").has_value());
    EXPECT_FALSE(zt_->remove_project_isolation("p1"));
    EXPECT_THROW(zt_->validate_project_access("p1", Operation::READ, "a.txt"), std::out_of_range);
}

// ============================================================================
// Access gate
// ============================================================================

TEST_F(ZeroTrustTest, OwnAccessIsAllowed) {
    zt_->create_project_isolation("p1", sandbox("p1"), SecurityLevel::ENHANCED);
    EXPECT_TRUE(zt_->validate_project_access("p1", Operation::WRITE, "src/index.ts"));
    EXPECT_TRUE(zt_->validate_project_access("p1", Operation::READ, join_path(sandbox("p1"), "README.md")));
    EXPECT_TRUE(events_.empty());
    EXPECT_EQ(zt_->isolation("p1")->metrics.breach_attempts, 0);
}

TEST_F(ZeroTrustTest, CrossProjectAccessIsDeniedInline) {
    zt_->create_project_isolation("p1", sandbox("p1"), SecurityLevel::STANDARD);
    zt_->create_project_isolation("p2", sandbox("p2"), SecurityLevel::STANDARD);

    EXPECT_FALSE(zt_->validate_project_access("p1", Operation::WRITE, join_path(sandbox("p2"), "x.txt")));

    std::optional<ProjectIsolationBoundary> b = zt_->isolation("p1");
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(b->metrics.verification_failures, 1);
    EXPECT_EQ(b->metrics.breach_attempts, 1);
    EXPECT_DOUBLE_EQ(b->metrics.boundary_integrity_score, 90.0);
    // The inline denial is the block; later accesses are judged on their own
    EXPECT_FALSE(zt_->is_blocked("p1"));
    EXPECT_TRUE(zt_->validate_project_access("p1", Operation::READ, "a.txt"));

    std::vector<UnauthorizedAccessEvent> evs = drain_of<UnauthorizedAccessEvent>();
    ASSERT_EQ(evs.size(), 1u);
    EXPECT_EQ(evs[0].reason, "cross_project_access verification failed");
    EXPECT_EQ(evs[0].operation, Operation::WRITE);
}

TEST_F(ZeroTrustTest, ForeignExecutionContextFailsVerification) {
    zt_->create_project_isolation("p1", sandbox("p1"), SecurityLevel::STANDARD);
    engine_->set_execution_context(std::string("p2"));
    EXPECT_FALSE(zt_->validate_project_access("p1", Operation::READ, "a.txt"));
    engine_->set_execution_context(std::nullopt);
    EXPECT_TRUE(zt_->validate_project_access("p1", Operation::READ, "a.txt"));
}

TEST_F(ZeroTrustTest, CompromiseIsReportedOnce) {
    zt_->create_project_isolation("p1", sandbox("p1"), SecurityLevel::STANDARD);
    zt_->create_project_isolation("p2", sandbox("p2"), SecurityLevel::STANDARD);
    const std::string foreign = join_path(sandbox("p2"), "x.txt");

    for (int i = 0; i < 3; ++i) {
        zt_->validate_project_access("p1", Operation::READ, foreign);
    }
    EXPECT_TRUE(drain_of<BoundaryCompromisedEvent>().empty());

    zt_->validate_project_access("p1", Operation::READ, foreign);
    std::vector<BoundaryCompromisedEvent> evs = drain_of<BoundaryCompromisedEvent>();
    ASSERT_EQ(evs.size(), 1u);
    EXPECT_EQ(evs[0].project_id, "p1");
    EXPECT_DOUBLE_EQ(evs[0].integrity_score, 60.0);
    EXPECT_EQ(evs[0].verification_failures, 4);

    zt_->validate_project_access("p1", Operation::READ, foreign);
    EXPECT_TRUE(drain_of<BoundaryCompromisedEvent>().empty());
    EXPECT_DOUBLE_EQ(zt_->health_score(), (50.0 + 100.0) / 2.0);
}

TEST_F(ZeroTrustTest, PrivilegedTargetsFailEnhancedVerification) {
    zt_->create_project_isolation("p1", sandbox("p1"), SecurityLevel::ENHANCED);
    EXPECT_FALSE(zt_->validate_project_access("p1", Operation::READ, "/etc/shadow"));
    EXPECT_FALSE(zt_->validate_project_access("p1", Operation::EXECUTE, "/usr/bin/sudo"));
    EXPECT_TRUE(zt_->validate_project_access("p1", Operation::EXECUTE, "bin/build"));

    std::vector<UnauthorizedAccessEvent> evs = drain_of<UnauthorizedAccessEvent>();
    ASSERT_EQ(evs.size(), 2u);
    EXPECT_EQ(evs[0].reason, "privilege_escalation verification failed");
}

// ============================================================================
// Periodic checks and failure actions
// ============================================================================

TEST_F(ZeroTrustTest, RunCheckValidatesArguments) {
    zt_->create_project_isolation("p1", sandbox("p1"), SecurityLevel::STANDARD);
    EXPECT_THROW(zt_->run_check("nope", "filesystem_integrity"), std::out_of_range);
    EXPECT_THROW(zt_->run_check("p1", "privilege_escalation"), std::invalid_argument);
    EXPECT_TRUE(zt_->run_check("p1", "filesystem_integrity"));
    EXPECT_TRUE(zt_->run_check("p1", "configuration_integrity"));
}

TEST_F(ZeroTrustTest, SilentTamperingQuarantinesAfterThreshold) {
    zt_->create_project_isolation("p1", sandbox("p1"), SecurityLevel::STANDARD);
    ASSERT_TRUE(test::touch(join_path(sandbox("p1"), "payload.bin"), "dropped"));

    EXPECT_FALSE(zt_->run_check("p1", "filesystem_integrity"));
    EXPECT_FALSE(zt_->run_check("p1", "filesystem_integrity"));
    EXPECT_FALSE(zt_->is_quarantined("p1"));
    EXPECT_DOUBLE_EQ(zt_->isolation("p1")->metrics.boundary_integrity_score, 80.0);

    EXPECT_FALSE(zt_->run_check("p1", "filesystem_integrity"));
    EXPECT_TRUE(zt_->is_quarantined("p1"));
    EXPECT_FALSE(zt_->has_project("p1"));
    EXPECT_FALSE(engine_->boundary("project_p1").has_value());

    std::vector<ProjectQuarantinedEvent> evs = drain_of<ProjectQuarantinedEvent>();
    ASSERT_EQ(evs.size(), 1u);
    EXPECT_EQ(evs[0].project_id, "p1");

    EXPECT_THROW(zt_->run_check("p1", "filesystem_integrity"), std::out_of_range);
    EXPECT_FALSE(zt_->validate_project_access("p1", Operation::READ, "a.txt"));
    std::vector<UnauthorizedAccessEvent> denied = drain_of<UnauthorizedAccessEvent>();
    ASSERT_EQ(denied.size(), 1u);
    EXPECT_EQ(denied[0].reason.rfind("project is quarantined: filesystem_integrity", 0), 0u);

    // A quarantined id cannot be reused
    EXPECT_THROW(zt_->create_project_isolation("p1", sandbox("p1"), SecurityLevel::STANDARD),
                 std::invalid_argument);
}

TEST_F(ZeroTrustTest, ObservedChangesKeepIntegrityClean) {
    zt_->create_project_isolation("p1", sandbox("p1"), SecurityLevel::STANDARD);
    std::string file = join_path(sandbox("p1"), "src/app.ts");
    ASSERT_TRUE(test::touch(file, "export {}"));
    engine_->handle_filesystem_event(FileEvent(file, FileOperation::CREATE, std::string("p1")));

    EXPECT_TRUE(zt_->run_check("p1", "filesystem_integrity"));
    EXPECT_TRUE(zt_->run_check("p1", "filesystem_integrity"));
}

TEST_F(ZeroTrustTest, ApprovedWriteKeepsIntegrityClean) {
    zt_->create_project_isolation("p1", sandbox("p1"), SecurityLevel::STANDARD);
    std::string file = join_path(sandbox("p1"), "src/app.ts");
    AccessDecision d = engine_->validate_file_access(file, Operation::WRITE, "p1");
    ASSERT_TRUE(d.allowed) << d.reason;
    ASSERT_TRUE(test::touch(file, "export {}"));

    EXPECT_TRUE(zt_->run_check("p1", "filesystem_integrity"));
}

TEST_F(ZeroTrustTest, ApprovedWriteDoesNotHideUnrelatedTampering) {
    zt_->create_project_isolation("p1", sandbox("p1"), SecurityLevel::STANDARD);
    ASSERT_TRUE(test::touch(join_path(sandbox("p1"), "lib/loader.js"), "fetch(evil)"));

    std::string file = join_path(sandbox("p1"), "src/app.ts");
    AccessDecision d = engine_->validate_file_access(file, Operation::WRITE, "p1");
    ASSERT_TRUE(d.allowed) << d.reason;
    ASSERT_TRUE(test::touch(file, "export {}"));

    EXPECT_FALSE(zt_->run_check("p1", "filesystem_integrity"));
    // The write itself was accepted; only the unrecorded file keeps failing
    EXPECT_FALSE(zt_->run_check("p1", "filesystem_integrity"));
    EXPECT_DOUBLE_EQ(zt_->isolation("p1")->metrics.boundary_integrity_score, 80.0);

    ASSERT_TRUE(remove_recursive(join_path(sandbox("p1"), "lib")));
    EXPECT_TRUE(zt_->run_check("p1", "filesystem_integrity"));
}

TEST_F(ZeroTrustTest, ForbiddenDirectoryFailsIntegrity) {
    zt_->create_project_isolation("p1", sandbox("p1"), SecurityLevel::STANDARD);
    ASSERT_TRUE(ensure_directory(join_path(sandbox("p1"), ".warden")));
    EXPECT_FALSE(zt_->run_check("p1", "filesystem_integrity"));
}

TEST_F(ZeroTrustTest, ConfigurationTamperingRaisesAlert) {
    zt_->create_project_isolation("p1", sandbox("p1"), SecurityLevel::STANDARD);
    ASSERT_TRUE(test::touch(join_path(sandbox("p1"), ".warden-project.json"), "{}"));
    events_.drain();

    EXPECT_FALSE(zt_->run_check("p1", "configuration_integrity"));
    std::vector<SecurityAlertEvent> evs = drain_of<SecurityAlertEvent>();
    ASSERT_EQ(evs.size(), 1u);
    EXPECT_EQ(evs[0].project_id, "p1");
    EXPECT_EQ(evs[0].source, "zero_trust");
    EXPECT_EQ(evs[0].severity, Severity::HIGH);
    EXPECT_NE(evs[0].message.find("project configuration modified"), std::string::npos);
}

TEST_F(ZeroTrustTest, PrivilegedCommandBlocksUntilCleanRound) {
    zt_->create_project_isolation("p1", sandbox("p1"), SecurityLevel::ENHANCED);
    zt_->record_process_activity("p1", "sudo rm -rf /");

    EXPECT_FALSE(zt_->run_check("p1", "privilege_escalation"));
    EXPECT_TRUE(zt_->is_blocked("p1"));
    EXPECT_FALSE(zt_->validate_project_access("p1", Operation::READ, "a.txt"));

    // Commands already judged are not judged again
    EXPECT_TRUE(zt_->run_check("p1", "privilege_escalation"));

    zt_->poll(monotonic_ms() + 31000);
    EXPECT_FALSE(zt_->is_blocked("p1"));
    EXPECT_TRUE(zt_->validate_project_access("p1", Operation::READ, "a.txt"));
}

TEST_F(ZeroTrustTest, BlockProjectNeedsALiveProject) {
    zt_->create_project_isolation("p1", sandbox("p1"), SecurityLevel::STANDARD);
    EXPECT_TRUE(zt_->block_project("p1", "incident"));
    EXPECT_TRUE(zt_->is_blocked("p1"));
    EXPECT_FALSE(zt_->block_project("ghost", "incident"));
    EXPECT_TRUE(zt_->enhance_monitoring("p1"));
    EXPECT_FALSE(zt_->enhance_monitoring("ghost"));
    EXPECT_THROW(zt_->record_process_activity("ghost", "ls"), std::out_of_range);
}

// ============================================================================
// Threat scan
// ============================================================================

TEST_F(ZeroTrustTest, PrivilegedCommandMatchesThreatRule) {
    zt_->create_project_isolation("p1", sandbox("p1"), SecurityLevel::STANDARD);
    zt_->record_process_activity("p1", "sudo ls");
    zt_->run_threat_scan();

    std::vector<SecurityEvent> all = events_.drain();
    std::vector<ThreatDetectedEvent> threats;
    size_t alerts = 0;
    for (auto& ev : all) {
        if (auto* t = std::get_if<ThreatDetectedEvent>(&ev.payload)) threats.push_back(*t);
        if (std::get_if<SecurityAlertEvent>(&ev.payload)) ++alerts;
    }
    ASSERT_EQ(threats.size(), 1u);
    EXPECT_EQ(threats[0].rule_id, "privilege_escalation_commands");
    EXPECT_EQ(threats[0].severity, Severity::CRITICAL);
    EXPECT_EQ(threats[0].matched_activity, std::vector<std::string>{"sudo ls"});
    EXPECT_EQ(alerts, 1u);

    // Quarantine needs approval
    EXPECT_FALSE(zt_->is_quarantined("p1"));
    std::vector<PendingApproval> pending = zt_->pending_approvals();
    ASSERT_EQ(pending.size(), 1u);
    EXPECT_EQ(pending[0].action, "quarantine_project");

    EXPECT_THROW(zt_->approve("approval_missing"), std::out_of_range);
    EXPECT_TRUE(zt_->approve(pending[0].approval_id));
    EXPECT_TRUE(zt_->is_quarantined("p1"));
    EXPECT_TRUE(zt_->pending_approvals().empty());
    EXPECT_DOUBLE_EQ(zt_->health_score(), 100.0);
}

TEST_F(ZeroTrustTest, AuthorizedActionsSkipApproval) {
    zt_->create_project_isolation("p1", sandbox("p1"), SecurityLevel::STANDARD);
    zt_->authorize("p1", "quarantine_project");
    zt_->record_process_activity("p1", "echo ok; sudo -i");
    zt_->run_threat_scan();
    EXPECT_TRUE(zt_->is_quarantined("p1"));
    EXPECT_TRUE(zt_->pending_approvals().empty());
}

TEST_F(ZeroTrustTest, CrossProjectActivityIsBlockedByScan) {
    zt_->create_project_isolation("p1", sandbox("p1"), SecurityLevel::STANDARD);
    zt_->create_project_isolation("p2", sandbox("p2"), SecurityLevel::STANDARD);

    std::string target = join_path(sandbox("p2"), "stolen.txt");
    ASSERT_TRUE(test::touch(target));
    engine_->handle_filesystem_event(FileEvent(target, FileOperation::CREATE, std::string("p1")));
    events_.drain();

    zt_->run_threat_scan();
    std::vector<ThreatDetectedEvent> threats = drain_of<ThreatDetectedEvent>();
    ASSERT_EQ(threats.size(), 1u);
    EXPECT_EQ(threats[0].project_id, "p1");
    EXPECT_EQ(threats[0].rule_id, "cross_project_file_access");
    EXPECT_TRUE(zt_->is_blocked("p1"));
    EXPECT_FALSE(zt_->is_blocked("p2"));
    EXPECT_EQ(zt_->pending_approvals().size(), 1u);

    // Nothing new to scan
    zt_->run_threat_scan();
    EXPECT_TRUE(drain_of<ThreatDetectedEvent>().empty());
}

// ============================================================================
// Reporting
// ============================================================================

TEST_F(ZeroTrustTest, HealthAndComplianceReport) {
    EXPECT_DOUBLE_EQ(zt_->health_score(), 100.0);

    zt_->create_project_isolation("p1", sandbox("p1"), SecurityLevel::MAXIMUM);
    zt_->create_project_isolation("p2", sandbox("p2"), SecurityLevel::STANDARD);
    zt_->quarantine_project("p2", "manual review", false);
    EXPECT_TRUE(drain_of<ProjectQuarantinedEvent>().empty());

    Json report = zt_->compliance_report();
    EXPECT_EQ(report["summary"]["isolated_projects"], 1);
    ASSERT_EQ(report["quarantined_projects"].size(), 1u);
    EXPECT_EQ(report["quarantined_projects"][0]["reason"], "manual review");
    EXPECT_EQ(report["project_boundaries"][0]["security_level"], "maximum");
    EXPECT_EQ(report["threat_rules"].size(), default_threat_rules().size());
}
