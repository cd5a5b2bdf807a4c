#include "test_util.hpp"

#include <warden/security/path_guard.hpp>
#include <warden/core/utils.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <unistd.h>

using namespace warden;

class PathGuardTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_ = test::make_security_config(tmp_);
        guard_ = std::make_unique<PathGuard>(config_, events_);
        project_root_ = join_path(config_.sandbox_roots.front(), "proj1");
        ensure_directory(project_root_);
        guard_->register_project_root("proj1", project_root_);
    }

    test::TempDir tmp_;
    SecurityConfig config_;
    EventQueue events_;
    std::unique_ptr<PathGuard> guard_;
    std::string project_root_;
};

TEST_F(PathGuardTest, RelativePathInsideProjectIsSafe) {
    SafePath r = guard_->validate("src/index.ts", std::string("proj1"), Operation::WRITE);
    EXPECT_TRUE(r.is_safe);
    EXPECT_FALSE(r.blocked);
    EXPECT_TRUE(r.violations.empty());
    EXPECT_FALSE(r.attack_type.has_value());
    EXPECT_EQ(r.sanitized_path, join_path(project_root_, "src/index.ts"));
    EXPECT_EQ(r.recommended_path, r.sanitized_path);
    EXPECT_TRUE(events_.empty());
    EXPECT_TRUE(guard_->attempts().empty());
}

TEST_F(PathGuardTest, AbsolutePathUnderDeclaredRootIsSafe) {
    SafePath r = guard_->validate(join_path(project_root_, "src/index.ts"), std::string("proj1"),
                                  Operation::WRITE);
    EXPECT_TRUE(r.is_safe);
    EXPECT_TRUE(r.violations.empty());
}

TEST_F(PathGuardTest, BasicTraversalIsBlocked) {
    SafePath r = guard_->validate("../../etc/passwd", std::string("proj1"), Operation::READ);
    EXPECT_FALSE(r.is_safe);
    EXPECT_TRUE(r.blocked);
    ASSERT_TRUE(r.attack_type.has_value());
    EXPECT_EQ(*r.attack_type, AttackType::BASIC_TRAVERSAL);
    // Medium base severity, escalated because it aims at /etc/passwd
    EXPECT_EQ(r.severity, Severity::HIGH);
    ASSERT_FALSE(r.violations.empty());
    EXPECT_EQ(r.violations.front(), "Path traversal attempt detected: basic_traversal");
    EXPECT_EQ(r.recommended_path, join_path(project_root_, "passwd"));

    std::vector<SecurityEvent> events = events_.drain();
    ASSERT_EQ(events.size(), 1u);
    const auto* ev = std::get_if<TraversalAttemptEvent>(&events[0].payload);
    ASSERT_NE(ev, nullptr);
    EXPECT_EQ(ev->attempt.intended_target, "/etc/passwd");
    ASSERT_TRUE(ev->attempt.project_id.has_value());
    EXPECT_EQ(*ev->attempt.project_id, "proj1");
    EXPECT_TRUE(file_exists(config_.traversal_log_path()));
}

TEST_F(PathGuardTest, PercentEncodedTraversalIsNotBasic) {
    SafePath r = guard_->validate("%2e%2e%2f%2e%2e%2fetc%2fpasswd", std::string("proj1"), Operation::READ);
    EXPECT_FALSE(r.is_safe);
    ASSERT_TRUE(r.attack_type.has_value());
    EXPECT_EQ(*r.attack_type, AttackType::ENCODED_TRAVERSAL);
    EXPECT_EQ(r.severity, Severity::HIGH);
}

TEST_F(PathGuardTest, DoubleEncodedTraversal) {
    SafePath r = guard_->validate("%252e%252e%252fsecret", std::string("proj1"), Operation::READ);
    EXPECT_FALSE(r.is_safe);
    ASSERT_TRUE(r.attack_type.has_value());
    EXPECT_EQ(*r.attack_type, AttackType::DOUBLE_ENCODING);
}

TEST_F(PathGuardTest, NullByteInjectionIsCritical) {
    SafePath r = guard_->validate("reports/q1.txt%00.exe", std::string("proj1"), Operation::WRITE);
    EXPECT_FALSE(r.is_safe);
    ASSERT_TRUE(r.attack_type.has_value());
    EXPECT_EQ(*r.attack_type, AttackType::NULL_BYTE_INJECTION);
    EXPECT_EQ(r.severity, Severity::CRITICAL);
}

TEST_F(PathGuardTest, BackslashTraversalIsBasic) {
    SafePath r = guard_->validate("..\\..\\windows\\system32", std::string("proj1"), Operation::READ);
    EXPECT_FALSE(r.is_safe);
    ASSERT_TRUE(r.attack_type.has_value());
    EXPECT_EQ(*r.attack_type, AttackType::BASIC_TRAVERSAL);
    EXPECT_EQ(r.severity, Severity::MEDIUM);

    r = guard_->validate("..\\..\\etc\\passwd", std::string("proj1"), Operation::READ);
    EXPECT_TRUE(r.blocked);
    ASSERT_TRUE(r.attack_type.has_value());
    EXPECT_EQ(*r.attack_type, AttackType::BASIC_TRAVERSAL);
}

TEST_F(PathGuardTest, DriveAndUncPrefixesAreWindowsTraversal) {
    SafePath r = guard_->validate("C:\\Windows\\system32", std::string("proj1"), Operation::READ);
    EXPECT_FALSE(r.is_safe);
    ASSERT_TRUE(r.attack_type.has_value());
    EXPECT_EQ(*r.attack_type, AttackType::WINDOWS_TRAVERSAL);

    r = guard_->validate("\\\\fileserver\\share\\data", std::string("proj1"), Operation::READ);
    EXPECT_FALSE(r.is_safe);
    ASSERT_TRUE(r.attack_type.has_value());
    EXPECT_EQ(*r.attack_type, AttackType::WINDOWS_TRAVERSAL);
}

TEST_F(PathGuardTest, EqualSeverityAttacksResolveByRank) {
    // basic_traversal and mixed_separators are both medium here
    SafePath r = guard_->validate("..\\../notes", std::string("proj1"), Operation::READ);
    ASSERT_TRUE(r.attack_type.has_value());
    EXPECT_EQ(*r.attack_type, AttackType::BASIC_TRAVERSAL);
    EXPECT_EQ(r.severity, Severity::MEDIUM);
}

TEST_F(PathGuardTest, FullwidthDotsAreUnicodeTraversal) {
    SafePath r = guard_->validate("\xEF\xBC\x8E\xEF\xBC\x8E/secret", std::string("proj1"), Operation::READ);
    EXPECT_FALSE(r.is_safe);
    ASSERT_TRUE(r.attack_type.has_value());
    EXPECT_EQ(*r.attack_type, AttackType::UNICODE_TRAVERSAL);
    EXPECT_EQ(r.sanitized_path, join_path(config_.sandbox_roots.front(), "secret"));
}

TEST_F(PathGuardTest, SymlinkEscapingTheProjectIsCritical) {
    std::string outside = tmp_.sub("outside");
    ASSERT_TRUE(ensure_directory(outside));
    ASSERT_EQ(symlink(outside.c_str(), join_path(project_root_, "link").c_str()), 0);

    SafePath r = guard_->validate("link/secret.txt", std::string("proj1"), Operation::READ);
    EXPECT_FALSE(r.is_safe);
    ASSERT_TRUE(r.attack_type.has_value());
    EXPECT_EQ(*r.attack_type, AttackType::SYMLINK_TRAVERSAL);
    EXPECT_EQ(r.severity, Severity::CRITICAL);
}

TEST_F(PathGuardTest, PathOutsideRootsWithoutAttack) {
    std::string other = tmp_.sub("elsewhere/file.txt");
    SafePath r = guard_->validate(other, std::string("proj1"), Operation::WRITE);
    EXPECT_FALSE(r.is_safe);
    EXPECT_FALSE(r.attack_type.has_value());
    ASSERT_EQ(r.violations.size(), 1u);
    EXPECT_EQ(r.violations.front(), "Path outside allowed roots: " + other);
    EXPECT_EQ(r.severity, Severity::LOW);

    std::vector<SecurityEvent> events = events_.drain();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_NE(std::get_if<UnsafePathEvent>(&events[0].payload), nullptr);
}

TEST_F(PathGuardTest, ProtectedSystemPathIsRejected) {
    SafePath r = guard_->validate("/etc/hosts", std::string("proj1"), Operation::READ);
    EXPECT_FALSE(r.is_safe);
    EXPECT_FALSE(r.attack_type.has_value());
    ASSERT_EQ(r.violations.size(), 2u);
    EXPECT_EQ(r.violations[0], "Access to protected path: /etc");
    EXPECT_EQ(r.violations[1], "Path outside allowed roots: /etc/hosts");
    EXPECT_EQ(r.severity, Severity::MEDIUM);
}

TEST_F(PathGuardTest, ReadOnlyRootsAdmitReadsOnly) {
    std::string doc = join_path(config_.framework_root, "docs/guide.md");
    EXPECT_TRUE(guard_->inspect(doc, std::string("proj1"), Operation::READ).is_safe);

    SafePath w = guard_->inspect(doc, std::string("proj1"), Operation::WRITE);
    EXPECT_FALSE(w.is_safe);
    EXPECT_FALSE(guard_->is_protected(doc));
    EXPECT_TRUE(guard_->is_protected(join_path(config_.framework_root, "src/main.cpp")));
}

TEST_F(PathGuardTest, InvalidProjectIdIsReported) {
    SafePath r = guard_->validate("a.txt", std::string("../evil"), Operation::READ);
    EXPECT_FALSE(r.is_safe);
    EXPECT_NE(std::find(r.violations.begin(), r.violations.end(), "Invalid project id"), r.violations.end());
    EXPECT_FALSE(is_valid_project_id(".."));
    EXPECT_FALSE(is_valid_project_id("a/b"));
    EXPECT_TRUE(is_valid_project_id("web-frontend_2.0"));
}

TEST_F(PathGuardTest, ValidateIsIdempotent) {
    const char* inputs[] = {
        "../../etc/passwd", "src/main.cpp", "%2e%2e/x", "reports/q1.txt%00.exe", "/etc/shadow"
    };
    for (const char* input : inputs) {
        SafePath a = guard_->validate(input, std::string("proj1"), Operation::READ);
        SafePath b = guard_->validate(input, std::string("proj1"), Operation::READ);
        EXPECT_EQ(a, b) << input;
    }
}

TEST_F(PathGuardTest, InspectRecordsNothing) {
    SafePath r = guard_->inspect("../../etc/passwd", std::string("proj1"), Operation::READ);
    EXPECT_FALSE(r.is_safe);
    EXPECT_TRUE(events_.empty());
    EXPECT_TRUE(guard_->attempts().empty());
    EXPECT_EQ(guard_->statistics().total_attempts, 0u);
}

TEST_F(PathGuardTest, AttemptRingIsBoundedButTotalsKeepCounting) {
    config_.attempt_ring_size = 2;
    PathGuard guard(config_, events_);
    guard.validate("../a", std::string("proj1"), Operation::READ);
    guard.validate("../b", std::string("proj1"), Operation::READ);
    guard.validate("../c", std::string("proj1"), Operation::READ);

    std::vector<PathTraversalAttempt> recent = guard.attempts();
    ASSERT_EQ(recent.size(), 2u);
    EXPECT_EQ(recent[0].original_path, "../c");
    EXPECT_EQ(recent[1].original_path, "../b");

    PathGuardStatistics stats = guard.statistics();
    EXPECT_EQ(stats.total_attempts, 3u);
    EXPECT_EQ(stats.blocked_attempts, 3u);
    EXPECT_EQ(stats.attempts_by_type["basic_traversal"], 3u);
    EXPECT_TRUE(stats.last_attempt_ms.has_value());
    EXPECT_NEAR(guard.health_score(), 99.7, 1e-9);
}

TEST_F(PathGuardTest, HealthScoreFloorsAtSeventy) {
    for (int i = 0; i < 350; ++i) {
        guard_->validate("../x" + std::to_string(i), std::string("proj1"), Operation::READ);
    }
    EXPECT_DOUBLE_EQ(guard_->health_score(), 70.0);
}

TEST_F(PathGuardTest, QueriesFilterByProjectAndSeverity) {
    guard_->validate("../../etc/passwd", std::string("proj1"), Operation::READ);
    guard_->validate("q.txt%00", std::string("proj2"), Operation::READ);

    EXPECT_EQ(guard_->attempts_for_project("proj1").size(), 1u);
    EXPECT_EQ(guard_->attempts_by_severity(Severity::CRITICAL).size(), 1u);

    Json report = guard_->export_report();
    EXPECT_EQ(report["statistics"]["total_attempts"], 2);
    EXPECT_EQ(report["path_traversal_prevention"]["critical_attempts"], 1);
}

TEST(PathGuardStaticTest, SanitizeFilename) {
    EXPECT_EQ(PathGuard::sanitize_filename("my  file?.txt"), "my_file_.txt");
    EXPECT_EQ(PathGuard::sanitize_filename("..hidden"), "hidden");
    EXPECT_EQ(PathGuard::sanitize_filename("..."), "safe_file");
    EXPECT_EQ(PathGuard::sanitize_filename(""), "safe_file");
}

TEST(PathGuardStaticTest, GuessIntendedTarget) {
    EXPECT_EQ(PathGuard::guess_intended_target("/x/etc/shadow"), "/etc/shadow");
    EXPECT_EQ(PathGuard::guess_intended_target("/x/my_passwd.bak"), "Password files");
    EXPECT_EQ(PathGuard::guess_intended_target("/x/data.bin"), "Unknown system file");
}
