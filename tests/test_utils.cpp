#include "test_util.hpp"

#include <warden/core/utils.hpp>
#include <warden/core/config.hpp>
#include <warden/core/logger.hpp>
#include <warden/security/security_config.hpp>
#include <warden/security/types.hpp>

#include <gtest/gtest.h>

#include <stdexcept>
#include <unistd.h>

using namespace warden;

// ============================================================================
// Paths
// ============================================================================

TEST(UtilsTest, NormalizePathResolvesDotSegments) {
    EXPECT_EQ(normalize_path("/a/b/../c/./d"), "/a/c/d");
    EXPECT_EQ(normalize_path("/a//b/"), "/a/b");
    EXPECT_EQ(normalize_path("/../.."), "/");
    EXPECT_EQ(normalize_path("a/../../b"), "../b");
    EXPECT_EQ(normalize_path("./"), ".");
}

TEST(UtilsTest, PathIsUnderRespectsComponentBoundaries) {
    EXPECT_TRUE(path_is_under("/srv/p1", "/srv/p1"));
    EXPECT_TRUE(path_is_under("/srv/p1/src/a.ts", "/srv/p1"));
    EXPECT_FALSE(path_is_under("/srv/p10/a.ts", "/srv/p1"));
    EXPECT_FALSE(path_is_under("/srv", "/srv/p1"));
    EXPECT_TRUE(path_is_under("/anything", "/"));
    EXPECT_FALSE(path_is_under("/srv", ""));
}

TEST(UtilsTest, BaseAndDirName) {
    EXPECT_EQ(base_name("/a/b/c.txt"), "c.txt");
    EXPECT_EQ(base_name("/a/b/"), "b");
    EXPECT_EQ(dir_name("/a/b/c.txt"), "/a/b");
    EXPECT_EQ(dir_name("/top"), "/");
    EXPECT_EQ(dir_name("plain"), ".");
}

TEST(UtilsTest, JoinPathAvoidsDoubleSlashes) {
    EXPECT_EQ(join_path("/a/", "/b"), "/a/b");
    EXPECT_EQ(join_path("/a", "b"), "/a/b");
    EXPECT_EQ(join_path("", "b"), "b");
}

// ============================================================================
// Strings and time
// ============================================================================

TEST(UtilsTest, TruncateSafeKeepsMultiByteSequencesWhole) {
    std::string s = "ab\xC3\xA9";   // "abé"
    EXPECT_EQ(truncate_safe(s, 3), "ab");
    EXPECT_EQ(truncate_safe(s, 10), s);
}

TEST(UtilsTest, TimestampFormats) {
    EXPECT_EQ(format_timestamp_ms(0), "1970-01-01T00:00:00.000Z");
    EXPECT_EQ(format_timestamp_ms(1234), "1970-01-01T00:00:01.234Z");
    EXPECT_EQ(compact_timestamp_ms(1234), "19700101T000001234Z");
}

TEST(UtilsTest, RecordIdsAreUniqueAndPrefixed) {
    std::string a = make_record_id("incident");
    std::string b = make_record_id("incident");
    EXPECT_NE(a, b);
    EXPECT_TRUE(starts_with(a, "incident_"));
    EXPECT_EQ(random_hex(8).size(), 16u);
}

// ============================================================================
// Hashing and files
// ============================================================================

TEST(UtilsTest, Sha256KnownVector) {
    EXPECT_EQ(sha256_hex("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(UtilsTest, HashDirectoryTracksContentAndNames) {
    test::TempDir tmp;
    std::string root = tmp.sub("tree");
    ASSERT_TRUE(test::touch(join_path(root, "a.txt"), "one"));
    ASSERT_TRUE(test::touch(join_path(root, "sub/b.txt"), "two"));

    std::string first = hash_directory(root);
    EXPECT_EQ(first.size(), 64u);
    EXPECT_EQ(hash_directory(root), first);

    ASSERT_TRUE(test::touch(join_path(root, "sub/b.txt"), "changed"));
    std::string second = hash_directory(root);
    EXPECT_NE(second, first);

    ASSERT_TRUE(move_file(join_path(root, "a.txt"), join_path(root, "c.txt")));
    EXPECT_NE(hash_directory(root), second);

    EXPECT_EQ(hash_directory(tmp.sub("missing")), "");
}

TEST(UtilsTest, CopyTreeAndRemoveRecursive) {
    test::TempDir tmp;
    ASSERT_TRUE(test::touch(tmp.sub("src/x/y.txt"), "payload"));
    ASSERT_TRUE(copy_tree(tmp.sub("src"), tmp.sub("dst")));

    std::string content;
    ASSERT_TRUE(read_file(tmp.sub("dst/x/y.txt"), content));
    EXPECT_EQ(content, "payload");
    EXPECT_EQ(list_files_recursive(tmp.sub("dst")), std::vector<std::string>{"x/y.txt"});

    EXPECT_TRUE(remove_recursive(tmp.sub("dst")));
    EXPECT_FALSE(file_exists(tmp.sub("dst")));
    EXPECT_TRUE(remove_recursive(tmp.sub("dst")));
}

TEST(UtilsTest, AppendLineAppends) {
    test::TempDir tmp;
    std::string path = tmp.sub("logs/out.log");
    ASSERT_TRUE(append_line(path, "first"));
    ASSERT_TRUE(append_line(path, "second"));
    std::string content;
    ASSERT_TRUE(read_file(path, content));
    EXPECT_EQ(content, "first\nsecond\n");
}

// ============================================================================
// Configuration
// ============================================================================

TEST(ConfigTest, DotPathLookupsWithDefaults) {
    Config config;
    ASSERT_TRUE(config.load_string(R"({
        "log_level": "debug",
        "security": { "debounce_ms": 150, "alerts": { "webhook_url": "http://hooks.local/x" } }
    })"));
    EXPECT_EQ(config.get_string("log_level"), "debug");
    EXPECT_EQ(config.get_int("security.debounce_ms", 300), 150);
    EXPECT_EQ(config.get_int("security.missing", 7), 7);
    EXPECT_EQ(config.get_string("security.alerts.webhook_url"), "http://hooks.local/x");
    EXPECT_TRUE(config.has("security.alerts"));
    EXPECT_FALSE(config.has("security.alerts.timeout_seconds"));
}

TEST(ConfigTest, RejectsMalformedJson) {
    Config config;
    EXPECT_FALSE(config.load_string("{ not json"));
    EXPECT_FALSE(config.load_string("[1, 2]"));
    EXPECT_FALSE(config.load_file("/nonexistent/warden/config.json"));
}

TEST(ConfigTest, SecurityConfigClampsTunables) {
    Config config;
    ASSERT_TRUE(config.load_string(R"({
        "security": {
            "framework_root": "/opt/warden",
            "home_dir": "/var/lib/warden",
            "sandbox_roots": ["/srv/a", "/srv/b/../c"],
            "decode_iterations": 99,
            "incident_retention": 5,
            "failure_window_ms": 10,
            "threat_confidence_threshold": 0.5,
            "auto_approve_actions": true
        }
    })"));

    SecurityConfig sc = SecurityConfig::from_config(config);
    EXPECT_EQ(sc.framework_root, "/opt/warden");
    EXPECT_EQ(sc.sandbox_roots, (std::vector<std::string>{"/srv/a", "/srv/c"}));
    EXPECT_EQ(sc.decode_iterations, 16);
    EXPECT_EQ(sc.incident_retention, 100u);
    EXPECT_EQ(sc.failure_window_ms, 1000);
    EXPECT_DOUBLE_EQ(sc.threat_confidence_threshold, 0.5);
    EXPECT_TRUE(sc.auto_approve_actions);
    EXPECT_EQ(sc.debounce_ms, 300);
    EXPECT_EQ(sc.audit_log_path(), "/var/lib/warden/security/audit.log");
    EXPECT_EQ(sc.incident_db_path(), "/var/lib/warden/security/incidents.db");
    EXPECT_EQ(sc.primary_sandbox_root(), "/srv/a");
}

// ============================================================================
// Enumerations and logging
// ============================================================================

TEST(TypesTest, ParseRejectsUnknownSpellings) {
    EXPECT_EQ(parse_operation("execute"), Operation::EXECUTE);
    EXPECT_EQ(parse_severity("critical"), Severity::CRITICAL);
    EXPECT_EQ(parse_security_level("maximum"), SecurityLevel::MAXIMUM);
    EXPECT_EQ(to_string(AttackType::NULL_BYTE_INJECTION), "null_byte_injection");
    EXPECT_THROW(parse_operation("chmod"), std::invalid_argument);
    EXPECT_THROW(parse_severity("HIGH"), std::invalid_argument);
    EXPECT_THROW(parse_incident_status(""), std::invalid_argument);
}

TEST(TypesTest, EscalateSaturatesAtCritical) {
    EXPECT_EQ(escalate(Severity::LOW), Severity::MEDIUM);
    EXPECT_EQ(escalate(Severity::HIGH), Severity::CRITICAL);
    EXPECT_EQ(escalate(Severity::CRITICAL), Severity::CRITICAL);
}

TEST(LoggerTest, RetainsRecentLines) {
    Logger& logger = Logger::instance();
    logger.set_retention(50);
    LOG_WARN("[Test] retained line %d", 42);
    std::vector<std::string> lines = logger.recent_lines(5);
    ASSERT_FALSE(lines.empty());
    EXPECT_NE(lines.back().find("retained line 42"), std::string::npos);

    EXPECT_EQ(Logger::parse_level("warn"), LogLevel::WARN);
    EXPECT_EQ(Logger::parse_level("bogus"), LogLevel::INFO);
}

TEST(LoggerTest, LevelThresholdFiltersLines) {
    Logger& logger = Logger::instance();
    LogLevel saved = logger.level();
    logger.set_retention(50);
    logger.set_level(LogLevel::WARN);

    LOG_INFO("[Test] filtered info line");
    LOG_ERROR("[Test] kept error line");
    std::vector<std::string> lines = logger.recent_lines(2);
    ASSERT_FALSE(lines.empty());
    EXPECT_NE(lines.back().find("kept error line"), std::string::npos);
    for (const auto& line : lines) {
        EXPECT_EQ(line.find("filtered info line"), std::string::npos);
    }
    logger.set_level(saved);
}
