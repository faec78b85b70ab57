/**
 * @file logger_adapter_test.cpp
 * @brief Unit tests for logger_adapter and the migration audit trail
 */

#include <migrator/integration/logger_adapter.hpp>

#include <catch2/catch_test_macros.hpp>

#include "../fixtures/migration_fixture.hpp"

#include <algorithm>

using namespace migrator::integration;

namespace {

/**
 * @brief RAII wrapper for logger initialization/shutdown
 */
class logger_test_fixture {
public:
    explicit logger_test_fixture(const logger_config& config) {
        logger_adapter::initialize(config);
    }

    ~logger_test_fixture() { logger_adapter::shutdown(); }

    logger_test_fixture(const logger_test_fixture&) = delete;
    logger_test_fixture& operator=(const logger_test_fixture&) = delete;
};

auto audit_config(const std::filesystem::path& dir) -> logger_config {
    logger_config config;
    config.log_directory = dir;
    config.enable_console = false;
    config.enable_file = false;
    config.enable_audit_log = true;
    return config;
}

}  // namespace

// =============================================================================
// Level Helpers
// =============================================================================

TEST_CASE("log level names", "[logger_adapter]") {
    CHECK(parse_log_level("debug") == log_level::debug);
    CHECK(parse_log_level("off") == log_level::off);
    CHECK_FALSE(parse_log_level("verbose").has_value());
    CHECK(to_string(log_level::warn) == "warn");
}

// =============================================================================
// Initialization Tests
// =============================================================================

TEST_CASE("logger_adapter initialization and shutdown", "[logger_adapter][init]") {
    migrator::test::temp_directory temp;

    SECTION("Basic initialization") {
        logger_config config;
        config.log_directory = temp.path();
        config.enable_console = false;

        logger_adapter::initialize(config);
        REQUIRE(logger_adapter::is_initialized());

        logger_adapter::shutdown();
        REQUIRE_FALSE(logger_adapter::is_initialized());
    }

    SECTION("Shutdown without initialization is safe") {
        logger_adapter::shutdown();
        REQUIRE_FALSE(logger_adapter::is_initialized());
    }

    SECTION("Audit calls are ignored when not initialized") {
        logger_adapter::log_migration_applied(1, "001_init.sql", "abc", 5);
        CHECK_FALSE(std::filesystem::exists(temp.path() / "audit.json"));
    }
}

TEST_CASE("logger_adapter level filtering", "[logger_adapter][logging]") {
    migrator::test::temp_directory temp;
    logger_config config;
    config.log_directory = temp.path();
    config.enable_console = false;
    config.min_level = log_level::info;

    logger_test_fixture fixture(config);

    CHECK_FALSE(logger_adapter::is_level_enabled(log_level::debug));
    CHECK(logger_adapter::is_level_enabled(log_level::info));

    logger_adapter::set_min_level(log_level::error);
    CHECK(logger_adapter::get_min_level() == log_level::error);
    CHECK_FALSE(logger_adapter::is_level_enabled(log_level::warn));
    CHECK_FALSE(logger_adapter::is_level_enabled(log_level::off));
}

// =============================================================================
// Migration Audit Logging Tests
// =============================================================================

TEST_CASE("logger_adapter migration audit trail", "[logger_adapter][audit]") {
    migrator::test::temp_directory temp;
    logger_test_fixture fixture(audit_config(temp.path()));
    const auto audit_path = temp.path() / "audit.json";

    SECTION("applied") {
        logger_adapter::log_migration_applied(2, "002_add_col.sql", "deadbeef", 12);
        auto content = migrator::test::read_file(audit_path);
        CHECK(content.find("\"event_type\":\"MIGRATION_APPLIED\"") != std::string::npos);
        CHECK(content.find("\"name\":\"002_add_col.sql\"") != std::string::npos);
        CHECK(content.find("\"checksum\":\"deadbeef\"") != std::string::npos);
        CHECK(content.find("\"execution_time_ms\":\"12\"") != std::string::npos);
    }

    SECTION("rolled back") {
        logger_adapter::log_migration_rolled_back(2, "002_add_col.sql");
        auto content = migrator::test::read_file(audit_path);
        CHECK(content.find("MIGRATION_ROLLED_BACK") != std::string::npos);
    }

    SECTION("failed, with the reason escaped") {
        logger_adapter::log_migration_failed(3, "003_x.sql", "apply",
                                             "near \"FOO\": syntax error");
        auto content = migrator::test::read_file(audit_path);
        CHECK(content.find("MIGRATION_FAILED") != std::string::npos);
        CHECK(content.find("\"outcome\":\"failure\"") != std::string::npos);
        CHECK(content.find("near \\\"FOO\\\": syntax error") != std::string::npos);
    }

    SECTION("integrity violation") {
        logger_adapter::log_integrity_violation(
            1, "001_init.sql", integrity_violation_kind::missing_file, "abc", "");
        auto content = migrator::test::read_file(audit_path);
        CHECK(content.find("INTEGRITY_VIOLATION") != std::string::npos);
        CHECK(content.find("\"kind\":\"missing_file\"") != std::string::npos);
    }

    SECTION("one JSON object per line") {
        logger_adapter::log_migration_applied(1, "001_init.sql", "a", 1);
        logger_adapter::log_migration_applied(2, "002_b.sql", "b", 1);
        auto content = migrator::test::read_file(audit_path);
        CHECK(std::count(content.begin(), content.end(), '\n') == 2);
    }
}
