/**
 * @file checksum_test.cpp
 * @brief Unit tests for SHA-256 script digests
 */

#include <catch2/catch_test_macros.hpp>

#include <migrator/integrity/checksum.hpp>

#include "../fixtures/migration_fixture.hpp"

using namespace migrator;
using namespace migrator::integrity;

TEST_CASE("sha256_hex known digests", "[integrity][checksum]") {
    SECTION("empty input") {
        auto digest = sha256_hex("");
        REQUIRE(digest.is_ok());
        CHECK(digest.value() ==
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    }

    SECTION("abc") {
        auto digest = sha256_hex("abc");
        REQUIRE(digest.is_ok());
        CHECK(digest.value() ==
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
        CHECK(digest.value().size() == checksum_length);
    }

    SECTION("line endings change the digest") {
        CHECK(sha256_hex("SELECT 1;\n").value() != sha256_hex("SELECT 1;\r\n").value());
    }
}

TEST_CASE("file_checksum", "[integrity][checksum]") {
    test::temp_directory temp;
    auto path = temp.path() / "001_init.sql";
    test::write_file(path, "abc");

    auto digest = file_checksum(path);
    REQUIRE(digest.is_ok());
    CHECK(digest.value() == sha256_hex("abc").value());

    auto missing = file_checksum(temp.path() / "absent.sql");
    REQUIRE(missing.is_err());
    CHECK(missing.error().code == error_codes::file_read_error);
}
