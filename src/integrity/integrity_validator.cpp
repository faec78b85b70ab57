/**
 * @file integrity_validator.cpp
 * @brief Implementation of ledger checksum validation
 */

#include <migrator/integrity/integrity_validator.hpp>

#include <migrator/catalog/migration_catalog.hpp>
#include <migrator/integration/logger_adapter.hpp>
#include <migrator/integrity/checksum.hpp>
#include <migrator/storage/version_ledger.hpp>

#include <system_error>

namespace migrator::integrity {

namespace {

constexpr const char* module_name = "integrity";

auto to_audit_kind(violation_type type) -> integration::integrity_violation_kind {
    return type == violation_type::missing_file
               ? integration::integrity_violation_kind::missing_file
               : integration::integrity_violation_kind::checksum_mismatch;
}

}  // namespace

integrity_validator::integrity_validator(const catalog::migration_catalog& catalog,
                                         const storage::version_ledger& ledger)
    : catalog_(catalog), ledger_(ledger) {}

auto integrity_validator::validate() const -> Result<validation_report> {
    auto applied = ledger_.list_applied();
    if (applied.is_err()) {
        return make_error<validation_report>(applied.error().code,
                                             applied.error().message,
                                             module_name);
    }

    validation_report report;

    for (const auto& entry : applied.value()) {
        ++report.checked;

        const auto script_path = catalog_.script_path_for(entry.name);
        std::error_code ec;

        integrity_violation violation;
        violation.version = entry.version;
        violation.name = entry.name;
        violation.expected_checksum = entry.checksum;

        if (!std::filesystem::is_regular_file(script_path, ec)) {
            violation.type = violation_type::missing_file;
        } else {
            auto actual = file_checksum(script_path);
            if (actual.is_err()) {
                return make_error<validation_report>(actual.error().code,
                                                     actual.error().message,
                                                     module_name);
            }
            if (actual.value() == entry.checksum) {
                integration::logger_adapter::debug("{} is valid", entry.name);
                continue;
            }
            violation.type = violation_type::checksum_mismatch;
            violation.actual_checksum = actual.value();
        }

        integration::logger_adapter::log_integrity_violation(
            violation.version, violation.name, to_audit_kind(violation.type),
            violation.expected_checksum, violation.actual_checksum.value_or(""));
        report.violations.push_back(std::move(violation));
    }

    report.valid = report.violations.empty();
    return report;
}

}  // namespace migrator::integrity
