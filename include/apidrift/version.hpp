#pragma once

/**
 * @file version.hpp
 * @brief apidrift version information
 *
 * Naming convention: kPascalCase for constants (Google C++ Style Guide)
 */

namespace apidrift {

/// apidrift version string
constexpr const char* kVersion = "0.2.0";

/// Build identifier
constexpr const char* kBuildId = "dev";

/// Output format versions (embedded in every report and config)
constexpr const char* kReportSchemaVersion = "diff_report.v1";
constexpr const char* kConfigSchemaVersion = "config.v1";

}  // namespace apidrift
