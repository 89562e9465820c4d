/**
 * @file rules.cpp
 * @brief Severity/category vocabulary and severity aggregation
 */

#include "apidrift/rules.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace apidrift::rules {

std::string_view to_string(Severity severity) noexcept
{
    switch (severity) {
        case Severity::kBreaking:
            return "Breaking";
        case Severity::kWarning:
            return "Warning";
        case Severity::kChange:
            return "Change";
    }
    return "Change";
}

std::string_view to_string(Category category) noexcept
{
    switch (category) {
        case Category::kSchema:
            return "Schema";
        case Category::kEndpoint:
            return "Endpoint";
        case Category::kParameter:
            return "Parameter";
        case Category::kResponse:
            return "Response";
        case Category::kRequestBody:
            return "RequestBody";
    }
    return "Schema";
}

Result<Severity> parse_severity(std::string_view text)
{
    std::string lowered(text);
    std::ranges::transform(lowered, lowered.begin(), [](unsigned char c) noexcept {
        return static_cast<char>(std::tolower(c));
    });
    if (lowered == "breaking") {
        return Severity::kBreaking;
    }
    if (lowered == "warning") {
        return Severity::kWarning;
    }
    if (lowered == "change") {
        return Severity::kChange;
    }
    return std::unexpected(
        Error::make("InvalidArgument", "Unknown severity: " + std::string(text)));
}

Violation::Violation(std::shared_ptr<const Rule> rule)
    : m_rule(std::move(rule))
{
    if (!m_rule) {
        throw std::invalid_argument("Violation requires a rule");
    }
}

Severity aggregate_severity(std::span<const Violation> violations)
{
    auto overall = Severity::kChange;
    for (const auto& violation : violations) {
        overall = std::max(overall, violation.severity());
        if (overall == Severity::kBreaking) {
            break;
        }
    }
    return overall;
}

}  // namespace apidrift::rules
