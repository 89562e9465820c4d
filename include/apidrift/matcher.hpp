#pragma once

/**
 * @file matcher.hpp
 * @brief Schema matcher: compares two schema tables name by name
 */

#include "apidrift/rules.hpp"
#include "apidrift/schema.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace apidrift::matcher {

/**
 * @brief All violations found for one schema name
 */
struct MatchResult
{
    std::string name;
    std::vector<rules::Violation> violations;  ///< In discovery order
    rules::Severity severity;                  ///< Aggregated over violations
};

/// Build a result with its severity aggregated from @p violations.
[[nodiscard]] MatchResult make_match_result(std::string name,
                                            std::vector<rules::Violation> violations);

/**
 * @brief Compares a base and a current schema table
 *
 * Both tables must outlive the matcher and are never modified. Calls are
 * independent of each other; the matcher keeps no state between them.
 */
class SchemaMatcher
{
public:
    SchemaMatcher(const schema::SchemaTable& base, const schema::SchemaTable& current);

    /**
     * Compare every schema name present in either table.
     * @return One result per name, in lexicographic name order
     */
    [[nodiscard]] std::vector<MatchResult> match() const;

    /// Compare a single schema name (absent from both tables yields no violations).
    [[nodiscard]] MatchResult match_schema(std::string_view name) const;

private:
    const schema::SchemaTable& m_base;
    const schema::SchemaTable& m_current;
};

}  // namespace apidrift::matcher
