#pragma once

/**
 * @file rules.hpp
 * @brief Difference rule vocabulary: severities, categories and violations
 *
 * Every detected difference is a Rule instance. Kinds are open: a new kind is a
 * new Rule subclass, and matchers only decide when to construct one.
 */

#include "apidrift/common.hpp"

#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <utility>

namespace apidrift::rules {

/**
 * Severity of a difference. Declaration order is the severity order, so the
 * enumerators compare with the usual relational operators.
 */
enum class Severity {
    kChange,   ///< Safe or informational
    kWarning,  ///< May cause issues for some consumers
    kBreaking  ///< May break existing consumers
};

/// API aspect a rule belongs to. Only kSchema is produced today.
enum class Category { kSchema, kEndpoint, kParameter, kResponse, kRequestBody };

[[nodiscard]] std::string_view to_string(Severity severity) noexcept;
[[nodiscard]] std::string_view to_string(Category category) noexcept;

/**
 * Parse a severity name, case-insensitively ("breaking", "Warning", ...).
 * @return Severity or InvalidArgument error
 */
[[nodiscard]] Result<Severity> parse_severity(std::string_view text);

/**
 * @brief Capability set shared by every difference kind
 */
class Rule
{
public:
    virtual ~Rule() = default;

    /// Stable identifier, e.g. "PropertyRemoved".
    [[nodiscard]] virtual std::string_view name() const = 0;
    [[nodiscard]] virtual std::string description() const = 0;
    [[nodiscard]] virtual Severity severity() const = 0;
    [[nodiscard]] virtual Category category() const { return Category::kSchema; }
    /// Location in the graph, e.g. "schema: User, property: address.city".
    [[nodiscard]] virtual std::string context() const = 0;
    /// Dotted property path the difference is attached to; empty at schema level.
    [[nodiscard]] virtual std::string anchor() const { return {}; }
};

/**
 * @brief Immutable record of one detected difference
 */
class Violation
{
public:
    explicit Violation(std::shared_ptr<const Rule> rule);

    template <typename R, typename... Args>
    [[nodiscard]] static Violation make(Args&&... args)
    {
        return Violation(std::make_shared<const R>(std::forward<Args>(args)...));
    }

    [[nodiscard]] const Rule& rule() const noexcept { return *m_rule; }
    [[nodiscard]] std::string_view name() const { return m_rule->name(); }
    [[nodiscard]] std::string description() const { return m_rule->description(); }
    [[nodiscard]] Severity severity() const { return m_rule->severity(); }
    [[nodiscard]] Category category() const { return m_rule->category(); }
    [[nodiscard]] std::string context() const { return m_rule->context(); }
    [[nodiscard]] std::string anchor() const { return m_rule->anchor(); }

private:
    std::shared_ptr<const Rule> m_rule;
};

/**
 * Reduce violations to one overall severity: the maximum over all entries,
 * or kChange when there are none.
 */
[[nodiscard]] Severity aggregate_severity(std::span<const Violation> violations);

}  // namespace apidrift::rules
