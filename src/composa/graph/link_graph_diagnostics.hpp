/**
 * @file link_graph_diagnostics.hpp
 */
#pragma once
#include "composa/common/common.hpp"
#include "composa/common/composition_types.hpp"

namespace composa
{

// ============================================================================
// Diagnostic item types
// ============================================================================

/**
 * @brief Severity level for diagnostic items.
 */
enum class DiagnosticSeverity
{
    Warning,  ///< Non-blocking issue that may indicate a problem.
    Error     ///< Broken invariant.
};

/**
 * @brief Category of diagnostic issue.
 */
enum class DiagnosticCategory
{
    Cycle,                  ///< The target relation contains a directed cycle.
    ReverseIndexMismatch,   ///< Children sets disagree with the target table.
    DepthExceeded,          ///< A chain is longer than the root resolution bound.
    DeepChain,              ///< A chain is longer than the warning threshold.
    Quarantined,            ///< A node is quarantined after a failed root resolution.
    ConservationViolation   ///< Ledger total for a resource exceeds custody.
};

/**
 * @brief Name of a diagnostic category, for messages and logs.
 */
inline const char* to_string(DiagnosticCategory category) noexcept
{
    switch (category)
    {
    case DiagnosticCategory::Cycle:
        return "Cycle";
    case DiagnosticCategory::ReverseIndexMismatch:
        return "ReverseIndexMismatch";
    case DiagnosticCategory::DepthExceeded:
        return "DepthExceeded";
    case DiagnosticCategory::DeepChain:
        return "DeepChain";
    case DiagnosticCategory::Quarantined:
        return "Quarantined";
    case DiagnosticCategory::ConservationViolation:
        return "ConservationViolation";
    }
    return "Unknown";
}

/**
 * @brief A single diagnostic item (error or warning).
 */
struct DiagnosticItem
{
    DiagnosticSeverity severity;
    DiagnosticCategory category;
    std::string message;

    /// Nodes involved in this issue, in walk order where a walk is involved.
    std::vector<NodeIdx> involved_nodes;

    /// Resource involved in this issue (ConservationViolation only).
    std::optional<ResourceKey> resource;
};

// ============================================================================
// CompositionDiagnostics
// ============================================================================

/**
 * @brief Diagnostic information collected from a LinkGraph or a Composer.
 *
 * @details
 * Produced by `LinkGraph::get_diagnostics()`, which audits the forest
 * invariants from scratch, and extended by `Composer::get_diagnostics()`
 * with the conservation audit against asset custody.
 *
 * @par Error vs Warning
 * - **Errors** are broken invariants: Cycle, ReverseIndexMismatch,
 *   DepthExceeded, ConservationViolation.
 * - **Warnings** are non-blocking: DeepChain, Quarantined.
 *
 * @par Thread safety
 * - Once constructed, the data is immutable.
 * - Concurrent reads are safe.
 */
class CompositionDiagnostics
{
public:
    bool has_errors() const noexcept
    {
        return !m_errors.empty();
    }

    bool has_warnings() const noexcept
    {
        return !m_warnings.empty();
    }

    /**
     * @brief Check if every audited invariant holds.
     * @return True if there are no errors (warnings are allowed).
     */
    bool is_valid() const noexcept
    {
        return m_errors.empty();
    }

    const std::vector<DiagnosticItem>& errors() const noexcept
    {
        return m_errors;
    }

    const std::vector<DiagnosticItem>& warnings() const noexcept
    {
        return m_warnings;
    }

    /**
     * @brief Get all diagnostic items (errors and warnings combined).
     * @return A vector containing all items, errors first then warnings.
     */
    std::vector<DiagnosticItem> all_items() const
    {
        std::vector<DiagnosticItem> result;
        result.reserve(m_errors.size() + m_warnings.size());
        result.insert(result.end(), m_errors.begin(), m_errors.end());
        result.insert(result.end(), m_warnings.begin(), m_warnings.end());
        return result;
    }

    /**
     * @brief Check whether any item of the given category was reported.
     */
    bool has_category(DiagnosticCategory category) const noexcept
    {
        auto matches = [category](const DiagnosticItem& item) { return item.category == category; };
        return std::any_of(m_errors.begin(), m_errors.end(), matches) ||
               std::any_of(m_warnings.begin(), m_warnings.end(), matches);
    }

    /**
     * @brief Append an item to the errors or warnings, by its severity.
     */
    void add(DiagnosticItem item)
    {
        if (item.severity == DiagnosticSeverity::Error)
        {
            m_errors.push_back(std::move(item));
        }
        else
        {
            m_warnings.push_back(std::move(item));
        }
    }

private:
    std::vector<DiagnosticItem> m_errors;
    std::vector<DiagnosticItem> m_warnings;
};

} // namespace composa
