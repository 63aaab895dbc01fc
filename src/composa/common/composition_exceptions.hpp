/**
 * @file composition_exceptions.hpp
 */
#pragma once
#include "composa/common/common.hpp"

namespace composa
{

/**
 * @brief Error codes for composition operations.
 *
 * @details
 * Every failing operation reports exactly one of these codes so that callers
 * can tell "already composed, use update instead" apart from "would create a
 * cycle" or "insufficient authority". None of them is retried automatically.
 */
enum class CompositionErrorCode
{
    NotFound,              ///< Referenced node, resource, edge or attachment does not exist.
    AlreadyLinked,         ///< Link requested for a source that already has a target.
    NotLinked,             ///< Update or unlink requested for a source with no target.
    SelfLink,              ///< Source equals target.
    CycleDetected,         ///< The operation would create a cycle.
    DepthLimitExceeded,    ///< The operation would create a chain longer than the root resolution bound.
    InvalidAmount,         ///< Non-positive, oversized or overflowing quantity.
    Unauthorized,          ///< The actor lacks authority for this operation.
    CustodyTransferFailed, ///< The asset collaborator's transfer step failed.
    GraphCorrupted         ///< Root resolution exceeded its bound; the forest invariant is broken.
};

/**
 * @brief Name of an error code, for messages and logs.
 */
inline const char* to_string(CompositionErrorCode code) noexcept
{
    switch (code)
    {
    case CompositionErrorCode::NotFound:
        return "NotFound";
    case CompositionErrorCode::AlreadyLinked:
        return "AlreadyLinked";
    case CompositionErrorCode::NotLinked:
        return "NotLinked";
    case CompositionErrorCode::SelfLink:
        return "SelfLink";
    case CompositionErrorCode::CycleDetected:
        return "CycleDetected";
    case CompositionErrorCode::DepthLimitExceeded:
        return "DepthLimitExceeded";
    case CompositionErrorCode::InvalidAmount:
        return "InvalidAmount";
    case CompositionErrorCode::Unauthorized:
        return "Unauthorized";
    case CompositionErrorCode::CustodyTransferFailed:
        return "CustodyTransferFailed";
    case CompositionErrorCode::GraphCorrupted:
        return "GraphCorrupted";
    }
    return "Unknown";
}

/**
 * @brief Exception class for composition errors.
 *
 * @details
 * `CompositionError` is thrown by `LinkGraph`, `AttachmentLedger` and
 * `Composer` when preconditions are violated or when an operation would
 * break a forest or ledger invariant. Whenever it is thrown from a mutating
 * method, the object it was thrown from is left unchanged.
 *
 * @par Thread safety
 * - The exception object itself follows standard exception semantics.
 * - Safe to copy and rethrow across threads.
 */
class CompositionError : public std::exception
{
public:
    /**
     * @brief Construct a CompositionError.
     * @param code The error code indicating the type of error.
     * @param message A descriptive message explaining the error.
     */
    CompositionError(CompositionErrorCode code, std::string message)
        : m_code(code)
        , m_message(std::move(message))
    {
    }

    /**
     * @brief Get the error code.
     * @return The error code for this exception.
     */
    CompositionErrorCode code() const noexcept
    {
        return m_code;
    }

    /**
     * @brief Get the error message.
     * @return A C-string describing the error.
     */
    const char* what() const noexcept override
    {
        return m_message.c_str();
    }

private:
    CompositionErrorCode m_code;
    std::string m_message;
};

} // namespace composa
