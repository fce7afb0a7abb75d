#pragma once

#include <stdexcept>
#include <string>

namespace colloc::core {

/// @brief Base exception for all reconciliation errors.
///
/// All exceptions thrown by the core library derive from this class,
/// allowing callers to catch engine-specific errors separately from
/// other `std::runtime_error` exceptions.
///
/// @see ParseError, UnsupportedValueType
/// @ingroup core
class ReconcileError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// @brief Thrown when a domain-keyed schema string is malformed.
///
/// Raised for a missing `=` separator, an empty domain id or value, a
/// duplicated domain id, or a non-empty line without any domain entry.
/// A malformed schema must never reach the resource-control mechanism,
/// so this error always propagates to the caller.
///
/// @see decode_domain_map, ReconcileError
/// @ingroup core
class ParseError : public ReconcileError {
public:
    /// @brief Construct a ParseError describing the offending line.
    /// @param message Human-readable description of the problem.
    /// @param line    The schema string being decoded.
    ParseError(const std::string& message, const std::string& line)
        : ReconcileError(message + " in '" + line + "'") {}
};

/// @brief Thrown when an allocation value has a shape the engine cannot handle.
///
/// Raised when a desired scalar must be compared against a current entry
/// of the same kind that is not a scalar, or when a merge finds a scalar
/// in the current ResourceKind::CacheBandwidth entry. Processing stops
/// instead of guessing a comparison.
///
/// @see reconcile_workload, ReconcileError
/// @ingroup core
class UnsupportedValueType : public ReconcileError {
public:
    using ReconcileError::ReconcileError;
};

} // namespace colloc::core
