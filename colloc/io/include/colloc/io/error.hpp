#pragma once

/// @file error.hpp
/// @brief Errors raised while reading or writing colloc documents.
/// @ingroup io

#include <stdexcept>
#include <string>

namespace colloc::io {

/// @brief Base of all I/O errors, carrying the location that failed.
///
/// The message reads `"<context>: <message>"`, where context is a file
/// path, a workload id or a dotted field path such as `task-1.rdt.l3`.
///
/// @ingroup io
class IoError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;

    IoError(const std::string& message, const std::string& context)
        : std::runtime_error(context + ": " + message) {}
};

/// @brief Input could not be turned into colloc values.
///
/// Covers unreadable files, malformed JSON, unknown resource kinds,
/// mistyped or duplicate members, malformed schema strings and
/// configuration that fails validation.
///
/// @ingroup io
/// @see load_allocations, load_allocation_configuration
class LoaderError : public IoError {
public:
    using IoError::IoError;
};

/// @brief A value cannot be represented in the output format.
///
/// JSON has no encoding for NaN or infinite numbers, so a non-finite
/// scalar allocation or metric value stops serialisation.
///
/// @ingroup io
/// @see write_allocations_to_stream, write_metrics_to_stream
class WriterError : public IoError {
public:
    using IoError::IoError;
};

} // namespace colloc::io
