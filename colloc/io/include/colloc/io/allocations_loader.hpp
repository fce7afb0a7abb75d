#pragma once

/// @file allocations_loader.hpp
/// @brief Reading and writing workload allocations as JSON.
///
/// The JSON form is an object keyed by workload id whose values are
/// objects keyed by resource kind name. A number is a scalar allocation
/// and an object with optional `name`, `l3` and `mb` strings is a
/// cache/bandwidth allocation, whichever kind key holds it:
///
/// @code{.json}
/// {
///   "task-1": {"cpu_quota": 0.5, "cpu_shares": 0.2},
///   "task-2": {"rdt": {"name": "be", "l3": "L3:0=f;1=f", "mb": "MB:0=20;1=20"}}
/// }
/// @endcode
///
/// @ingroup io_loaders

#include <colloc/core/allocation.hpp>

#include <filesystem>
#include <ostream>
#include <string_view>

namespace colloc::io {

/// @brief Load workload allocations from a JSON file.
///
/// @param path  Filesystem path to the JSON allocations.
/// @return Parsed allocations.
///
/// @throws LoaderError  If the file cannot be read, is not valid JSON,
///                      repeats a workload id or kind, uses
///                      an unknown resource kind or a wrongly typed value.
///
/// @see load_allocations_from_string
core::WorkloadAllocations load_allocations(const std::filesystem::path& path);

/// @brief Load workload allocations from a JSON string.
///
/// @param json  JSON content.
/// @return Parsed allocations.
///
/// @throws LoaderError  If the JSON is malformed or fails validation.
///
/// @see load_allocations
core::WorkloadAllocations load_allocations_from_string(std::string_view json);

/// @brief Write workload allocations as JSON to an output stream.
///
/// Workloads and kinds are written in sorted order so that equal inputs
/// produce identical output.
///
/// @param allocations  Allocations to serialise.
/// @param out          Output stream.
///
/// @throws WriterError  If a scalar allocation is NaN or infinite.
///
/// @see load_allocations_from_string
void write_allocations_to_stream(const core::WorkloadAllocations& allocations, std::ostream& out);

} // namespace colloc::io
