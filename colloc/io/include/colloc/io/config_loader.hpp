#pragma once

/// @file config_loader.hpp
/// @brief Loading of the allocation configuration from JSON.
/// @ingroup io_loaders

#include <colloc/core/configuration.hpp>

#include <filesystem>
#include <string_view>

namespace colloc::io {

/// @brief Load an allocation configuration from a JSON file.
///
/// Every key is optional and falls back to the AllocationConfiguration
/// default: `cpu_quota_period`, `cpu_shares_min`, `cpu_shares_max`,
/// `default_rdt_l3`, `default_rdt_mb`. Unknown keys are ignored.
///
/// @param path  Filesystem path to the JSON configuration.
/// @return Validated configuration.
///
/// @throws LoaderError  If the file cannot be read, is not valid JSON, or
///                      the configuration fails validation.
///
/// @see load_allocation_configuration_from_string, core::AllocationConfiguration::validate
core::AllocationConfiguration load_allocation_configuration(const std::filesystem::path& path);

/// @brief Load an allocation configuration from a JSON string.
///
/// @param json  JSON object with the configuration keys.
/// @return Validated configuration.
///
/// @throws LoaderError  If the JSON is malformed or fails validation.
///
/// @see load_allocation_configuration
core::AllocationConfiguration load_allocation_configuration_from_string(std::string_view json);

} // namespace colloc::io
