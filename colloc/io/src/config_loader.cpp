#include <colloc/io/config_loader.hpp>
#include <colloc/io/error.hpp>

#include <colloc/core/error.hpp>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#include <fstream>
#include <sstream>
#include <string>

namespace colloc::io {

namespace {

constexpr const char* CONTEXT = "configuration";

int64_t get_int64_or(const rapidjson::Value& val, const char* name, int64_t default_val) {
    if (!val.HasMember(name)) {
        return default_val;
    }
    const auto& member = val[name];
    if (!member.IsInt64()) {
        throw LoaderError(std::string("field '") + name + "' must be an integer", CONTEXT);
    }
    return member.GetInt64();
}

std::optional<std::string> get_optional_string(const rapidjson::Value& val, const char* name) {
    if (!val.HasMember(name) || val[name].IsNull()) {
        return std::nullopt;
    }
    const auto& member = val[name];
    if (!member.IsString()) {
        throw LoaderError(std::string("field '") + name + "' must be a string", CONTEXT);
    }
    return std::string(member.GetString(), member.GetStringLength());
}

} // anonymous namespace

core::AllocationConfiguration load_allocation_configuration(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw LoaderError("cannot open file", path.string());
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    return load_allocation_configuration_from_string(oss.str());
}

core::AllocationConfiguration load_allocation_configuration_from_string(std::string_view json) {
    rapidjson::Document doc;
    doc.Parse(json.data(), json.size());

    if (doc.HasParseError()) {
        throw LoaderError(
            std::string("JSON parse error: ") + rapidjson::GetParseError_En(doc.GetParseError()),
            "at offset " + std::to_string(doc.GetErrorOffset()));
    }

    if (!doc.IsObject()) {
        throw LoaderError("root must be an object", CONTEXT);
    }

    core::AllocationConfiguration config;
    config.cpu_quota_period = get_int64_or(doc, "cpu_quota_period", config.cpu_quota_period);
    config.cpu_shares_min = get_int64_or(doc, "cpu_shares_min", config.cpu_shares_min);
    config.cpu_shares_max = get_int64_or(doc, "cpu_shares_max", config.cpu_shares_max);
    config.default_cache_schema = get_optional_string(doc, "default_rdt_l3");
    config.default_bandwidth_schema = get_optional_string(doc, "default_rdt_mb");

    try {
        config.validate();
    } catch (const core::ReconcileError& e) {
        throw LoaderError(e.what(), CONTEXT);
    }

    return config;
}

} // namespace colloc::io
