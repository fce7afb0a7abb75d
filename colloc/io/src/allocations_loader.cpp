#include <colloc/io/allocations_loader.hpp>
#include <colloc/io/error.hpp>

#include <colloc/core/error.hpp>
#include <colloc/core/schemata.hpp>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <algorithm>
#include <fstream>
#include <map>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace colloc::io {

namespace {

using namespace colloc::core;

std::optional<std::string> get_optional_string(const rapidjson::Value& val, const char* name,
                                               const std::string& context) {
    if (!val.HasMember(name) || val[name].IsNull()) {
        return std::nullopt;
    }
    const auto& member = val[name];
    if (!member.IsString()) {
        throw LoaderError(std::string("field '") + name + "' must be a string", context);
    }
    return std::string(member.GetString(), member.GetStringLength());
}

// Reject malformed rows at load time rather than at encoding time
void check_schema(const std::optional<std::string>& schema, const std::string& context) {
    if (!schema) {
        return;
    }
    try {
        (void)decode_domain_map(*schema);
    } catch (const ParseError& e) {
        throw LoaderError(e.what(), context);
    }
}

CacheBandwidthAllocation parse_cache_bandwidth(const rapidjson::Value& obj,
                                               const std::string& context) {
    if (!obj.IsObject()) {
        throw LoaderError("rdt allocation must be an object", context);
    }
    auto name = get_optional_string(obj, "name", context);
    auto l3 = get_optional_string(obj, "l3", context);
    auto mb = get_optional_string(obj, "mb", context);
    check_schema(l3, context + ".l3");
    check_schema(mb, context + ".mb");
    return CacheBandwidthAllocation(std::move(name), std::move(l3), std::move(mb));
}

AllocationMap parse_workload(const rapidjson::Value& obj, const std::string& context) {
    if (!obj.IsObject()) {
        throw LoaderError("allocations must be an object", context);
    }

    AllocationMap allocations;
    for (auto it = obj.MemberBegin(); it != obj.MemberEnd(); ++it) {
        std::string key(it->name.GetString(), it->name.GetStringLength());
        std::string ctx = context + "." + key;

        auto kind = resource_kind_from_string(key);
        if (!kind) {
            throw LoaderError("unknown allocation type '" + key + "'", context);
        }

        // The JSON shape selects the value alternative, as in the model
        AllocationValue value;
        if (it->value.IsNumber()) {
            value = it->value.GetDouble();
        } else if (it->value.IsObject()) {
            value = parse_cache_bandwidth(it->value, ctx);
        } else {
            throw LoaderError("allocation must be a number or an object", ctx);
        }

        if (!allocations.emplace(*kind, std::move(value)).second) {
            throw LoaderError("duplicate allocation type '" + key + "'", context);
        }
    }
    return allocations;
}

template<typename Writer>
void write_optional_string(Writer& writer, const char* key, const std::optional<std::string>& value) {
    if (value) {
        writer.Key(key);
        writer.String(value->c_str(), static_cast<rapidjson::SizeType>(value->size()));
    }
}

} // anonymous namespace

core::WorkloadAllocations load_allocations(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw LoaderError("cannot open file", path.string());
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    return load_allocations_from_string(oss.str());
}

core::WorkloadAllocations load_allocations_from_string(std::string_view json) {
    rapidjson::Document doc;
    doc.Parse(json.data(), json.size());

    if (doc.HasParseError()) {
        throw LoaderError(
            std::string("JSON parse error: ") + rapidjson::GetParseError_En(doc.GetParseError()),
            "at offset " + std::to_string(doc.GetErrorOffset()));
    }

    if (!doc.IsObject()) {
        throw LoaderError("root must be an object", "allocations");
    }

    core::WorkloadAllocations result;
    for (auto it = doc.MemberBegin(); it != doc.MemberEnd(); ++it) {
        std::string workload_id(it->name.GetString(), it->name.GetStringLength());
        if (result.contains(workload_id)) {
            throw LoaderError("duplicate workload id", workload_id);
        }
        result.emplace(workload_id, parse_workload(it->value, workload_id));
    }
    return result;
}

void write_allocations_to_stream(const core::WorkloadAllocations& allocations, std::ostream& out) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);

    std::vector<const core::WorkloadAllocations::value_type*> workloads;
    workloads.reserve(allocations.size());
    for (const auto& entry : allocations) {
        workloads.push_back(&entry);
    }
    std::sort(workloads.begin(), workloads.end(),
        [](const auto* lhs, const auto* rhs) { return lhs->first < rhs->first; });

    writer.StartObject();
    for (const auto* workload : workloads) {
        writer.Key(workload->first.c_str(), static_cast<rapidjson::SizeType>(workload->first.size()));
        writer.StartObject();

        // Sorted by kind name
        std::map<std::string_view, const core::AllocationValue*> kinds;
        for (const auto& [kind, value] : workload->second) {
            kinds.emplace(core::to_string(kind), &value);
        }

        for (const auto& [name, value] : kinds) {
            writer.Key(name.data(), static_cast<rapidjson::SizeType>(name.size()));
            if (const auto* scalar = std::get_if<double>(value)) {
                if (!writer.Double(*scalar)) {
                    throw WriterError("allocation value is not finite",
                                      workload->first + "." + std::string(name));
                }
            } else if (const auto* cb = std::get_if<core::CacheBandwidthAllocation>(value)) {
                writer.StartObject();
                write_optional_string(writer, "name", cb->group_name());
                write_optional_string(writer, "l3", cb->cache_schema());
                write_optional_string(writer, "mb", cb->bandwidth_schema());
                writer.EndObject();
            } else {
                throw WriterError("cannot serialise valueless allocation", workload->first);
            }
        }

        writer.EndObject();
    }
    writer.EndObject();

    out << buffer.GetString();
}

} // namespace colloc::io
