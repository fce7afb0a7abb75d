#include <colloc/io/metric_writers.hpp>
#include <colloc/io/error.hpp>

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <cmath>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_set>

namespace colloc::io {

namespace {

std::string escape_label_value(std::string_view str) {
    std::string escaped;
    escaped.reserve(str.size());
    for (char c : str) {
        switch (c) {
            case '\\': escaped += "\\\\"; break;
            case '"':  escaped += "\\\""; break;
            case '\n': escaped += "\\n"; break;
            default:   escaped += c;
        }
    }
    return escaped;
}

std::string format_value(double value) {
    if (std::isnan(value)) {
        return "NaN";
    }
    if (std::isinf(value)) {
        return value > 0 ? "+Inf" : "-Inf";
    }
    std::ostringstream oss;
    oss << std::setprecision(17) << value;
    return oss.str();
}

} // anonymous namespace

// =============================================================================
// JSON
// =============================================================================

void write_metrics_to_stream(const core::Metrics& metrics, std::ostream& out) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);

    writer.StartArray();
    for (const auto& metric : metrics) {
        writer.StartObject();

        writer.Key("name");
        writer.String(metric.name.c_str(), static_cast<rapidjson::SizeType>(metric.name.size()));

        writer.Key("value");
        if (!writer.Double(metric.value)) {
            throw WriterError("metric value is not finite", metric.name);
        }

        writer.Key("type");
        auto type = core::to_string(metric.type);
        writer.String(type.data(), static_cast<rapidjson::SizeType>(type.size()));

        writer.Key("labels");
        writer.StartObject();
        for (const auto& [key, value] : metric.labels) {
            writer.Key(key.c_str(), static_cast<rapidjson::SizeType>(key.size()));
            writer.String(value.c_str(), static_cast<rapidjson::SizeType>(value.size()));
        }
        writer.EndObject();

        writer.EndObject();
    }
    writer.EndArray();

    out << buffer.GetString();
}

// =============================================================================
// Text exposition
// =============================================================================

void write_metrics_text(const core::Metrics& metrics, std::ostream& out) {
    std::unordered_set<std::string> typed;

    for (const auto& metric : metrics) {
        if (typed.insert(metric.name).second) {
            out << "# TYPE " << metric.name << " " << core::to_string(metric.type) << "\n";
        }

        out << metric.name;
        if (!metric.labels.empty()) {
            out << "{";
            bool first = true;
            for (const auto& [key, value] : metric.labels) {
                if (!first) {
                    out << ",";
                }
                first = false;
                out << key << "=\"" << escape_label_value(value) << "\"";
            }
            out << "}";
        }
        out << " " << format_value(metric.value) << "\n";
    }
}

} // namespace colloc::io
