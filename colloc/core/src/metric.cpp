#include <colloc/core/metric.hpp>

namespace colloc::core {

std::string_view to_string(MetricType type) noexcept {
    switch (type) {
        case MetricType::Gauge: return "gauge";
        case MetricType::Counter: return "counter";
    }
    return "untyped";
}

} // namespace colloc::core
