#include <colloc/core/resource_kind.hpp>

namespace colloc::core {

std::string_view to_string(ResourceKind kind) noexcept {
    switch (kind) {
        case ResourceKind::Quota: return "cpu_quota";
        case ResourceKind::Shares: return "cpu_shares";
        case ResourceKind::CacheBandwidth: return "rdt";
    }
    return "unknown";
}

std::optional<ResourceKind> resource_kind_from_string(std::string_view name) noexcept {
    for (auto kind : {ResourceKind::Quota, ResourceKind::Shares, ResourceKind::CacheBandwidth}) {
        if (to_string(kind) == name) {
            return kind;
        }
    }
    return std::nullopt;
}

} // namespace colloc::core
