#include <colloc/core/allocator.hpp>

namespace colloc::core {

AllocationDecision NopAllocator::allocate(const Platform& /*platform*/,
                                          const WorkloadMeasurements& /*measurements*/,
                                          const WorkloadResources& /*resources*/,
                                          const WorkloadLabels& /*labels*/,
                                          const WorkloadAllocations& /*current*/) {
    return {};
}

} // namespace colloc::core
