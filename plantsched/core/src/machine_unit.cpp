#include <plantsched/core/machine_unit.hpp>
#include <plantsched/core/machine_type.hpp>

namespace plantsched::core {

MachineUnit::MachineUnit(const MachineType& type, uint32_t index)
    : type_(type)
    , key_{type.id(), index}
    , label_(std::string(type.name()) + "_" + std::to_string(index + 1)) {}

} // namespace plantsched::core
