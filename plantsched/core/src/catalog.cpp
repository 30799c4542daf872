#include <plantsched/core/catalog.hpp>
#include <plantsched/core/error.hpp>

#include <string>
#include <utility>

namespace plantsched::core {

MachineType& ResourceCatalog::add_machine_type(std::string_view name, MachineSpeed speed,
                                               Power power, uint32_t unit_count,
                                               uint32_t operators_per_unit) {
    if (finalized_) {
        throw AlreadyFinalizedError("Cannot add machine type after finalize()");
    }
    if (find_machine_type(name) != nullptr) {
        throw InvalidConfigurationError("duplicate machine type '" + std::string(name) + "'");
    }

    std::size_t id = machine_types_.size();
    machine_types_.push_back(std::make_unique<MachineType>(id, name, speed, power, unit_count,
                                                           operators_per_unit));
    return *machine_types_.back();
}

void ResourceCatalog::set_constants(const PlantConstants& constants) {
    if (finalized_) {
        throw AlreadyFinalizedError("Cannot change plant constants after finalize()");
    }
    if (!(constants.daily_work_minutes.count > 0.0)) {
        throw InvalidConfigurationError("daily working minutes must be positive");
    }
    if (constants.week_length == 0 || constants.work_days_per_week == 0 ||
        constants.work_days_per_week > constants.week_length) {
        throw InvalidConfigurationError("working days per week must be within 1.." +
                                        std::to_string(constants.week_length));
    }
    constants_ = constants;
}

void ResourceCatalog::finalize() {
    if (finalized_) {
        return;
    }

    units_by_type_.resize(machine_types_.size());
    for (const auto& type : machine_types_) {
        for (uint32_t idx = 0; idx < type->unit_count(); ++idx) {
            units_.push_back(std::make_unique<MachineUnit>(*type, idx));
            units_by_type_[type->id()].push_back(units_.back().get());
        }
    }
    finalized_ = true;
}

const MachineType& ResourceCatalog::machine_type(std::size_t id) const {
    if (id >= machine_types_.size()) {
        throw OutOfRangeError("machine type id " + std::to_string(id) + " out of range");
    }
    return *machine_types_[id];
}

const MachineType* ResourceCatalog::find_machine_type(std::string_view name) const noexcept {
    for (const auto& type : machine_types_) {
        if (type->name() == name) {
            return type.get();
        }
    }
    return nullptr;
}

const MachineUnit& ResourceCatalog::unit(const UnitKey& key) const {
    if (key.type_id < units_by_type_.size() && key.index < units_by_type_[key.type_id].size()) {
        return *units_by_type_[key.type_id][key.index];
    }
    throw OutOfRangeError("no machine unit " + std::to_string(key.type_id) + "/" +
                          std::to_string(key.index));
}

std::span<const MachineUnit* const> ResourceCatalog::units_of(std::size_t type_id) const {
    if (type_id >= units_by_type_.size()) {
        return {};
    }
    return units_by_type_[type_id];
}

ResourceCatalog make_reference_catalog() {
    ResourceCatalog catalog;
    catalog.add_machine_type("Yane600", LengthRate{16.0}, Power{11.0}, 2, 1);
    catalog.add_machine_type("Yane672", LengthRate{20.0}, Power{16.5}, 1, 1);
    catalog.add_machine_type("Yane750", LengthRate{20.0}, Power{9.5}, 1, 1);
    catalog.add_machine_type("Bending", CycleRate{4.0}, Power{9.7}, 2, 2);
    catalog.add_machine_type("Shearing", std::monostate{}, Power{0.0}, 0, 2);
    catalog.add_machine_type("Forklift", std::monostate{}, Power{0.0}, 0, 1);
    catalog.set_constants(PlantConstants{10, Minutes{480.0}, 5, 7});
    catalog.finalize();
    return catalog;
}

} // namespace plantsched::core
