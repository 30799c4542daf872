#include <plantsched/io/plant_loader.hpp>
#include <plantsched/io/error.hpp>

#include <plantsched/core/error.hpp>
#include <plantsched/core/machine_type.hpp>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace plantsched::io {

namespace {

using namespace plantsched::core;

// Helper to get required member with error context
const rapidjson::Value& get_member(const rapidjson::Value& obj, const char* name,
                                   const std::string& context) {
    if (!obj.HasMember(name)) {
        throw LoaderError(std::string("missing required field '") + name + "'", context);
    }
    return obj[name];
}

double get_double(const rapidjson::Value& val, const char* name, const std::string& context) {
    const auto& member = get_member(val, name, context);
    if (!member.IsNumber()) {
        throw LoaderError(std::string("field '") + name + "' must be a number", context);
    }
    return member.GetDouble();
}

std::string get_string(const rapidjson::Value& val, const char* name, const std::string& context) {
    const auto& member = get_member(val, name, context);
    if (!member.IsString()) {
        throw LoaderError(std::string("field '") + name + "' must be a string", context);
    }
    return member.GetString();
}

const rapidjson::Value& get_array(const rapidjson::Value& val, const char* name,
                                  const std::string& context) {
    const auto& member = get_member(val, name, context);
    if (!member.IsArray()) {
        throw LoaderError(std::string("field '") + name + "' must be an array", context);
    }
    return member;
}

// Optional getters
double get_double_or(const rapidjson::Value& val, const char* name, double default_val,
                     const std::string& context) {
    if (!val.HasMember(name)) {
        return default_val;
    }
    return get_double(val, name, context);
}

uint32_t get_uint_or(const rapidjson::Value& val, const char* name, uint32_t default_val,
                     const std::string& context) {
    if (!val.HasMember(name)) {
        return default_val;
    }
    const auto& member = val[name];
    if (!member.IsUint()) {
        throw LoaderError(std::string("field '") + name + "' must be a non-negative integer",
                          context);
    }
    return member.GetUint();
}

PlantConstants load_constants(const rapidjson::Value& doc) {
    PlantConstants constants;
    if (!doc.HasMember("constants")) {
        return constants;
    }
    const auto& obj = doc["constants"];
    const std::string ctx = "constants";
    if (!obj.IsObject()) {
        throw LoaderError("must be an object", ctx);
    }

    constants.operator_pool = get_uint_or(obj, "operator_pool", constants.operator_pool, ctx);
    constants.daily_work_minutes = Minutes{
        get_double_or(obj, "daily_work_minutes", constants.daily_work_minutes.count, ctx)};
    constants.work_days_per_week =
        get_uint_or(obj, "work_days_per_week", constants.work_days_per_week, ctx);
    constants.week_length = get_uint_or(obj, "week_length", constants.week_length, ctx);
    return constants;
}

void load_machine_types(ResourceCatalog& catalog, const rapidjson::Value& doc) {
    const auto& types = get_array(doc, "machine_types", "plant");
    for (rapidjson::SizeType idx = 0; idx < types.Size(); ++idx) {
        const auto& obj = types[idx];
        std::string ctx = "machine_types[" + std::to_string(idx) + "]";
        if (!obj.IsObject()) {
            throw LoaderError("must be an object", ctx);
        }

        std::string name = get_string(obj, "name", ctx);
        bool has_length = obj.HasMember("speed_m_per_min");
        bool has_cycle = obj.HasMember("seconds_per_bend");
        if (has_length && has_cycle) {
            throw LoaderError("speed_m_per_min and seconds_per_bend are exclusive", ctx);
        }

        MachineSpeed speed;
        if (has_length) {
            speed = LengthRate{get_double(obj, "speed_m_per_min", ctx)};
        }
        else if (has_cycle) {
            speed = CycleRate{get_double(obj, "seconds_per_bend", ctx)};
        }

        double power = get_double_or(obj, "power_kw", 0.0, ctx);
        uint32_t units = get_uint_or(obj, "units", 0, ctx);
        uint32_t operators = get_uint_or(obj, "operators_per_unit", 0, ctx);

        try {
            catalog.add_machine_type(name, speed, Power{power}, units, operators);
        }
        catch (const PlantError& e) {
            throw LoaderError(e.what(), ctx);
        }
    }
}

ProductRoutingTable load_routes(const rapidjson::Value& doc) {
    ProductRoutingTable routing;
    const auto& routes = get_array(doc, "routes", "plant");
    for (rapidjson::SizeType idx = 0; idx < routes.Size(); ++idx) {
        const auto& obj = routes[idx];
        std::string ctx = "routes[" + std::to_string(idx) + "]";
        if (!obj.IsObject()) {
            throw LoaderError("must be an object", ctx);
        }

        std::string product = get_string(obj, "product", ctx);
        std::string workflow = get_string(obj, "workflow", ctx);
        std::string machine = get_string(obj, "machine", ctx);

        try {
            if (workflow == "forming") {
                routing.add_forming_route(product, machine);
            }
            else if (workflow == "shearing_bending") {
                std::vector<std::string> roles;
                if (obj.HasMember("support_roles")) {
                    const auto& arr = get_array(obj, "support_roles", ctx);
                    for (rapidjson::SizeType ri = 0; ri < arr.Size(); ++ri) {
                        if (!arr[ri].IsString()) {
                            throw LoaderError("support_roles entries must be strings", ctx);
                        }
                        roles.emplace_back(arr[ri].GetString());
                    }
                }
                routing.add_shearing_bending_route(product, machine, std::move(roles));
            }
            else {
                throw LoaderError("unknown workflow '" + workflow + "'", ctx);
            }
        }
        catch (const PlantError& e) {
            throw LoaderError(e.what(), ctx);
        }
    }
    return routing;
}

} // anonymous namespace

PlantConfig load_plant(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw LoaderError("cannot open file", path.string());
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    return load_plant_from_string(oss.str());
}

PlantConfig load_plant_from_string(std::string_view json) {
    rapidjson::Document doc;
    doc.Parse(json.data(), json.size());

    if (doc.HasParseError()) {
        throw LoaderError(
            std::string("JSON parse error: ") + rapidjson::GetParseError_En(doc.GetParseError()),
            "at offset " + std::to_string(doc.GetErrorOffset()));
    }

    if (!doc.IsObject()) {
        throw LoaderError("root must be an object", "plant");
    }

    PlantConfig config;
    load_machine_types(config.catalog, doc);
    try {
        config.catalog.set_constants(load_constants(doc));
    }
    catch (const PlantError& e) {
        throw LoaderError(e.what(), "constants");
    }
    config.catalog.finalize();
    config.routing = load_routes(doc);
    return config;
}

} // namespace plantsched::io
