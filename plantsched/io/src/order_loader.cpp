#include <plantsched/io/order_loader.hpp>
#include <plantsched/io/error.hpp>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#include <fstream>
#include <optional>
#include <sstream>
#include <string>

namespace plantsched::io {

namespace {

using namespace plantsched::core;

std::string get_string(const rapidjson::Value& val, const char* name, const std::string& context) {
    if (!val.HasMember(name)) {
        throw LoaderError(std::string("missing required field '") + name + "'", context);
    }
    const auto& member = val[name];
    if (!member.IsString()) {
        throw LoaderError(std::string("field '") + name + "' must be a string", context);
    }
    return member.GetString();
}

struct QuantityResult {
    OrderQuantity quantity;
    std::optional<std::string> problem;
};

QuantityResult read_quantity(const rapidjson::Value& obj) {
    bool has_length = obj.HasMember("total_length_m");
    bool has_bends = obj.HasMember("bends_per_item") || obj.HasMember("item_count");

    if (has_length && has_bends) {
        return {std::monostate{}, "both a length and a bend quantity were given"};
    }
    if (has_length) {
        const auto& length = obj["total_length_m"];
        if (!length.IsNumber()) {
            return {std::monostate{}, "total_length_m is not a number"};
        }
        return {LengthQuantity{length.GetDouble()}, std::nullopt};
    }
    if (has_bends) {
        if (!obj.HasMember("bends_per_item") || !obj.HasMember("item_count")) {
            return {std::monostate{}, "bend quantity needs both bends_per_item and item_count"};
        }
        const auto& bends = obj["bends_per_item"];
        const auto& items = obj["item_count"];
        if (!bends.IsInt64() || !items.IsInt64()) {
            return {std::monostate{}, "bends_per_item and item_count must be integers"};
        }
        return {BendQuantity{bends.GetInt64(), items.GetInt64()}, std::nullopt};
    }
    return {std::monostate{}, "missing quantity"};
}

Order read_order(const rapidjson::Value& obj, const std::string& ctx) {
    if (!obj.IsObject()) {
        throw LoaderError("must be an object", ctx);
    }

    std::string id = get_string(obj, "id", ctx);
    std::string product_type = get_string(obj, "product_type", ctx);

    std::optional<std::string> problem;
    Priority priority = Priority::Normal;
    if (!obj.HasMember("priority") || !obj["priority"].IsString()) {
        problem = "missing priority";
    }
    else if (auto parsed = parse_priority(obj["priority"].GetString())) {
        priority = *parsed;
    }
    else {
        problem = std::string("unknown priority '") + obj["priority"].GetString() + "'";
    }

    QuantityResult quantity = read_quantity(obj);
    if (!problem) {
        problem = quantity.problem;
    }

    Order order(std::move(id), std::move(product_type), priority, quantity.quantity);
    if (obj.HasMember("thickness") && obj["thickness"].IsString()) {
        order.set_thickness(obj["thickness"].GetString());
    }
    if (problem) {
        order.reject(std::move(*problem));
    }
    return order;
}

} // anonymous namespace

std::vector<Order> load_orders(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw LoaderError("cannot open file", path.string());
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    return load_orders_from_string(oss.str());
}

std::vector<Order> load_orders_from_string(std::string_view json) {
    rapidjson::Document doc;
    doc.Parse(json.data(), json.size());

    if (doc.HasParseError()) {
        throw LoaderError(
            std::string("JSON parse error: ") + rapidjson::GetParseError_En(doc.GetParseError()),
            "at offset " + std::to_string(doc.GetErrorOffset()));
    }
    if (!doc.IsObject()) {
        throw LoaderError("root must be an object", "orders");
    }
    if (!doc.HasMember("orders") || !doc["orders"].IsArray()) {
        throw LoaderError("field 'orders' must be an array", "orders");
    }

    const auto& records = doc["orders"];
    std::vector<Order> orders;
    orders.reserve(records.Size());
    for (rapidjson::SizeType idx = 0; idx < records.Size(); ++idx) {
        orders.push_back(read_order(records[idx], "orders[" + std::to_string(idx) + "]"));
    }
    return orders;
}

} // namespace plantsched::io
