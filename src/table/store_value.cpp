#include "table/store_value.hpp"

#include "common/errors.hpp"

namespace funtable {

StoreValue StoreValue::from_data(nlohmann::json data) {
    StoreValue value;
    value.data = std::move(data);
    return value;
}

void to_json(nlohmann::json& j, const StoreValue& value) {
    j = nlohmann::json{
        {"created_at", value.created_at},
        {"updated_at", value.updated_at},
        {"data",       value.data},
    };
}

void from_json(const nlohmann::json& j, StoreValue& value) {
    if (!j.is_object()) {
        throw ValueTypeError("Stored value is not an object");
    }
    auto data = j.find("data");
    if (data == j.end() || !data->is_object()) {
        throw ValueTypeError("Stored value has no object 'data' field");
    }
    auto created = j.find("created_at");
    auto updated = j.find("updated_at");
    value.created_at = (created != j.end() && created->is_number())
        ? created->get<double>() : 0.0;
    value.updated_at = (updated != j.end() && updated->is_number())
        ? updated->get<double>() : 0.0;
    value.data = *data;
}

StoreValue stamp_for_write(const StoreValue& incoming,
                           const std::optional<StoreValue>& previous,
                           double now) {
    StoreValue stamped = incoming;
    if (previous) {
        stamped.created_at = previous->created_at;
    } else if (stamped.created_at <= 0.0) {
        stamped.created_at = now;
    }
    stamped.updated_at = now;
    return stamped;
}

} // namespace funtable
