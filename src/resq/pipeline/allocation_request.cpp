/**
 * @file allocation_request.cpp
 */
#include "resq/pipeline/allocation_request.hpp"
#include "resq/common/errors.hpp"

namespace resq
{

namespace
{

FieldValue read_attribute(const JsonValue& v, const std::string& ctx)
{
    switch (v.kind)
    {
    case JsonValue::Kind::Bool:
        return FieldValue{v.bool_value};
    case JsonValue::Kind::Number:
        return FieldValue{v.number_value};
    case JsonValue::Kind::String:
        return FieldValue{v.string_value};
    case JsonValue::Kind::Array:
    {
        std::vector<std::string> items;
        for (const auto& item : v.array_values)
        {
            items.push_back(item.as_string(ctx));
        }
        return FieldValue{std::move(items)};
    }
    case JsonValue::Kind::Null:
    case JsonValue::Kind::Object:
        break;
    }
    throw ConfigError(ctx + ": attribute must be a boolean, number, string or string array");
}

EventContext read_event(const JsonValue& v)
{
    const std::string ctx = "event";
    v.expect_only_keys(
        {"event_id", "disaster_type", "estimated_affected", "scene_codes",
         "golden_hour_deadline_minutes", "attributes"},
        ctx);

    EventContext event;
    event.event_id = v.at("event_id", ctx).as_string(ctx + ".event_id");
    event.disaster_type = v.at("disaster_type", ctx).as_string(ctx + ".disaster_type");
    event.estimated_affected =
        v.at("estimated_affected", ctx).as_int(ctx + ".estimated_affected");
    if (event.estimated_affected < 0)
    {
        throw ConfigError(ctx + ".estimated_affected must not be negative");
    }
    if (const auto* f = v.find("scene_codes"))
    {
        for (const auto& code : f->as_array(ctx + ".scene_codes"))
        {
            event.scene_codes.push_back(code.as_string(ctx + ".scene_codes"));
        }
    }
    if (const auto* f = v.find("golden_hour_deadline_minutes"))
    {
        if (!f->is_null())
            event.golden_hour_deadline_minutes = f->as_int(ctx + ".golden_hour_deadline_minutes");
    }
    if (const auto* f = v.find("attributes"))
    {
        for (const auto& [key, value] : f->as_object(ctx + ".attributes"))
        {
            event.attributes[key] = read_attribute(value, ctx + ".attributes." + key);
        }
    }
    return event;
}

} // namespace

AllocationRequest load_allocation_request(const JsonValue& doc)
{
    const std::string ctx = "request";
    doc.expect_only_keys({"run_id", "event", "area", "mode", "max_results"}, ctx);

    AllocationRequest request;
    request.run_id = doc.at("run_id", ctx).as_string(ctx + ".run_id");
    request.event = read_event(doc.at("event", ctx));

    if (const auto* f = doc.find("area"))
    {
        f->expect_only_keys({"lat", "lng", "radius_km"}, "area");
        request.area.center.latitude = f->at("lat", "area").as_number("area.lat");
        request.area.center.longitude = f->at("lng", "area").as_number("area.lng");
        if (const auto* r = f->find("radius_km"))
            request.area.radius_km = r->as_number("area.radius_km");
        if (request.area.radius_km < 0.0)
        {
            throw ConfigError("area.radius_km must not be negative");
        }
    }
    if (const auto* f = doc.find("mode"))
    {
        try
        {
            request.mode = parse_optimization_mode(f->as_string(ctx + ".mode"));
        }
        catch (const InvalidInputError& e)
        {
            throw ConfigError(ctx + ".mode: " + e.what());
        }
    }
    if (const auto* f = doc.find("max_results"))
    {
        int max_results = f->as_int(ctx + ".max_results");
        if (max_results < 1)
        {
            throw ConfigError(ctx + ".max_results must be at least 1");
        }
        request.max_results = static_cast<size_t>(max_results);
    }
    return request;
}

AllocationRequest load_allocation_request_file(const std::string& path)
{
    JsonValue doc = json_parse_file(path);
    try
    {
        return load_allocation_request(doc);
    }
    catch (const ConfigError& e)
    {
        throw ConfigError(path + ": " + e.what());
    }
}

} // namespace resq
