/**
 * @file event_context.cpp
 */
#include "resq/rules/event_context.hpp"

namespace resq
{

std::string to_string(const FieldValue& value)
{
    struct Visitor
    {
        std::string operator()(bool v) const
        {
            return v ? "true" : "false";
        }
        std::string operator()(double v) const
        {
            return format_decimal(v);
        }
        std::string operator()(const std::string& v) const
        {
            return v;
        }
        std::string operator()(const std::vector<std::string>& v) const
        {
            std::string out = "[";
            for (size_t i = 0; i < v.size(); ++i)
            {
                if (i > 0)
                {
                    out += ", ";
                }
                out += v[i];
            }
            return out + "]";
        }
    };
    return std::visit(Visitor{}, value);
}

std::optional<FieldValue> EventContext::lookup(const std::string& field) const
{
    if (field == "disaster_type")
    {
        return FieldValue{disaster_type};
    }
    if (field == "estimated_affected")
    {
        return FieldValue{static_cast<double>(estimated_affected)};
    }
    if (field == "scene_codes")
    {
        return FieldValue{scene_codes};
    }
    if (field == "event_id")
    {
        return FieldValue{event_id};
    }
    if (field == "golden_hour_deadline")
    {
        if (!golden_hour_deadline_minutes)
        {
            return std::nullopt;
        }
        return FieldValue{static_cast<double>(*golden_hour_deadline_minutes)};
    }

    auto it = attributes.find(field);
    if (it == attributes.end())
    {
        return std::nullopt;
    }
    return it->second;
}

} // namespace resq
