/**
 * @file event_context.hpp
 */
#pragma once
#include "resq/common/common.hpp"
#include "resq/common/domain_types.hpp"

namespace resq
{

/**
 * @brief A value a rule condition can test.
 */
using FieldValue = std::variant<bool, double, std::string, std::vector<std::string>>;

/// Render a field value for condition descriptions and audit output.
std::string to_string(const FieldValue& value);

/**
 * @brief The structured description of a disaster event.
 *
 * @details
 * Natural-language understanding happens upstream; the core only sees these
 * fields. Rule conditions address the well-known members by name
 * (`disaster_type`, `estimated_affected`, `scene_codes`, `event_id`,
 * `golden_hour_deadline`) and anything else through `attributes`.
 */
struct EventContext
{
    std::string event_id;
    std::string disaster_type;
    int estimated_affected{0};
    std::vector<SceneCode> scene_codes;

    /// Latest acceptable response time in minutes, if the event imposes one.
    std::optional<int> golden_hour_deadline_minutes;

    std::map<std::string, FieldValue> attributes;

    /**
     * @brief Resolve a condition field.
     * @return The value, or nullopt when the field is absent.
     */
    std::optional<FieldValue> lookup(const std::string& field) const;
};

} // namespace resq
