/**
 * @file domain_types.hpp
 * @brief Value types shared by every stage of an allocation run.
 */
#pragma once
#include "resq/common/common.hpp"

namespace resq
{

// ============================================================================
// Identifier aliases
// ============================================================================

/// A capability code such as "structural_rescue" or "medical_triage".
using CapabilityCode = std::string;

/// Identifier of a team or vehicle in the resource catalog.
using ResourceId = std::string;

/// Identifier of a task type in the template library.
using TaskCode = std::string;

/// Identifier of a disaster scene, keying a task-chain template.
using SceneCode = std::string;

// ============================================================================
// Priority
// ============================================================================

/**
 * @brief Requirement priority. Declaration order is strongest first.
 */
enum class Priority
{
    Critical,
    High,
    Medium,
    Low
};

const char* to_string(Priority priority) noexcept;

/**
 * @brief Parse "critical", "high", "medium" or "low".
 * @throw ConfigError for any other text.
 */
Priority parse_priority(const std::string& text);

/// Return whichever priority is stronger.
inline Priority stronger_priority(Priority a, Priority b) noexcept
{
    return static_cast<int>(a) <= static_cast<int>(b) ? a : b;
}

// ============================================================================
// Geography
// ============================================================================

struct GeoPoint
{
    double latitude{0.0};
    double longitude{0.0};
};

/**
 * @brief Search area for a catalog query.
 * @details A `radius_km` of zero means no distance bound.
 */
struct Area
{
    GeoPoint center;
    double radius_km{0.0};
};

/// Great-circle distance in kilometres.
double haversine_km(const GeoPoint& a, const GeoPoint& b) noexcept;

// ============================================================================
// Requirement
// ============================================================================

/**
 * @brief A task type the event calls for, with the capabilities it needs.
 *
 * @details
 * Produced by `RuleEngine::derive_requirements()` and immutable for the rest
 * of the run. `critical_capabilities` is a subset of `required_capabilities`
 * that the committed plan must cover or surface as a violation.
 */
struct Requirement
{
    TaskCode task_type;
    Priority priority{Priority::Medium};
    std::set<CapabilityCode> required_capabilities;
    std::set<CapabilityCode> critical_capabilities;
};

/// Union of required capabilities across requirements.
std::set<CapabilityCode> collect_required_capabilities(const std::vector<Requirement>& requirements);

/// Union of critical capabilities across requirements.
std::set<CapabilityCode> collect_critical_capabilities(const std::vector<Requirement>& requirements);

// ============================================================================
// Resource candidate
// ============================================================================

enum class ResourceStatus
{
    Available,
    Deployed,
    Unavailable
};

const char* to_string(ResourceStatus status) noexcept;

/// @throw ConfigError for unknown text.
ResourceStatus parse_resource_status(const std::string& text);

/**
 * @brief A team or vehicle as seen in one catalog snapshot.
 *
 * @details
 * `rescue_capacity` may be absent in the source data; `CapacityEstimator`
 * fills it (and sets `capacity_estimated`) before any allocation decision.
 * The optimizer refuses candidates whose capacity is still unset.
 */
struct ResourceCandidate
{
    ResourceId id;
    std::string name;
    std::string resource_type;
    std::set<CapabilityCode> capabilities;
    int available_personnel{0};
    std::optional<int> rescue_capacity;
    bool capacity_estimated{false};
    GeoPoint location;
    ResourceStatus status{ResourceStatus::Available};

    /// Distance from the query area centre, filled by the catalog.
    double distance_km{0.0};

    /// Estimated time of arrival, supplied by the external routing service.
    double eta_minutes{0.0};

    /// Readiness weight in [0, 1].
    double availability{1.0};

    /// Deployment cost in arbitrary units.
    double cost{0.0};

    /// Operational risk in [0, 1].
    double risk{0.0};
};

// ============================================================================
// Violations
// ============================================================================

enum class ViolationKind
{
    StrictDependency,
    AdvisoryDependency,
    UnmappedTaskType,
    ParallelGroupConflict,
    InsufficientCapacity,
    CriticalCapabilityUncovered,
    HardRule,
    ReviewOverride
};

enum class ViolationSeverity
{
    Warning,
    Error
};

const char* to_string(ViolationKind kind) noexcept;
const char* to_string(ViolationSeverity severity) noexcept;

/**
 * @brief A non-fatal finding attached to a decomposition or a solution.
 */
struct Violation
{
    ViolationKind kind{ViolationKind::HardRule};
    ViolationSeverity severity{ViolationSeverity::Warning};
    bool strict{false};

    /// What the finding is about: a task code, a capability, a rule id.
    std::string subject;

    std::string message;
};

/// Format a number with at most `precision` decimals and no trailing zeros.
std::string format_decimal(double value, int precision = 3);

} // namespace resq
