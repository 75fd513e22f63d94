/**
 * @file config.hpp
 * @brief Tunable parameters of an allocation run and their JSON loaders.
 */
#pragma once
#include "resq/common/common.hpp"
#include "resq/common/json_value.hpp"

namespace resq
{

/**
 * @brief Per-resource-type multipliers from personnel to rescue capacity.
 */
struct CapacityCoefficients
{
    std::map<std::string, double> by_type;
    double default_coefficient{1.0};

    /// Coefficient for `resource_type`, or `default_coefficient` if unlisted.
    double coefficient_for(const std::string& resource_type) const;

    /// medical 5, fire_rescue 2, structural_rescue 2, search_rescue 1.5,
    /// hazmat 0.5, volunteer 1, engineering 0.
    static CapacityCoefficients defaults();

    /// @throw ConfigError on a negative coefficient.
    void validate_or_throw() const;
};

/**
 * @brief Parameters of the greedy and multi-objective allocators.
 */
struct OptimizerConfig
{
    /// Greedy termination target as a fraction of the affected count.
    double coverage_threshold{0.8};

    /// Feasibility floor on capacity coverage inside the optimizer.
    double min_capacity_coverage{0.5};

    /// Candidate counts above this use multi-objective mode in `Auto`.
    size_t multi_objective_threshold{10};

    /// Upper bound on returned Pareto solutions.
    size_t max_alternatives{5};

    /// Extra backups added after greedy termination; 0 disables the pass.
    size_t redundancy_backups{0};

    /// ETA at which the greedy proximity weight halves.
    double proximity_scale_minutes{60.0};

    size_t population_size{50};
    size_t generations{50};
    double crossover_probability{0.9};

    /// Per-gene flip probability; unset means 1 / candidate count.
    std::optional<double> mutation_probability;

    uint32_t seed{42};

    /// Candidate count from which `large_instance_timeout` applies.
    size_t large_instance_threshold{50};
    std::chrono::milliseconds small_instance_timeout{10000};
    std::chrono::milliseconds large_instance_timeout{60000};

    /// Time budget of the multi-objective search for `candidate_count` candidates.
    std::chrono::milliseconds timeout_for(size_t candidate_count) const noexcept;

    /// @throw ConfigError when a parameter is out of range.
    void validate_or_throw() const;
};

/**
 * @brief Weights of the five soft-scoring dimensions. Must sum to 1.0.
 */
struct ScoringWeights
{
    double success_rate{0.35};
    double response_time{0.30};
    double coverage_rate{0.20};
    double risk{0.05};
    double redundancy{0.10};

    double sum() const noexcept;

    /// @throw ConfigError naming `profile` when a weight is negative or the sum is not 1.0.
    void validate_or_throw(const std::string& profile) const;
};

/**
 * @brief Soft-scoring configuration with optional per-disaster weight profiles.
 */
struct ScoringConfig
{
    ScoringWeights default_weights;
    std::map<std::string, ScoringWeights> disaster_profiles;

    /// Historical case success rate blended into the success dimension.
    double baseline_success_rate{0.8};

    /// Response time at which the response-time score reaches zero.
    double response_time_reference_minutes{120.0};

    /// Weights for `disaster_type`, falling back to `default_weights`.
    const ScoringWeights& weights_for(const std::string& disaster_type) const;

    /// Default weights plus earthquake and fire profiles.
    static ScoringConfig defaults();

    void validate_or_throw() const;
};

/**
 * @brief When a surviving solution must pass the human-review gate before commit.
 */
struct ReviewPolicy
{
    /// Risk at or above which review is required.
    double risk_threshold{0.08};

    /// Review when capacity coverage is below the greedy target.
    bool review_insufficient_capacity{true};

    /// Review when a critical capability is left uncovered.
    bool review_uncovered_critical{true};

    void validate_or_throw() const;
};

struct LockConfig
{
    std::chrono::seconds ttl{300};
    std::chrono::seconds retry_after{30};

    void validate_or_throw() const;
};

/**
 * @brief Everything an `AllocationPipeline` needs besides its collaborators.
 */
struct PipelineConfig
{
    /// Explicit result bound passed on every catalog query.
    size_t catalog_max_results{500};

    OptimizerConfig optimizer;
    ScoringConfig scoring{ScoringConfig::defaults()};
    CapacityCoefficients capacity{CapacityCoefficients::defaults()};
    ReviewPolicy review;
    LockConfig locking;

    /// Caller policy: rerun in greedy mode when the multi-objective search fails.
    bool retry_greedy_on_optimizer_failure{false};

    void validate_or_throw() const;
};

/**
 * @brief Build a `PipelineConfig` from a JSON document.
 *
 * @details
 * Absent sections keep their documented defaults; present sections are
 * checked strictly (unknown keys, wrong kinds and out-of-range values raise).
 * The result is validated before it is returned.
 *
 * @throw ConfigError on any problem.
 */
PipelineConfig load_pipeline_config(const JsonValue& doc);

/// @throw ConfigError if the file is missing or invalid.
PipelineConfig load_pipeline_config_file(const std::string& path);

} // namespace resq
