/**
 * @file config.cpp
 */
#include "resq/common/config.hpp"
#include "resq/common/errors.hpp"

#include <cmath>

namespace resq
{

namespace
{

constexpr double weight_sum_tolerance = 1e-6;

void require_unit_interval(double value, const std::string& name)
{
    if (!(value >= 0.0 && value <= 1.0))
    {
        throw ConfigError(name + " must be within [0, 1], got " + std::to_string(value));
    }
}

size_t read_count(const JsonValue& v, const std::string& context)
{
    int value = v.as_int(context);
    if (value < 0)
    {
        throw ConfigError(context + ": must not be negative");
    }
    return static_cast<size_t>(value);
}

} // namespace

// ============================================================================
// CapacityCoefficients
// ============================================================================

double CapacityCoefficients::coefficient_for(const std::string& resource_type) const
{
    auto it = by_type.find(resource_type);
    return it == by_type.end() ? default_coefficient : it->second;
}

CapacityCoefficients CapacityCoefficients::defaults()
{
    CapacityCoefficients c;
    c.by_type = {
        {"medical", 5.0},
        {"fire_rescue", 2.0},
        {"structural_rescue", 2.0},
        {"search_rescue", 1.5},
        {"hazmat", 0.5},
        {"volunteer", 1.0},
        {"engineering", 0.0},
    };
    c.default_coefficient = 1.0;
    return c;
}

void CapacityCoefficients::validate_or_throw() const
{
    if (default_coefficient < 0.0)
    {
        throw ConfigError("capacity.default_coefficient must not be negative");
    }
    for (const auto& [type, value] : by_type)
    {
        if (value < 0.0)
        {
            throw ConfigError("capacity coefficient for '" + type + "' must not be negative");
        }
    }
}

// ============================================================================
// OptimizerConfig
// ============================================================================

std::chrono::milliseconds OptimizerConfig::timeout_for(size_t candidate_count) const noexcept
{
    return candidate_count >= large_instance_threshold ? large_instance_timeout
                                                       : small_instance_timeout;
}

void OptimizerConfig::validate_or_throw() const
{
    if (!(coverage_threshold > 0.0 && coverage_threshold <= 1.0))
    {
        throw ConfigError("optimizer.coverage_threshold must be within (0, 1]");
    }
    require_unit_interval(min_capacity_coverage, "optimizer.min_capacity_coverage");
    if (min_capacity_coverage > coverage_threshold)
    {
        throw ConfigError(
            "optimizer.min_capacity_coverage must not exceed optimizer.coverage_threshold");
    }
    if (max_alternatives == 0)
    {
        throw ConfigError("optimizer.max_alternatives must be at least 1");
    }
    if (proximity_scale_minutes <= 0.0)
    {
        throw ConfigError("optimizer.proximity_scale_minutes must be positive");
    }
    if (population_size < 2)
    {
        throw ConfigError("optimizer.population_size must be at least 2");
    }
    if (generations == 0)
    {
        throw ConfigError("optimizer.generations must be at least 1");
    }
    require_unit_interval(crossover_probability, "optimizer.crossover_probability");
    if (mutation_probability)
    {
        require_unit_interval(*mutation_probability, "optimizer.mutation_probability");
    }
    if (small_instance_timeout.count() < 0 || large_instance_timeout.count() < 0)
    {
        throw ConfigError("optimizer timeouts must not be negative");
    }
}

// ============================================================================
// Scoring
// ============================================================================

double ScoringWeights::sum() const noexcept
{
    return success_rate + response_time + coverage_rate + risk + redundancy;
}

void ScoringWeights::validate_or_throw(const std::string& profile) const
{
    for (double w : {success_rate, response_time, coverage_rate, risk, redundancy})
    {
        if (w < 0.0)
        {
            throw ConfigError("scoring profile '" + profile + "' has a negative weight");
        }
    }
    if (std::fabs(sum() - 1.0) > weight_sum_tolerance)
    {
        throw ConfigError(
            "scoring profile '" + profile + "' weights sum to " + std::to_string(sum()) +
            ", expected 1.0");
    }
}

const ScoringWeights& ScoringConfig::weights_for(const std::string& disaster_type) const
{
    auto it = disaster_profiles.find(disaster_type);
    return it == disaster_profiles.end() ? default_weights : it->second;
}

ScoringConfig ScoringConfig::defaults()
{
    ScoringConfig c;
    c.default_weights = ScoringWeights{0.35, 0.30, 0.20, 0.05, 0.10};
    c.disaster_profiles["earthquake"] = ScoringWeights{0.35, 0.35, 0.15, 0.05, 0.10};
    c.disaster_profiles["fire"] = ScoringWeights{0.30, 0.40, 0.15, 0.05, 0.10};
    return c;
}

void ScoringConfig::validate_or_throw() const
{
    default_weights.validate_or_throw("default");
    for (const auto& [name, weights] : disaster_profiles)
    {
        weights.validate_or_throw(name);
    }
    require_unit_interval(baseline_success_rate, "scoring.baseline_success_rate");
    if (response_time_reference_minutes <= 0.0)
    {
        throw ConfigError("scoring.response_time_reference_minutes must be positive");
    }
}

void ReviewPolicy::validate_or_throw() const
{
    require_unit_interval(risk_threshold, "review.risk_threshold");
}

void LockConfig::validate_or_throw() const
{
    if (ttl.count() <= 0)
    {
        throw ConfigError("locking.ttl_seconds must be positive");
    }
    if (retry_after.count() < 0)
    {
        throw ConfigError("locking.retry_after_seconds must not be negative");
    }
}

void PipelineConfig::validate_or_throw() const
{
    if (catalog_max_results == 0)
    {
        throw ConfigError("catalog_max_results must be at least 1");
    }
    optimizer.validate_or_throw();
    scoring.validate_or_throw();
    capacity.validate_or_throw();
    review.validate_or_throw();
    locking.validate_or_throw();
}

// ============================================================================
// JSON loading
// ============================================================================

namespace
{

ScoringWeights read_weights(const JsonValue& v, const std::string& context)
{
    v.expect_only_keys(
        {"success_rate", "response_time", "coverage_rate", "risk", "redundancy"}, context);
    ScoringWeights w;
    w.success_rate = v.at("success_rate", context).as_number(context + ".success_rate");
    w.response_time = v.at("response_time", context).as_number(context + ".response_time");
    w.coverage_rate = v.at("coverage_rate", context).as_number(context + ".coverage_rate");
    w.risk = v.at("risk", context).as_number(context + ".risk");
    w.redundancy = v.at("redundancy", context).as_number(context + ".redundancy");
    return w;
}

void read_optimizer(const JsonValue& v, OptimizerConfig& out)
{
    const std::string ctx = "optimizer";
    v.expect_only_keys(
        {"coverage_threshold", "min_capacity_coverage", "multi_objective_threshold",
         "max_alternatives", "redundancy_backups", "proximity_scale_minutes",
         "population_size", "generations", "crossover_probability", "mutation_probability",
         "seed", "large_instance_threshold", "small_instance_timeout_ms",
         "large_instance_timeout_ms"},
        ctx);

    if (const auto* f = v.find("coverage_threshold"))
        out.coverage_threshold = f->as_number(ctx + ".coverage_threshold");
    if (const auto* f = v.find("min_capacity_coverage"))
        out.min_capacity_coverage = f->as_number(ctx + ".min_capacity_coverage");
    if (const auto* f = v.find("multi_objective_threshold"))
        out.multi_objective_threshold = read_count(*f, ctx + ".multi_objective_threshold");
    if (const auto* f = v.find("max_alternatives"))
        out.max_alternatives = read_count(*f, ctx + ".max_alternatives");
    if (const auto* f = v.find("redundancy_backups"))
        out.redundancy_backups = read_count(*f, ctx + ".redundancy_backups");
    if (const auto* f = v.find("proximity_scale_minutes"))
        out.proximity_scale_minutes = f->as_number(ctx + ".proximity_scale_minutes");
    if (const auto* f = v.find("population_size"))
        out.population_size = read_count(*f, ctx + ".population_size");
    if (const auto* f = v.find("generations"))
        out.generations = read_count(*f, ctx + ".generations");
    if (const auto* f = v.find("crossover_probability"))
        out.crossover_probability = f->as_number(ctx + ".crossover_probability");
    if (const auto* f = v.find("mutation_probability"))
        out.mutation_probability = f->as_number(ctx + ".mutation_probability");
    if (const auto* f = v.find("seed"))
        out.seed = static_cast<uint32_t>(read_count(*f, ctx + ".seed"));
    if (const auto* f = v.find("large_instance_threshold"))
        out.large_instance_threshold = read_count(*f, ctx + ".large_instance_threshold");
    if (const auto* f = v.find("small_instance_timeout_ms"))
        out.small_instance_timeout =
            std::chrono::milliseconds(read_count(*f, ctx + ".small_instance_timeout_ms"));
    if (const auto* f = v.find("large_instance_timeout_ms"))
        out.large_instance_timeout =
            std::chrono::milliseconds(read_count(*f, ctx + ".large_instance_timeout_ms"));
}

void read_scoring(const JsonValue& v, ScoringConfig& out)
{
    const std::string ctx = "scoring";
    v.expect_only_keys(
        {"default_weights", "disaster_profiles", "baseline_success_rate",
         "response_time_reference_minutes"},
        ctx);

    if (const auto* f = v.find("default_weights"))
        out.default_weights = read_weights(*f, ctx + ".default_weights");
    if (const auto* f = v.find("disaster_profiles"))
    {
        out.disaster_profiles.clear();
        for (const auto& [name, weights] : f->as_object(ctx + ".disaster_profiles"))
        {
            out.disaster_profiles[name] =
                read_weights(weights, ctx + ".disaster_profiles." + name);
        }
    }
    if (const auto* f = v.find("baseline_success_rate"))
        out.baseline_success_rate = f->as_number(ctx + ".baseline_success_rate");
    if (const auto* f = v.find("response_time_reference_minutes"))
        out.response_time_reference_minutes =
            f->as_number(ctx + ".response_time_reference_minutes");
}

void read_capacity(const JsonValue& v, CapacityCoefficients& out)
{
    const std::string ctx = "capacity";
    v.expect_only_keys({"coefficients", "default_coefficient"}, ctx);
    if (const auto* f = v.find("coefficients"))
    {
        out.by_type.clear();
        for (const auto& [type, value] : f->as_object(ctx + ".coefficients"))
        {
            out.by_type[type] = value.as_number(ctx + ".coefficients." + type);
        }
    }
    if (const auto* f = v.find("default_coefficient"))
        out.default_coefficient = f->as_number(ctx + ".default_coefficient");
}

void read_review(const JsonValue& v, ReviewPolicy& out)
{
    const std::string ctx = "review";
    v.expect_only_keys(
        {"risk_threshold", "review_insufficient_capacity", "review_uncovered_critical"}, ctx);
    if (const auto* f = v.find("risk_threshold"))
        out.risk_threshold = f->as_number(ctx + ".risk_threshold");
    if (const auto* f = v.find("review_insufficient_capacity"))
        out.review_insufficient_capacity = f->as_bool(ctx + ".review_insufficient_capacity");
    if (const auto* f = v.find("review_uncovered_critical"))
        out.review_uncovered_critical = f->as_bool(ctx + ".review_uncovered_critical");
}

void read_locking(const JsonValue& v, LockConfig& out)
{
    const std::string ctx = "locking";
    v.expect_only_keys({"ttl_seconds", "retry_after_seconds"}, ctx);
    if (const auto* f = v.find("ttl_seconds"))
        out.ttl = std::chrono::seconds(f->as_int(ctx + ".ttl_seconds"));
    if (const auto* f = v.find("retry_after_seconds"))
        out.retry_after = std::chrono::seconds(f->as_int(ctx + ".retry_after_seconds"));
}

} // namespace

PipelineConfig load_pipeline_config(const JsonValue& doc)
{
    const std::string ctx = "pipeline config";
    doc.expect_only_keys(
        {"catalog_max_results", "optimizer", "scoring", "capacity", "review", "locking",
         "retry_greedy_on_optimizer_failure"},
        ctx);

    PipelineConfig config;
    if (const auto* f = doc.find("catalog_max_results"))
        config.catalog_max_results = read_count(*f, "catalog_max_results");
    if (const auto* f = doc.find("optimizer"))
        read_optimizer(*f, config.optimizer);
    if (const auto* f = doc.find("scoring"))
        read_scoring(*f, config.scoring);
    if (const auto* f = doc.find("capacity"))
        read_capacity(*f, config.capacity);
    if (const auto* f = doc.find("review"))
        read_review(*f, config.review);
    if (const auto* f = doc.find("locking"))
        read_locking(*f, config.locking);
    if (const auto* f = doc.find("retry_greedy_on_optimizer_failure"))
        config.retry_greedy_on_optimizer_failure =
            f->as_bool("retry_greedy_on_optimizer_failure");

    config.validate_or_throw();
    return config;
}

PipelineConfig load_pipeline_config_file(const std::string& path)
{
    JsonValue doc = json_parse_file(path);
    try
    {
        return load_pipeline_config(doc);
    }
    catch (const ConfigError& e)
    {
        throw ConfigError(path + ": " + e.what());
    }
}

} // namespace resq
