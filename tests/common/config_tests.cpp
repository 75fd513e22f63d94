#include <gtest/gtest.h>
#include "resq/common/config.hpp"
#include "resq/common/errors.hpp"

using namespace resq;

// ============================================================================
// Defaults
// ============================================================================

TEST(ConfigTests, Defaults_AreValid)
{
    PipelineConfig config;
    EXPECT_NO_THROW(config.validate_or_throw());
    EXPECT_DOUBLE_EQ(config.optimizer.coverage_threshold, 0.8);
    EXPECT_DOUBLE_EQ(config.optimizer.min_capacity_coverage, 0.5);
    EXPECT_EQ(config.optimizer.multi_objective_threshold, 10u);
    EXPECT_FALSE(config.retry_greedy_on_optimizer_failure);
}

TEST(ConfigTests, Defaults_ScoringWeightsSumToOne)
{
    ScoringConfig scoring = ScoringConfig::defaults();
    EXPECT_NEAR(scoring.default_weights.sum(), 1.0, 1e-9);
    for (const auto& [name, weights] : scoring.disaster_profiles)
    {
        EXPECT_NEAR(weights.sum(), 1.0, 1e-9) << name;
    }
}

TEST(ConfigTests, Defaults_CapacityCoefficients)
{
    CapacityCoefficients c = CapacityCoefficients::defaults();
    EXPECT_DOUBLE_EQ(c.coefficient_for("medical"), 5.0);
    EXPECT_DOUBLE_EQ(c.coefficient_for("hazmat"), 0.5);
    EXPECT_DOUBLE_EQ(c.coefficient_for("engineering"), 0.0);
    EXPECT_DOUBLE_EQ(c.coefficient_for("unlisted_type"), c.default_coefficient);
}

TEST(ConfigTests, Timeout_LargeInstancesGetLongerBudget)
{
    OptimizerConfig config;
    EXPECT_EQ(config.timeout_for(10), std::chrono::milliseconds(10000));
    EXPECT_EQ(config.timeout_for(config.large_instance_threshold), std::chrono::milliseconds(60000));
}

// ============================================================================
// Validation
// ============================================================================

TEST(ConfigTests, Validation_WeightsNotSummingToOneRejected)
{
    ScoringWeights w;
    w.success_rate = 0.5;
    EXPECT_THROW(w.validate_or_throw("custom"), ConfigError);
}

TEST(ConfigTests, Validation_MinCapacityAboveThresholdRejected)
{
    OptimizerConfig config;
    config.min_capacity_coverage = 0.9;
    EXPECT_THROW(config.validate_or_throw(), ConfigError);
}

TEST(ConfigTests, Validation_ZeroCatalogBoundRejected)
{
    PipelineConfig config;
    config.catalog_max_results = 0;
    EXPECT_THROW(config.validate_or_throw(), ConfigError);
}

TEST(ConfigTests, Validation_NonPositiveLockTtlRejected)
{
    LockConfig config;
    config.ttl = std::chrono::seconds(0);
    EXPECT_THROW(config.validate_or_throw(), ConfigError);
}

// ============================================================================
// JSON loading
// ============================================================================

TEST(ConfigTests, Load_EmptyDocumentKeepsDefaults)
{
    PipelineConfig config = load_pipeline_config(json_parse("{}"));
    EXPECT_EQ(config.catalog_max_results, 500u);
    EXPECT_EQ(config.locking.ttl, std::chrono::seconds(300));
}

TEST(ConfigTests, Load_OverridesSections)
{
    PipelineConfig config = load_pipeline_config(json_parse(R"({
        "catalog_max_results": 25,
        "optimizer": {"population_size": 20, "mutation_probability": 0.1, "seed": 7},
        "review": {"risk_threshold": 0.05},
        "locking": {"ttl_seconds": 60, "retry_after_seconds": 5},
        "retry_greedy_on_optimizer_failure": true
    })"));
    EXPECT_EQ(config.catalog_max_results, 25u);
    EXPECT_EQ(config.optimizer.population_size, 20u);
    ASSERT_TRUE(config.optimizer.mutation_probability.has_value());
    EXPECT_DOUBLE_EQ(*config.optimizer.mutation_probability, 0.1);
    EXPECT_EQ(config.optimizer.seed, 7u);
    EXPECT_DOUBLE_EQ(config.review.risk_threshold, 0.05);
    EXPECT_EQ(config.locking.retry_after, std::chrono::seconds(5));
    EXPECT_TRUE(config.retry_greedy_on_optimizer_failure);
}

TEST(ConfigTests, Load_UnknownKeyRejected)
{
    EXPECT_THROW(load_pipeline_config(json_parse(R"({"optimizer": {"popsize": 10}})")),
                 ConfigError);
}

TEST(ConfigTests, Load_InvalidProfileRejected)
{
    EXPECT_THROW(load_pipeline_config(json_parse(R"({"scoring": {"disaster_profiles": {
        "flood": {"success_rate": 0.5, "response_time": 0.5, "coverage_rate": 0.5,
                  "risk": 0.0, "redundancy": 0.0}}}})")),
                 ConfigError);
}

TEST(ConfigTests, Load_ShippedPipelineConfig)
{
    PipelineConfig config = load_pipeline_config_file(std::string(RESQ_CONFIG_DIR) + "/pipeline.json");
    EXPECT_EQ(config.optimizer.multi_objective_threshold, 10u);
    EXPECT_EQ(config.scoring.disaster_profiles.count("earthquake"), 1u);
}
