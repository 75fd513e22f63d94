#include <gtest/gtest.h>
#include "resq/common/errors.hpp"
#include "resq/resources/in_memory_resource_catalog.hpp"
#include "support/test_support.hpp"

using namespace resq;
using resq_test::LogCapture;
using resq_test::make_candidate;

namespace
{

const std::string config_dir = RESQ_CONFIG_DIR;

const GeoPoint center{30.0, 104.0};

/// Candidate placed `north_deg` degrees north of the query centre.
ResourceCandidate placed(const std::string& id, std::set<std::string> caps, double north_deg)
{
    auto c = make_candidate(id, std::move(caps), 100, 0.0);
    c.location = GeoPoint{center.latitude + north_deg, center.longitude};
    return c;
}

std::vector<std::string> ids_of(const std::vector<ResourceCandidate>& candidates)
{
    std::vector<std::string> out;
    for (const auto& c : candidates)
    {
        out.push_back(c.id);
    }
    return out;
}

InMemoryResourceCatalog sample_catalog()
{
    return InMemoryResourceCatalog({
        placed("usar-b", {"structural_rescue", "life_detection"}, 0.20),
        placed("usar-a", {"structural_rescue", "life_detection"}, 0.20),
        placed("med-1", {"medical_triage"}, 0.05),
        placed("usar-near", {"structural_rescue"}, 0.01),
        placed("boat-1", {"water_rescue"}, 0.02),
        placed("usar-far", {"structural_rescue", "life_detection"}, 2.0),
    });
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

TEST(InMemoryResourceCatalogTests, Construction_DuplicateIdRejected)
{
    EXPECT_THROW(InMemoryResourceCatalog({placed("a", {"x"}, 0.0), placed("a", {"y"}, 0.0)}),
                 InvalidInputError);
}

TEST(InMemoryResourceCatalogTests, Construction_EmptyIdRejected)
{
    EXPECT_THROW(InMemoryResourceCatalog({placed("", {"x"}, 0.0)}), InvalidInputError);
}

TEST(InMemoryResourceCatalogTests, Construction_NonPositiveSpeedRejected)
{
    EXPECT_THROW(InMemoryResourceCatalog({placed("a", {"x"}, 0.0)}, 0.0), InvalidInputError);
}

// ============================================================================
// Query
// ============================================================================

TEST(InMemoryResourceCatalogTests, Query_ZeroMaxResultsRejected)
{
    auto catalog = sample_catalog();
    EXPECT_THROW(catalog.query({"structural_rescue"}, Area{center, 0.0}, 0), InvalidInputError);
}

TEST(InMemoryResourceCatalogTests, Query_OrderedByOverlapThenDistanceThenId)
{
    auto catalog = sample_catalog();
    auto hits = catalog.query({"structural_rescue", "life_detection"}, Area{center, 0.0}, 10);

    EXPECT_EQ(ids_of(hits),
              (std::vector<std::string>{"usar-a", "usar-b", "usar-far", "usar-near"}));
}

TEST(InMemoryResourceCatalogTests, Query_RadiusBoundsDistance)
{
    auto catalog = sample_catalog();
    // 0.2 degrees of latitude is about 22 km
    auto hits = catalog.query({"structural_rescue"}, Area{center, 50.0}, 10);
    EXPECT_EQ(ids_of(hits), (std::vector<std::string>{"usar-near", "usar-a", "usar-b"}));
    for (const auto& c : hits)
    {
        EXPECT_LE(c.distance_km, 50.0);
    }
}

TEST(InMemoryResourceCatalogTests, Query_EmptyCapabilitiesReturnsAllAvailable)
{
    auto catalog = sample_catalog();
    catalog.set_status("boat-1", ResourceStatus::Unavailable);
    auto hits = catalog.query({}, Area{center, 0.0}, 100);
    EXPECT_EQ(hits.size(), 5u);
}

TEST(InMemoryResourceCatalogTests, Query_SkipsUnavailable)
{
    auto catalog = sample_catalog();
    catalog.set_status("usar-a", ResourceStatus::Deployed);
    auto hits = catalog.query({"life_detection"}, Area{center, 0.0}, 10);
    EXPECT_EQ(ids_of(hits), (std::vector<std::string>{"usar-b", "usar-far"}));
}

TEST(InMemoryResourceCatalogTests, Query_TruncationIsLogged)
{
    LogCapture capture;
    auto catalog = sample_catalog();
    auto hits = catalog.query({"structural_rescue"}, Area{center, 0.0}, 2);
    EXPECT_EQ(hits.size(), 2u);
    EXPECT_TRUE(capture.contains(LogLevel::Warn, "max_results=2"));
}

TEST(InMemoryResourceCatalogTests, Query_EtaDerivedFromDistance)
{
    auto supplied = placed("supplied", {"x"}, 0.1);
    supplied.eta_minutes = 5.0;
    InMemoryResourceCatalog catalog({placed("derived", {"x"}, 0.1), supplied}, 40.0);

    auto hits = catalog.query({"x"}, Area{center, 0.0}, 10);
    ASSERT_EQ(hits.size(), 2u);
    const auto& derived = hits[0].id == "derived" ? hits[0] : hits[1];
    const auto& kept = hits[0].id == "derived" ? hits[1] : hits[0];
    EXPECT_NEAR(derived.distance_km, 11.1, 0.2);
    EXPECT_NEAR(derived.eta_minutes, derived.distance_km / 40.0 * 60.0, 1e-9);
    EXPECT_DOUBLE_EQ(kept.eta_minutes, 5.0);
}

// ============================================================================
// Revalidation and commit
// ============================================================================

TEST(InMemoryResourceCatalogTests, Revalidate_ReportsStaleAndUnknown)
{
    auto catalog = sample_catalog();
    catalog.set_status("med-1", ResourceStatus::Deployed);
    auto stale = catalog.revalidate({"usar-a", "med-1", "ghost"});
    EXPECT_EQ(stale, (std::vector<ResourceId>{"med-1", "ghost"}));
}

TEST(InMemoryResourceCatalogTests, Commit_MarksDeployedAndReleaseRestores)
{
    auto catalog = sample_catalog();
    catalog.commit("run-1", {"usar-a", "med-1"});
    EXPECT_EQ(catalog.status_of("usar-a"), ResourceStatus::Deployed);
    EXPECT_EQ(catalog.status_of("med-1"), ResourceStatus::Deployed);
    EXPECT_EQ(catalog.revalidate({"usar-a"}).size(), 1u);

    EXPECT_EQ(catalog.release("run-1"), 2u);
    EXPECT_EQ(catalog.status_of("usar-a"), ResourceStatus::Available);
    EXPECT_EQ(catalog.release("run-1"), 0u);
}

TEST(InMemoryResourceCatalogTests, Commit_StaleResourceChangesNothing)
{
    auto catalog = sample_catalog();
    catalog.set_status("med-1", ResourceStatus::Unavailable);
    try
    {
        catalog.commit("run-1", {"usar-a", "med-1"});
        FAIL() << "expected StaleResourceError";
    }
    catch (const StaleResourceError& e)
    {
        EXPECT_EQ(e.stale_resources(), (std::vector<std::string>{"med-1"}));
        EXPECT_TRUE(e.is_retryable());
    }
    EXPECT_EQ(catalog.status_of("usar-a"), ResourceStatus::Available);
}

TEST(InMemoryResourceCatalogTests, Status_UnknownIdRejected)
{
    auto catalog = sample_catalog();
    EXPECT_THROW(catalog.status_of("ghost"), InvalidInputError);
    EXPECT_THROW(catalog.set_status("ghost", ResourceStatus::Deployed), InvalidInputError);
}

// ============================================================================
// JSON loading
// ============================================================================

TEST(InMemoryResourceCatalogTests, Load_OptionalCapacityStaysUnset)
{
    auto resources = load_resources(json_parse(R"({"resources": [
        {"id": "a", "resource_type": "medical", "capabilities": ["medical_triage"],
         "available_personnel": 12, "location": {"lat": 30.1, "lng": 104.0}, "status": "deployed"},
        {"id": "b", "resource_type": "fire_rescue", "capabilities": [],
         "available_personnel": 20, "rescue_capacity": 45, "risk": 0.05}
    ]})"));
    ASSERT_EQ(resources.size(), 2u);
    EXPECT_FALSE(resources[0].rescue_capacity.has_value());
    EXPECT_EQ(resources[0].status, ResourceStatus::Deployed);
    EXPECT_DOUBLE_EQ(resources[0].location.latitude, 30.1);
    EXPECT_EQ(resources[1].rescue_capacity, 45);
    EXPECT_DOUBLE_EQ(resources[1].risk, 0.05);
}

TEST(InMemoryResourceCatalogTests, Load_StructuralErrorsAreConfigErrors)
{
    EXPECT_THROW(load_resources(json_parse(R"({"resources": [{"id": "a"}]})")), ConfigError);
    EXPECT_THROW(load_resources(json_parse(R"({"resources": [
        {"id": "a", "resource_type": "medical", "capabilities": [], "available_personnel": 1,
         "status": "resting"}]})")),
                 ConfigError);
}

TEST(InMemoryResourceCatalogTests, Load_ShippedPool)
{
    InMemoryResourceCatalog catalog(load_resources_file(config_dir + "/resources.json"));
    EXPECT_EQ(catalog.size(), 16u);
    EXPECT_EQ(catalog.status_of("med-03"), ResourceStatus::Deployed);
}
