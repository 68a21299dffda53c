#include <gtest/gtest.h>

#include "lifecycle/DependencyValidator.hpp"
#include "types/ServiceRecord.hpp"

#include <algorithm>

using namespace sw::lifecycle;
using Graph = DependencyValidator::Graph;

namespace {

size_t indexOf(const std::vector<std::string>& v, const std::string& s) {
    return static_cast<size_t>(std::ranges::find(v, s) - v.begin());
}

}

TEST(DependencyValidatorTest, AcceptsKnownAcyclicDependencies) {
    const Graph g{{"db", {}}, {"cache", {"db"}}};
    EXPECT_TRUE(DependencyValidator::validate("api", {"db", "cache"}, g).empty());
}

TEST(DependencyValidatorTest, RejectsSelfDependency) {
    const auto errors = DependencyValidator::validate("api", {"api"}, {});
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0], "A service cannot depend on itself");
}

TEST(DependencyValidatorTest, RejectsDuplicatesAndUnknowns) {
    const Graph g{{"db", {}}};
    const auto errors = DependencyValidator::validate("api", {"db", "db", "ghost"}, g);
    ASSERT_EQ(errors.size(), 2u);
    EXPECT_EQ(errors[0], "Duplicate dependency 'db'");
    EXPECT_EQ(errors[1], "Unknown dependency 'ghost'");
}

TEST(DependencyValidatorTest, DetectsCycleThroughExistingFleet) {
    const Graph g{{"a", {"b"}}, {"b", {}}};
    const auto errors = DependencyValidator::validate("b", {"a"}, g);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0], "Circular dependency: a -> b -> a");
}

TEST(DependencyValidatorTest, ReplacingOwnEntryCanBreakCycle) {
    // b currently depends on a; re-validating b without it is fine
    const Graph g{{"a", {}}, {"b", {"a"}}};
    EXPECT_TRUE(DependencyValidator::validate("b", {}, g).empty());
    EXPECT_TRUE(DependencyValidator::validate("a", {}, g).empty());
}

TEST(DependencyValidatorTest, FindCycleReturnsClosedPath) {
    const Graph g{{"x", {"y"}}, {"y", {"z"}}, {"z", {"x"}}};
    const auto cycle = DependencyValidator::findCycle(g);
    ASSERT_TRUE(cycle);
    EXPECT_EQ(cycle->front(), cycle->back());
    EXPECT_EQ(cycle->size(), 4u);
    EXPECT_FALSE(DependencyValidator::findCycle({{"x", {"y"}}, {"y", {}}}));
}

TEST(DependencyValidatorTest, StartupOrderPutsDependenciesFirst) {
    const Graph g{{"api", {"cache", "db"}}, {"cache", {"db"}}, {"db", {}}, {"web", {"api"}}};
    const auto order = DependencyValidator::startupOrder(g);
    ASSERT_EQ(order.size(), 4u);
    EXPECT_LT(indexOf(order, "db"), indexOf(order, "cache"));
    EXPECT_LT(indexOf(order, "cache"), indexOf(order, "api"));
    EXPECT_LT(indexOf(order, "api"), indexOf(order, "web"));
}

TEST(DependencyValidatorTest, StartupOrderRejectsCycles) {
    EXPECT_THROW(DependencyValidator::startupOrder({{"a", {"b"}}, {"b", {"a"}}}), std::invalid_argument);
}

TEST(DependencyValidatorTest, GraphOfUsesRecordIds) {
    sw::types::ServiceRecord r;
    r.id = "api";
    r.dependencies = {"db"};
    const auto g = DependencyValidator::graphOf({r});
    ASSERT_TRUE(g.contains("api"));
    EXPECT_EQ(g.at("api"), std::vector<std::string>{"db"});
}
