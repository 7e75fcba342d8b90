#include <gtest/gtest.h>

#include <fstream>

#include "routing/message_router.hpp"
#include "test_support.hpp"

namespace osintpipe::routing {
namespace {

using osintpipe::testing::TempDir;

TEST(MessageRouterTest, TriggerOverridesTopicMapping) {
    MessageRouter router;
    const auto decision = router.Route("HIMARS delivered to front line", {"equipment"});
    EXPECT_EQ(decision.target_partition, "messages_equipment");
    ASSERT_TRUE(decision.matched_trigger.has_value());
    EXPECT_EQ(*decision.matched_trigger, "HIMARS");
    ASSERT_TRUE(decision.matched_priority.has_value());
    EXPECT_EQ(*decision.matched_priority, 4);
    EXPECT_EQ(decision.rules_version, 1u);
}

TEST(MessageRouterTest, LowestPriorityNumberWins) {
    MessageRouter router;
    // Matches equipment (4) and strikes (1).
    const auto decision = router.Route("Missile strike hit a tank column", {"equipment"});
    EXPECT_EQ(decision.target_partition, "messages_strikes");
    EXPECT_EQ(decision.matched_priority, 1);
}

TEST(MessageRouterTest, TriggersMatchAcrossCaseAndWhitespace) {
    MessageRouter router;
    const auto decision = router.Route("Talks on a  PEACE\n\tTALKS framework", {});
    EXPECT_EQ(decision.target_partition, "messages_diplomatic");
    EXPECT_EQ(decision.matched_trigger, std::optional<std::string>("peace talks"));
}

TEST(MessageRouterTest, CyrillicTriggersMatchCapitalisedText) {
    MessageRouter router;
    EXPECT_EQ(router.Route("Удар по Харкову", {}).target_partition, "messages_strikes");
    EXPECT_EQ(router.Route("ОБСТРІЛ Херсона", {}).target_partition, "messages_strikes");
    EXPECT_EQ(router.Route("Переговори у Стамбулі", {}).target_partition, "messages_diplomatic");
}

TEST(MessageRouterTest, FallsBackToTopicMapping) {
    MessageRouter router;
    const auto decision = router.Route("Residents queue for water", {"civilian", "general"});
    EXPECT_EQ(decision.target_partition, "messages_civilian");
    EXPECT_FALSE(decision.matched_trigger.has_value());
    EXPECT_FALSE(decision.matched_priority.has_value());
}

TEST(MessageRouterTest, TopicMappingFollowsConfiguredOrder) {
    MessageRouter router;
    // "combat" is listed before "diplomatic" in the mapping.
    const auto decision = router.Route("Quiet day", {"diplomatic", "Combat"});
    EXPECT_EQ(decision.target_partition, "messages_combat");
}

TEST(MessageRouterTest, DefaultPartitionWhenNothingMatches) {
    MessageRouter router;
    EXPECT_EQ(router.Route("Quiet day", {}).target_partition, "messages_general");
    EXPECT_EQ(router.Route("Quiet day", {"unknown"}).target_partition, "messages_general");
}

TEST(MessageRouterTest, RoutingIsDeterministic) {
    MessageRouter router;
    const auto first = router.Route("Convoy of troops near the river", {"combat"});
    for (int i = 0; i < 20; ++i) {
        EXPECT_EQ(router.Route("Convoy of troops near the river", {"combat"}), first);
    }
}

TEST(MessageRouterTest, EqualPrioritiesKeepDeclarationOrder) {
    RoutingRules rules{};
    rules.trigger_rules = {
        TriggerRule{.priority = 1, .target_partition = "first", .triggers = {"alpha"}},
        TriggerRule{.priority = 1, .target_partition = "second", .triggers = {"alpha"}},
    };
    MessageRouter router(rules);
    EXPECT_EQ(router.Route("alpha", {}).target_partition, "first");
}

TEST(MessageRouterTest, ReloadSwapsRulesAndVersion) {
    MessageRouter router;
    RoutingRules rules{};
    rules.trigger_rules = {TriggerRule{.priority = 1, .target_partition = "drones", .triggers = {"shahed"}}};
    rules.default_partition = "misc";
    ASSERT_TRUE(router.Reload(rules));

    const auto decision = router.Route("Shahed over Kyiv", {});
    EXPECT_EQ(decision.target_partition, "drones");
    EXPECT_EQ(decision.rules_version, 2u);
    EXPECT_EQ(router.Route("HIMARS", {}).target_partition, "misc");
}

TEST(MessageRouterTest, InvalidRulesAreRejected) {
    MessageRouter router;
    RoutingRules rules{};
    rules.trigger_rules = {TriggerRule{.priority = 1, .target_partition = "", .triggers = {"x"}}};
    std::string error;
    EXPECT_FALSE(router.Reload(rules, &error));
    EXPECT_FALSE(error.empty());
    EXPECT_EQ(router.Version(), 1u);

    RoutingRules no_default{};
    no_default.default_partition.clear();
    EXPECT_FALSE(router.Reload(no_default));
}

TEST(MessageRouterTest, LoadsRuleFile) {
    TempDir dir;
    const auto path = dir / "routing.json";
    {
        std::ofstream out(path);
        out << R"({"triggerRules": [{"priority": 2, "targetPartition": "air", "triggers": ["Su-34"]}],
                   "topicPartitions": [{"topic": "general", "partition": "bucket"}],
                   "defaultPartition": "rest"})";
    }
    MessageRouter router;
    std::string error;
    ASSERT_TRUE(router.LoadFromFile(path, &error)) << error;
    EXPECT_EQ(router.Route("an su-34 was seen", {}).target_partition, "air");
    EXPECT_EQ(router.Route("nothing", {"general"}).target_partition, "bucket");
    EXPECT_EQ(router.Route("nothing", {}).target_partition, "rest");
}

TEST(NormalizeTextTest, LowercasesAndCollapsesWhitespace) {
    EXPECT_EQ(NormalizeText("  Storm   Shadow\n"), "storm shadow");
    EXPECT_EQ(NormalizeText(""), "");
}

TEST(NormalizeTextTest, FoldsCyrillicCapitals) {
    EXPECT_EQ(NormalizeText("Удар  ПО Харкову"), "удар по харкову");
    EXPECT_EQ(NormalizeText("Їжак Єнот Ґанок Ірпінь Ёж"), "їжак єнот ґанок ірпінь ёж");
    // Multi-byte punctuation before a capital does not shift the decoding.
    EXPECT_EQ(NormalizeText("\u2014Удар"), "\u2014удар");
}

}  // namespace
}  // namespace osintpipe::routing
