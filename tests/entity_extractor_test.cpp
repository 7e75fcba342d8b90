#include <gtest/gtest.h>

#include "enrichment/entity_extractor.hpp"

namespace osintpipe::enrichment {
namespace {

using Strings = std::vector<std::string>;

TEST(RegexEntityExtractorTest, MilitaryUnitsAndLocations) {
    RegexEntityExtractor extractor;
    const auto entities = extractor.Extract(
        "The 93rd Mechanized Brigade and the Azov Regiment repelled attacks near Bakhmut.");
    EXPECT_EQ(entities.military_units, (Strings{"93rd Mechanized Brigade", "Azov Regiment"}));
    EXPECT_EQ(entities.locations, Strings{"Bakhmut"});
}

TEST(RegexEntityExtractorTest, PeopleFromTitlesAndKnownNames) {
    RegexEntityExtractor extractor;
    const auto entities = extractor.Extract("President Zelenskyy met Defence Minister Umerov in Kyiv");
    EXPECT_EQ(entities.people, (Strings{"Zelenskyy", "Umerov"}));
    EXPECT_EQ(entities.locations, Strings{"Kyiv"});
}

TEST(RegexEntityExtractorTest, OrganizationsAreSeparateFromUnits) {
    RegexEntityExtractor extractor;
    const auto entities = extractor.Extract("NATO officials and the Red Cross visited the 47th Brigade");
    EXPECT_EQ(entities.organizations, (Strings{"NATO", "Red Cross"}));
    EXPECT_EQ(entities.military_units, Strings{"47th Brigade"});
}

TEST(RegexEntityExtractorTest, DirectionsAndFronts) {
    RegexEntityExtractor extractor;
    const auto entities = extractor.Extract("Heavy fighting on the Pokrovsk direction and across Donbas");
    EXPECT_EQ(entities.directions, (Strings{"Pokrovsk direction", "Donbas"}));
}

TEST(RegexEntityExtractorTest, CyrillicMentions) {
    RegexEntityExtractor extractor;
    const auto entities = extractor.Extract("ЗСУ відбили атаку біля Харкова");
    EXPECT_EQ(entities.organizations, Strings{"ЗСУ"});
    EXPECT_EQ(entities.locations, Strings{"Харкова"});
}

TEST(RegexEntityExtractorTest, RepeatedMentionsAreDeduplicated) {
    RegexEntityExtractor extractor;
    const auto entities = extractor.Extract("Kherson again. KHERSON under fire, kherson without power");
    EXPECT_EQ(entities.locations, Strings{"Kherson"});
}

TEST(RegexEntityExtractorTest, EmptyTextYieldsNothing) {
    RegexEntityExtractor extractor;
    EXPECT_EQ(extractor.Extract(""), Entities{});
    EXPECT_EQ(extractor.Extract("nothing of note here"), Entities{});
}

}  // namespace
}  // namespace osintpipe::enrichment
