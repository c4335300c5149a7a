#include "gtest/gtest.h"
#include "archetype_matcher.h"
#include "errors.h"

#include <limits>

namespace poker_coach {

TEST(ArchetypeMatcherTest, CatalogueLookup) {
    EXPECT_EQ(archetype_catalogue().size(), 12u);
    EXPECT_EQ(archetype_catalogue().front().key, "nit");
    EXPECT_EQ(archetype_by_key("maniac").label, "Maniac");
    EXPECT_TRUE(is_archetype_key("weak_tight"));
    EXPECT_FALSE(is_archetype_key("shark"));
    EXPECT_THROW(archetype_by_key("shark"), ConfigError);
}

TEST(ArchetypeMatcherTest, LoosePassiveIsCallingStation) {
    ArchetypeMatcher matcher;
    ArchetypeMatch match = matcher.match({0.55, 0.08, 0.9, ""});
    EXPECT_EQ(match.key, "calling_station");
    EXPECT_EQ(match.label, "Loose-Passive Calling Station");
    EXPECT_GT(match.score, 0.0);
    EXPECT_LE(match.score, 1.0);
}

TEST(ArchetypeMatcherTest, EachArchetypeMatchesItself) {
    ArchetypeMatcher matcher;
    for (const Archetype& archetype : archetype_catalogue()) {
        ArchetypeMatch match = matcher.match({archetype.vpip, archetype.pfr, archetype.af, ""});
        EXPECT_EQ(match.key, archetype.key);
        EXPECT_DOUBLE_EQ(match.distance, 0.0);
        EXPECT_DOUBLE_EQ(match.score, 1.0);
    }
}

TEST(ArchetypeMatcherTest, RankIsSortedAndComplete) {
    ArchetypeMatcher matcher;
    std::vector<ArchetypeMatch> ranked = matcher.rank({0.30, 0.20, 2.5, ""});
    ASSERT_EQ(ranked.size(), archetype_catalogue().size());
    for (size_t i = 1; i < ranked.size(); ++i) {
        EXPECT_LE(ranked[i - 1].distance, ranked[i].distance);
    }
}

TEST(ArchetypeMatcherTest, StyleLabelDiscountsDistance) {
    ArchetypeMatcher matcher;
    StatVector plain{0.40, 0.18, 1.8, ""};
    StatVector labelled{0.40, 0.18, 1.8, "Loose-Passive (Calling Station)"};

    double plain_distance = 0.0;
    double labelled_distance = 0.0;
    for (const ArchetypeMatch& m : matcher.rank(plain)) {
        if (m.key == "calling_station") plain_distance = m.distance;
    }
    for (const ArchetypeMatch& m : matcher.rank(labelled)) {
        if (m.key == "calling_station") labelled_distance = m.distance;
    }
    EXPECT_NEAR(labelled_distance, plain_distance * 0.68, 1e-9);
}

TEST(ArchetypeMatcherTest, InfiniteAggressionIsCapped) {
    const Archetype& maniac = archetype_by_key("maniac");
    StatVector infinite{0.52, 0.37, std::numeric_limits<double>::infinity(), ""};
    StatVector capped{0.52, 0.37, ArchetypeMatcher::AF_CAP, ""};
    EXPECT_DOUBLE_EQ(ArchetypeMatcher::base_distance(infinite, maniac),
                     ArchetypeMatcher::base_distance(capped, maniac));

    ArchetypeMatcher matcher;
    EXPECT_EQ(matcher.match(infinite).key, "maniac");
}

TEST(ArchetypeMatcherTest, FromProfile) {
    PlayerProfile empty;
    empty.player_id = "ghost";
    EXPECT_THROW(ArchetypeMatcher::from_profile(empty), ConfigError);

    PlayerProfile profile;
    profile.player_id = "villain";
    profile.rates.vpip = 0.45;
    profile.rates.pfr = 0.10;
    profile.style = PlayStyle::LOOSE_PASSIVE;
    StatVector stats = ArchetypeMatcher::from_profile(profile);
    EXPECT_DOUBLE_EQ(stats.vpip, 0.45);
    EXPECT_DOUBLE_EQ(stats.af, ArchetypeMatcher::DEFAULT_AF);
    EXPECT_NEAR(stats.gap(), 0.35, 1e-12);
    EXPECT_EQ(stats.style_label, "Loose-Passive (Calling Station)");
}

} // namespace poker_coach
