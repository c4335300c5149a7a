#include "gtest/gtest.h"
#include "hero_profile.h"

#include <algorithm>

namespace poker_coach {

TEST(HeroProfileTest, Defaults) {
    HeroProfile hero;
    EXPECT_DOUBLE_EQ(hero.vpip(), 0.30);
    EXPECT_DOUBLE_EQ(hero.pfr(), 0.22);
    EXPECT_DOUBLE_EQ(hero.af(), 2.8);
    EXPECT_DOUBLE_EQ(hero.three_bet(), 0.09);
    EXPECT_DOUBLE_EQ(hero.fold_to_3bet(), 0.54);
    EXPECT_EQ(hero.style_label(), "LAG");
}

TEST(HeroProfileTest, FromInputNormalizesAndClamps) {
    HeroProfileInput input;
    input.vpip = 35.0;
    input.pfr = 0.25;
    input.af = 12.0;
    input.fold_to_3bet = 150.0;
    HeroProfile hero = HeroProfile::from_input(input);

    EXPECT_DOUBLE_EQ(hero.vpip(), 0.35);
    EXPECT_DOUBLE_EQ(hero.pfr(), 0.25);
    EXPECT_DOUBLE_EQ(hero.af(), 8.0);
    EXPECT_DOUBLE_EQ(hero.three_bet(), 0.09);
    EXPECT_DOUBLE_EQ(hero.fold_to_3bet(), 1.0);

    HeroProfileInput passive;
    passive.af = 0.1;
    EXPECT_DOUBLE_EQ(HeroProfile::from_input(passive).af(), 0.4);
}

TEST(HeroProfileTest, StyleLabels) {
    EXPECT_EQ(HeroProfile(0.15, 0.10, 1.5, 0.04, 0.5).style_label(), "Nit / Tight-Passive");
    EXPECT_EQ(HeroProfile(0.22, 0.18, 2.5, 0.08, 0.5).style_label(), "TAG");
    EXPECT_EQ(HeroProfile(0.40, 0.12, 1.0, 0.03, 0.7).style_label(), "Loose-Passive");
    EXPECT_EQ(HeroProfile(0.26, 0.14, 1.8, 0.06, 0.5).style_label(), "Hybrid / Transitional");
}

TEST(HeroProfileTest, LeakFlags) {
    HeroProfile leaky(0.40, 0.12, 1.0, 0.03, 0.70);
    EXPECT_NEAR(leaky.vpip_pfr_gap(), 0.28, 1e-12);
    EXPECT_EQ(leaky.leak_flags().size(), 4u);

    HeroProfile solid(0.24, 0.20, 2.5, 0.08, 0.50);
    EXPECT_TRUE(solid.leak_flags().empty());
}

TEST(HeroProfileTest, ImageBluffinessIsBounded) {
    EXPECT_GE(HeroProfile(0.08, 0.05, 0.4, 0.01, 0.9).image_bluffiness(), 0.0);
    EXPECT_LE(HeroProfile(0.65, 0.50, 8.0, 0.30, 0.1).image_bluffiness(), 1.0);
    EXPECT_GT(HeroProfile(0.45, 0.35, 4.0, 0.12, 0.4).image_bluffiness(),
              HeroProfile(0.15, 0.10, 1.5, 0.04, 0.5).image_bluffiness());
    EXPECT_DOUBLE_EQ(HeroProfile(0.0, 0.0, 1.0, 0.0, 0.5).preflop_aggression_ratio(), 0.0);
}

TEST(HeroProfileTest, PositionTargetsAndGuidance) {
    EXPECT_EQ(position_open_target("BTN"), std::make_pair(0.44, 0.60));
    EXPECT_EQ(position_open_target("XX"), std::make_pair(0.22, 0.30));

    HeroProfile aggressive(0.35, 0.28, 4.2, 0.12, 0.45);
    PositionGuidance g = aggressive.position_guidance("BTN", "river");
    EXPECT_DOUBLE_EQ(g.target_open_low, 0.44);
    EXPECT_DOUBLE_EQ(g.target_open_high, 0.60);
    EXPECT_EQ(g.style_label, aggressive.style_label());
    EXPECT_EQ(g.notes.size(), 2u);

    PositionGuidance early = HeroProfile().position_guidance("UTG", "flop");
    ASSERT_EQ(early.notes.size(), 1u);
}

TEST(HeroProfileTest, RandomizeIsSeededAndClamped) {
    std::mt19937_64 a(7);
    std::mt19937_64 b(7);
    for (int i = 0; i < 50; ++i) {
        HeroProfile x = HeroProfile::randomize(a);
        HeroProfile y = HeroProfile::randomize(b);
        EXPECT_DOUBLE_EQ(x.vpip(), y.vpip());
        EXPECT_DOUBLE_EQ(x.fold_to_3bet(), y.fold_to_3bet());
        EXPECT_GE(x.vpip(), 0.08);
        EXPECT_LE(x.vpip(), 0.65);
        EXPECT_GE(x.pfr(), 0.05);
        EXPECT_LE(x.pfr(), 0.50);
        EXPECT_GE(x.af(), 0.4);
        EXPECT_LE(x.af(), 8.0);
    }
}

} // namespace poker_coach
