// PRICEGATE - Verification Level Tests
// Copyright (c) 2024 PRICEGATE Developers
// MIT License

#include <gtest/gtest.h>
#include "pricegate/receiver/verification.h"

#include <vector>

namespace pricegate {
namespace receiver {
namespace {

// Every Partial count plus Full
std::vector<VerificationLevel> AllLevels() {
    std::vector<VerificationLevel> levels;
    for (int n = 0; n <= 255; ++n) {
        levels.push_back(VerificationLevel::Partial(static_cast<uint8_t>(n)));
    }
    levels.push_back(VerificationLevel::Full());
    return levels;
}

// ============================================================================
// Construction
// ============================================================================

TEST(VerificationLevelTest, DefaultIsPartialZero) {
    VerificationLevel level;
    EXPECT_TRUE(level.IsPartial());
    EXPECT_EQ(level.NumSignatures(), 0);
    EXPECT_EQ(level, VerificationLevel::Partial(0));
}

TEST(VerificationLevelTest, Accessors) {
    auto partial = VerificationLevel::Partial(5);
    EXPECT_EQ(partial.GetKind(), VerificationLevel::Kind::Partial);
    EXPECT_EQ(partial.NumSignatures(), 5);
    EXPECT_FALSE(partial.IsFull());

    auto full = VerificationLevel::Full();
    EXPECT_EQ(full.GetKind(), VerificationLevel::Kind::Full);
    EXPECT_TRUE(full.IsFull());
}

TEST(VerificationLevelTest, Equality) {
    EXPECT_EQ(VerificationLevel::Full(), VerificationLevel::Full());
    EXPECT_EQ(VerificationLevel::Partial(3), VerificationLevel::Partial(3));
    EXPECT_NE(VerificationLevel::Partial(3), VerificationLevel::Partial(4));
    EXPECT_NE(VerificationLevel::Partial(0), VerificationLevel::Full());
}

// ============================================================================
// Gte
// ============================================================================

TEST(VerificationLevelTest, FullDominatesEverything) {
    for (const auto& level : AllLevels()) {
        EXPECT_TRUE(VerificationLevel::Full().Gte(level)) << level.ToString();
    }
}

TEST(VerificationLevelTest, PartialNeverMeetsFull) {
    for (int n = 0; n <= 255; ++n) {
        auto partial = VerificationLevel::Partial(static_cast<uint8_t>(n));
        EXPECT_FALSE(partial.Gte(VerificationLevel::Full())) << n;
    }
}

TEST(VerificationLevelTest, PartialOrderedByCount) {
    for (int a = 0; a <= 255; a += 15) {
        for (int b = 0; b <= 255; b += 17) {
            auto lhs = VerificationLevel::Partial(static_cast<uint8_t>(a));
            auto rhs = VerificationLevel::Partial(static_cast<uint8_t>(b));
            EXPECT_EQ(lhs.Gte(rhs), a >= b) << a << " vs " << b;
        }
    }
}

TEST(VerificationLevelTest, GteIsReflexive) {
    for (const auto& level : AllLevels()) {
        EXPECT_TRUE(level.Gte(level)) << level.ToString();
    }
}

TEST(VerificationLevelTest, PartialMaxStillBelowFull) {
    EXPECT_FALSE(VerificationLevel::Partial(255).Gte(VerificationLevel::Full()));
    EXPECT_TRUE(VerificationLevel::Partial(255).Gte(VerificationLevel::Partial(254)));
}

// ============================================================================
// String Conversion
// ============================================================================

TEST(VerificationLevelTest, ToString) {
    EXPECT_EQ(VerificationLevel::Full().ToString(), "Full");
    EXPECT_EQ(VerificationLevel::Partial(13).ToString(), "Partial(13)");
}

TEST(VerificationLevelTest, FromString) {
    EXPECT_EQ(VerificationLevel::FromString("full"), VerificationLevel::Full());
    EXPECT_EQ(VerificationLevel::FromString("FULL"), VerificationLevel::Full());
    EXPECT_EQ(VerificationLevel::FromString("partial:0"), VerificationLevel::Partial(0));
    EXPECT_EQ(VerificationLevel::FromString("Partial:255"), VerificationLevel::Partial(255));
}

TEST(VerificationLevelTest, FromStringInvalid) {
    EXPECT_FALSE(VerificationLevel::FromString("").has_value());
    EXPECT_FALSE(VerificationLevel::FromString("partial").has_value());
    EXPECT_FALSE(VerificationLevel::FromString("partial:").has_value());
    EXPECT_FALSE(VerificationLevel::FromString("partial:256").has_value());
    EXPECT_FALSE(VerificationLevel::FromString("partial:-1").has_value());
    EXPECT_FALSE(VerificationLevel::FromString("partial:1000").has_value());
    EXPECT_FALSE(VerificationLevel::FromString("partial:3x").has_value());
    EXPECT_FALSE(VerificationLevel::FromString("fully").has_value());
}

TEST(VerificationLevelTest, FromStringHighBitCharacters) {
    EXPECT_FALSE(VerificationLevel::FromString("\xC6\x92ull").has_value());
    EXPECT_FALSE(VerificationLevel::FromString("partial:\xFF").has_value());
    EXPECT_FALSE(VerificationLevel::FromString(std::string(1, '\x80')).has_value());
}

} // namespace
} // namespace receiver
} // namespace pricegate
