// PRICEGATE - Price Check Command Tests
// Copyright (c) 2024 PRICEGATE Developers
// MIT License

#include <gtest/gtest.h>

#include "pricegate/cli/check.h"
#include "pricegate/core/hex.h"
#include "pricegate/receiver/account.h"
#include "pricegate/util/logging.h"
#include "pricegate/util/time.h"

#include <cstdio>
#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include <unistd.h>

namespace pricegate {
namespace cli {
namespace test {

constexpr const char* FEED_HEX =
    "ef0d8b6fda2ceba41da15d4095d1da392a0d2f8ed0c6c7bc0f4cfac8c280b56d";

const std::string FEED_ARG = std::string("-feed=") + FEED_HEX;

// ============================================================================
// Test Fixtures
// ============================================================================

class CheckCommandTest : public ::testing::Test {
protected:
    void SetUp() override {
        util::Logger::Instance().ClearSinks();
        util::Logger::Instance().SetLevel(util::LogLevel::Info);

        record_.verificationLevel = receiver::VerificationLevel::Full();
        record_.priceMessage.feedId = receiver::ParseFeedId(FEED_HEX).feedId;
        record_.priceMessage.price = 14372140000;
        record_.priceMessage.conf = 10287536;
        record_.priceMessage.exponent = -8;
        record_.priceMessage.publishTime = 1000;
        record_.priceMessage.prevPublishTime = 999;
        record_.postedSlot = 42;
    }

    void TearDown() override {
        util::DisableMockTime();
        util::Logger::Instance().SetLevel(util::LogLevel::Info);
        util::Logger::Instance().ClearSinks();
        for (const auto& file : tempFiles_) {
            std::remove(file.c_str());
        }
    }

    std::string AccountHex() const {
        std::vector<Byte> data = receiver::EncodePriceUpdateAccount(record_);
        return BytesToHex(data.data(), data.size());
    }

    int Run(const std::vector<std::string>& args) {
        std::vector<const char*> argv = {"pricegate-check"};
        for (const auto& arg : args) {
            argv.push_back(arg.c_str());
        }
        out_.str("");
        return RunCheck(static_cast<int>(argv.size()), argv.data(), out_);
    }

    std::string CreateTempFile(const std::string& content) {
        char filename[] = "/tmp/pricegate_check_test_XXXXXX";
        int fd = mkstemp(filename);
        if (fd < 0) {
            throw std::runtime_error("Failed to create temp file");
        }
        close(fd);

        std::ofstream file(filename);
        file << content;
        file.close();

        tempFiles_.push_back(filename);
        return filename;
    }

    receiver::PriceUpdateRecord record_;
    std::ostringstream out_;
    std::vector<std::string> tempFiles_;
};

// ============================================================================
// Accept / Reject
// ============================================================================

TEST_F(CheckCommandTest, AcceptedPricePrinted) {
    EXPECT_EQ(Run({FEED_ARG, "-now=1010", AccountHex()}), RESULT_ACCEPTED);
    EXPECT_EQ(out_.str(),
              "price=14372140000 conf=10287536 exponent=-8 publish_time=1000 "
              "(1970-01-01T00:16:40Z)\n");
}

TEST_F(CheckCommandTest, PrefixedAccountHex) {
    EXPECT_EQ(Run({FEED_ARG, "-now=1010", "0x" + AccountHex()}), RESULT_ACCEPTED);
}

TEST_F(CheckCommandTest, PartialRecordRejectedByDefault) {
    record_.verificationLevel = receiver::VerificationLevel::Partial(5);
    EXPECT_EQ(Run({FEED_ARG, "-now=1010", AccountHex()}), RESULT_REJECTED);
    EXPECT_EQ(out_.str(),
              "rejected: This price feed update has an insufficient verification level\n");
}

TEST_F(CheckCommandTest, PartialRecordAcceptedWithLevel) {
    record_.verificationLevel = receiver::VerificationLevel::Partial(5);
    EXPECT_EQ(Run({FEED_ARG, "-now=1010", "-level=partial:5", AccountHex()}),
              RESULT_ACCEPTED);
}

TEST_F(CheckCommandTest, StalePriceRejected) {
    EXPECT_EQ(Run({FEED_ARG, "-now=1061", AccountHex()}), RESULT_REJECTED);
    EXPECT_EQ(out_.str(), "rejected: This price feed update is too old\n");
}

TEST_F(CheckCommandTest, OtherFeedRejected) {
    std::string otherFeed = "-feed=" + std::string(64, '1');
    EXPECT_EQ(Run({otherFeed, "-now=1010", AccountHex()}), RESULT_REJECTED);
    EXPECT_EQ(out_.str().rfind("rejected: ", 0), 0u);
}

TEST_F(CheckCommandTest, UncheckedIgnoresLevelAndAge) {
    record_.verificationLevel = receiver::VerificationLevel::Partial(0);
    EXPECT_EQ(Run({FEED_ARG, "-now=999999", "-unchecked", AccountHex()}), RESULT_ACCEPTED);
}

TEST_F(CheckCommandTest, UsesMockedWallClock) {
    util::EnableMockTime();
    util::SetMockTime(1010);
    EXPECT_EQ(Run({FEED_ARG, AccountHex()}), RESULT_ACCEPTED);

    util::SetMockTime(5000);
    EXPECT_EQ(Run({FEED_ARG, AccountHex()}), RESULT_REJECTED);
}

// ============================================================================
// Input Errors
// ============================================================================

TEST_F(CheckCommandTest, BadHexIsUsageError) {
    EXPECT_EQ(Run({FEED_ARG, "zz"}), RESULT_USAGE_ERROR);
    EXPECT_EQ(Run({FEED_ARG, AccountHex() + "0"}), RESULT_USAGE_ERROR);
    EXPECT_TRUE(out_.str().empty());
}

TEST_F(CheckCommandTest, MissingFeedIsUsageError) {
    EXPECT_EQ(Run({"-now=1010", AccountHex()}), RESULT_USAGE_ERROR);
    EXPECT_TRUE(out_.str().empty());
}

TEST_F(CheckCommandTest, InvalidFeedIsUsageError) {
    EXPECT_EQ(Run({"-feed=0x1234", AccountHex()}), RESULT_USAGE_ERROR);
}

TEST_F(CheckCommandTest, WrongArgumentCountPrintsUsage) {
    EXPECT_EQ(Run({FEED_ARG}), RESULT_USAGE_ERROR);
    EXPECT_NE(out_.str().find("Usage:"), std::string::npos);

    EXPECT_EQ(Run({FEED_ARG, AccountHex(), AccountHex()}), RESULT_USAGE_ERROR);
}

TEST_F(CheckCommandTest, TruncatedAccountIsUsageError) {
    std::string hex = AccountHex();
    EXPECT_EQ(Run({FEED_ARG, "-now=1010", hex.substr(0, 80)}), RESULT_USAGE_ERROR);
}

TEST_F(CheckCommandTest, DiscriminatorCheckCanBeDisabled) {
    std::string hex = AccountHex();
    hex.replace(0, 2, "00");

    EXPECT_EQ(Run({FEED_ARG, "-now=1010", hex}), RESULT_USAGE_ERROR);
    EXPECT_EQ(Run({FEED_ARG, "-now=1010", "-nodiscriminator", hex}), RESULT_ACCEPTED);
}

TEST_F(CheckCommandTest, HelpAndVersion) {
    EXPECT_EQ(Run({"-help"}), RESULT_ACCEPTED);
    EXPECT_NE(out_.str().find("Exit codes"), std::string::npos);

    EXPECT_EQ(Run({"-version"}), RESULT_ACCEPTED);
    EXPECT_EQ(out_.str(), std::string(CLIENT_NAME) + " v" + VERSION + "\n");
}

// ============================================================================
// Account File and Config File
// ============================================================================

TEST_F(CheckCommandTest, AccountFromFile) {
    std::string hex = AccountHex();
    std::string path = CreateTempFile(hex.substr(0, 100) + "\n  " + hex.substr(100) + "\n");
    EXPECT_EQ(Run({FEED_ARG, "-now=1010", "@" + path}), RESULT_ACCEPTED);
}

TEST_F(CheckCommandTest, MissingAccountFile) {
    EXPECT_EQ(Run({FEED_ARG, "@/nonexistent/account.hex"}), RESULT_USAGE_ERROR);
}

TEST_F(CheckCommandTest, PolicyFromConfigFile) {
    std::string conf = CreateTempFile(std::string("[policy]\nfeed=") + FEED_HEX +
                                      "\nmaxage=5\nnow=1010\n");
    EXPECT_EQ(Run({"-conf=" + conf, AccountHex()}), RESULT_REJECTED);
    EXPECT_EQ(out_.str(), "rejected: This price feed update is too old\n");
}

TEST_F(CheckCommandTest, CommandLineOverridesConfigFile) {
    std::string conf = CreateTempFile(std::string("[policy]\nfeed=") + FEED_HEX +
                                      "\nmaxage=5\nnow=1010\n");
    EXPECT_EQ(Run({"-conf=" + conf, "-maxage=30", AccountHex()}), RESULT_ACCEPTED);
}

TEST_F(CheckCommandTest, BadConfigFileIsUsageError) {
    EXPECT_EQ(Run({"-conf=/nonexistent/pricegate.conf", FEED_ARG, AccountHex()}),
              RESULT_USAGE_ERROR);

    std::string conf = CreateTempFile("[policy\n");
    EXPECT_EQ(Run({"-conf=" + conf, FEED_ARG, AccountHex()}), RESULT_USAGE_ERROR);
}

// ============================================================================
// Logging
// ============================================================================

TEST_F(CheckCommandTest, DebugFlagRaisesLogLevel) {
    std::vector<std::string> messages;
    util::Logger::Instance().AddSink(std::make_shared<util::CallbackSink>(
        [&messages](const util::LogEntry& entry) { messages.push_back(entry.message); }));

    EXPECT_EQ(Run({FEED_ARG, "-now=1010", "-debug", AccountHex()}), RESULT_ACCEPTED);
    EXPECT_EQ(util::Logger::Instance().GetLevel(), util::LogLevel::Debug);

    bool sawRecord = false;
    for (const auto& message : messages) {
        if (message.rfind("Record: ", 0) == 0) {
            sawRecord = true;
        }
    }
    EXPECT_TRUE(sawRecord);
}

TEST_F(CheckCommandTest, ErrorsGoToLogger) {
    std::vector<util::LogLevel> levels;
    util::Logger::Instance().AddSink(std::make_shared<util::CallbackSink>(
        [&levels](const util::LogEntry& entry) { levels.push_back(entry.level); }));

    EXPECT_EQ(Run({FEED_ARG, "zz"}), RESULT_USAGE_ERROR);
    ASSERT_EQ(levels.size(), 1u);
    EXPECT_EQ(levels[0], util::LogLevel::Error);
}

} // namespace test
} // namespace cli
} // namespace pricegate
