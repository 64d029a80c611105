// PRICEGATE - Price Acceptance Policy Implementation
// Copyright (c) 2024 PRICEGATE Developers
// MIT License

#include "pricegate/receiver/policy.h"
#include "pricegate/util/logging.h"

#include <sstream>

namespace pricegate {
namespace receiver {

namespace {

using util::ConfigKeys::POLICY_SECTION;

/// Global (command-line) value wins over the [policy] section
std::optional<std::string> Lookup(const util::ConfigManager& config, const char* key) {
    auto value = config.TryGetString(key);
    if (value) {
        return value;
    }
    return config.TryGetString(key, POLICY_SECTION);
}

const char* SectionOf(const util::ConfigManager& config, const char* key) {
    return config.HasKey(key) ? "" : POLICY_SECTION;
}

} // namespace

std::string PricePolicy::ToString() const {
    std::ostringstream oss;
    oss << "PricePolicy{feed=" << feedId.ToHexPrefixed()
        << ", maxAge=" << maximumAge
        << ", level=" << requiredLevel.ToString()
        << ", unchecked=" << (unchecked ? "true" : "false")
        << ", discriminator=" << (checkDiscriminator ? "true" : "false");
    if (currentTime) {
        oss << ", now=" << *currentTime;
    }
    oss << "}";
    return oss.str();
}

PolicyLoadResult LoadPricePolicy(const util::ConfigManager& config) {
    PricePolicy policy;

    auto feed = Lookup(config, util::ConfigKeys::FEED);
    if (!feed) {
        return PolicyLoadResult::Error("Missing required option: feed");
    }
    FeedIdParseResult parsed = ParseFeedId(*feed);
    if (!parsed.IsValid()) {
        return PolicyLoadResult::Error(
            std::string("Invalid feed id: ") + GetPriceErrorToString(parsed.error));
    }
    policy.feedId = parsed.feedId;

    if (Lookup(config, util::ConfigKeys::MAXAGE)) {
        auto maxAge = config.TryGetUInt(util::ConfigKeys::MAXAGE,
                                        SectionOf(config, util::ConfigKeys::MAXAGE));
        if (!maxAge) {
            return PolicyLoadResult::Error("Invalid maxage: expected seconds as an unsigned integer");
        }
        policy.maximumAge = *maxAge;
    }

    if (auto levelStr = Lookup(config, util::ConfigKeys::LEVEL)) {
        auto level = VerificationLevel::FromString(*levelStr);
        if (!level) {
            return PolicyLoadResult::Error("Invalid level '" + *levelStr +
                                           "': expected full or partial:<n>");
        }
        policy.requiredLevel = *level;
    }

    if (Lookup(config, util::ConfigKeys::NOW)) {
        auto now = config.TryGetInt(util::ConfigKeys::NOW,
                                    SectionOf(config, util::ConfigKeys::NOW));
        if (!now) {
            return PolicyLoadResult::Error("Invalid now: expected Unix seconds");
        }
        policy.currentTime = *now;
    }

    if (Lookup(config, util::ConfigKeys::UNCHECKED)) {
        auto unchecked = config.TryGetBool(util::ConfigKeys::UNCHECKED,
                                           SectionOf(config, util::ConfigKeys::UNCHECKED));
        if (!unchecked) {
            return PolicyLoadResult::Error("Invalid unchecked: expected a boolean");
        }
        policy.unchecked = *unchecked;
    }

    if (Lookup(config, util::ConfigKeys::DISCRIMINATOR)) {
        auto check = config.TryGetBool(util::ConfigKeys::DISCRIMINATOR,
                                       SectionOf(config, util::ConfigKeys::DISCRIMINATOR));
        if (!check) {
            return PolicyLoadResult::Error("Invalid discriminator: expected a boolean");
        }
        policy.checkDiscriminator = *check;
    }

    LOG_DEBUG(util::LogCategory::CONFIG) << "Loaded " << policy.ToString();
    return PolicyLoadResult::Success(policy);
}

GetPriceResult ApplyPricePolicy(const PriceUpdateRecord& record,
                                const PricePolicy& policy,
                                const util::IClock& clock) {
    if (policy.unchecked) {
        LOG_WARN(util::LogCategory::RECEIVER)
            << "Reading price without verification or staleness checks";
        return record.GetPriceUnchecked(policy.feedId);
    }

    if (!policy.requiredLevel.IsFull()) {
        LOG_WARN(util::LogCategory::RECEIVER)
            << "Accepting partially verified updates ("
            << policy.requiredLevel.ToString() << ")";
    }

    Timestamp now = policy.currentTime ? *policy.currentTime : clock.Now();
    return record.GetPriceNoOlderThanWithCustomVerificationLevel(
        now, policy.maximumAge, policy.feedId, policy.requiredLevel);
}

} // namespace receiver
} // namespace pricegate
