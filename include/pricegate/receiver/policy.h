// PRICEGATE - Price Acceptance Policy
// Copyright (c) 2024 PRICEGATE Developers
// MIT License
//
// Binds the accessors in price_update.h to a policy loaded from
// configuration: which feed, how old, how well verified.

#ifndef PRICEGATE_RECEIVER_POLICY_H
#define PRICEGATE_RECEIVER_POLICY_H

#include <pricegate/core/types.h>
#include <pricegate/receiver/price_update.h>
#include <pricegate/receiver/verification.h>
#include <pricegate/util/config.h>
#include <pricegate/util/time.h>

#include <cstdint>
#include <optional>
#include <string>

namespace pricegate {
namespace receiver {

/// Default maximum age in seconds
constexpr uint64_t DEFAULT_MAXIMUM_AGE = 60;

/**
 * What a consumer is willing to accept.
 */
struct PricePolicy {
    /// Feed the price must belong to
    FeedId feedId;

    /// Maximum accepted age in seconds
    uint64_t maximumAge{DEFAULT_MAXIMUM_AGE};

    /// Minimum verification level
    VerificationLevel requiredLevel{VerificationLevel::Full()};

    /// Use GetPriceUnchecked (no trust or age checks)
    bool unchecked{false};

    /// Require the account discriminator to match
    bool checkDiscriminator{true};

    /// Fixed current time; the clock is used when unset
    std::optional<Timestamp> currentTime;

    std::string ToString() const;
};

/**
 * Result of loading a policy from configuration.
 */
struct PolicyLoadResult {
    bool success{false};
    std::string errorMessage;
    PricePolicy policy;

    static PolicyLoadResult Success(const PricePolicy& p) {
        PolicyLoadResult r;
        r.success = true;
        r.policy = p;
        return r;
    }

    static PolicyLoadResult Error(const std::string& msg) {
        PolicyLoadResult r;
        r.errorMessage = msg;
        return r;
    }
};

/**
 * Build a policy from configuration.
 *
 * Keys are looked up in the global section first (command line), then in
 * the [policy] section. "feed" is required; everything else has a default.
 */
PolicyLoadResult LoadPricePolicy(const util::ConfigManager& config);

/**
 * Read the price out of a record under a policy.
 *
 * @param record Decoded price update record
 * @param policy Acceptance policy
 * @param clock Used when the policy has no fixed current time
 */
GetPriceResult ApplyPricePolicy(const PriceUpdateRecord& record,
                                const PricePolicy& policy,
                                const util::IClock& clock);

} // namespace receiver
} // namespace pricegate

#endif // PRICEGATE_RECEIVER_POLICY_H
