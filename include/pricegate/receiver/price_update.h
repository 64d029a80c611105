// PRICEGATE - Price Update Records
// Copyright (c) 2024 PRICEGATE Developers
// MIT License
//
// A price update record is written by the receiver program once it has
// checked guardian signatures on a bridged price message. This header
// defines the record and the accessors that decide whether the embedded
// price can be used:
// - GetPriceNoOlderThan: recommended, requires Full verification
// - GetPriceNoOlderThanWithCustomVerificationLevel: caller picks the level
// - GetPriceUnchecked: feed id check only, no trust or freshness checks
//
// The accessors are pure. Current time is always supplied by the caller.

#ifndef PRICEGATE_RECEIVER_PRICE_UPDATE_H
#define PRICEGATE_RECEIVER_PRICE_UPDATE_H

#include <pricegate/core/types.h>
#include <pricegate/receiver/verification.h>
#include <pricegate/util/time.h>

#include <cstdint>
#include <string>

namespace pricegate {
namespace receiver {

// ============================================================================
// Errors
// ============================================================================

/// Reasons a price cannot be returned
enum class GetPriceError {
    OK = 0,

    /// The record's feed id differs from the requested one
    MismatchedFeedId,

    /// The record's verification level is below the required level
    InsufficientVerificationLevel,

    /// publish_time + maximum_age < current_time
    PriceTooOld,

    /// Feed id string is neither 64 nor 66 characters
    FeedIdMustBe32Bytes,

    /// Feed id string contains a non-hex character
    FeedIdNonHexCharacter,
};

/// Convert error to string
const char* GetPriceErrorToString(GetPriceError err);

// ============================================================================
// Price
// ============================================================================

/**
 * A price read from a price update record.
 *
 * The actual price is (price +/- conf) * 10^exponent. publish_time can be
 * used to judge how recent the price is.
 */
struct Price {
    int64_t price{0};
    uint64_t conf{0};
    int32_t exponent{0};
    Timestamp publishTime{0};

    bool operator==(const Price& other) const {
        return price == other.price && conf == other.conf &&
               exponent == other.exponent && publishTime == other.publishTime;
    }

    bool operator!=(const Price& other) const { return !(*this == other); }

    std::string ToString() const;
};

// ============================================================================
// Price Feed Message
// ============================================================================

/**
 * The attested price payload, exactly as produced on the source chain.
 */
struct PriceFeedMessage {
    FeedId feedId;
    int64_t price{0};
    uint64_t conf{0};
    int32_t exponent{0};

    /// Timestamp of this price update in seconds
    Timestamp publishTime{0};

    /// Timestamp of the previous update for the same feed. For any time t
    /// the unique update covering t is the one with
    /// prevPublishTime < t <= publishTime. Upstream data does not always
    /// honour this: some updates are never bridged, and prevPublishTime
    /// equals publishTime when aggregation failed for the slot.
    Timestamp prevPublishTime{0};

    int64_t emaPrice{0};
    uint64_t emaConf{0};

    /// True if prevPublishTime < t <= publishTime
    bool Covers(Timestamp t) const {
        return prevPublishTime < t && t <= publishTime;
    }

    bool operator==(const PriceFeedMessage& other) const;
    bool operator!=(const PriceFeedMessage& other) const { return !(*this == other); }

    std::string ToString() const;
};

// ============================================================================
// Results
// ============================================================================

/**
 * Result of a price accessor: either a Price or the first failed check.
 */
struct GetPriceResult {
    GetPriceError error{GetPriceError::OK};
    Price price;

    static GetPriceResult Success(const Price& p) {
        GetPriceResult r;
        r.price = p;
        return r;
    }

    static GetPriceResult Failure(GetPriceError err) {
        GetPriceResult r;
        r.error = err;
        return r;
    }

    bool IsValid() const { return error == GetPriceError::OK; }
};

/**
 * Result of ParseFeedId.
 */
struct FeedIdParseResult {
    GetPriceError error{GetPriceError::OK};
    FeedId feedId;

    static FeedIdParseResult Success(const FeedId& id) {
        FeedIdParseResult r;
        r.feedId = id;
        return r;
    }

    static FeedIdParseResult Failure(GetPriceError err) {
        FeedIdParseResult r;
        r.error = err;
        return r;
    }

    bool IsValid() const { return error == GetPriceError::OK; }
};

// ============================================================================
// Price Update Record
// ============================================================================

/**
 * A verified price update as stored by the receiver program.
 *
 * - writeAuthority: may close the record to reclaim storage, or overwrite it
 *   with a newer update for a feed.
 * - verificationLevel: how many guardian signatures were checked.
 * - priceMessage: the attested price payload.
 * - postedSlot: slot at which the record was written.
 */
struct PriceUpdateRecord {
    Pubkey writeAuthority;
    VerificationLevel verificationLevel;
    PriceFeedMessage priceMessage;
    Slot postedSlot{0};

    /**
     * Get the price for a feed without checking age or verification level.
     *
     * WARNING: this is unsafe on its own. It will happily return an
     * unverified or arbitrarily old price. Callers take full responsibility
     * for any trust and freshness checks.
     *
     * @param feedId Expected feed
     * @return Price, or MismatchedFeedId
     */
    GetPriceResult GetPriceUnchecked(const FeedId& feedId) const;

    /**
     * Get the price for a feed, no older than maximumAge seconds, accepting
     * any verification level that meets requiredLevel.
     *
     * Checks run in a fixed order and stop at the first failure:
     * verification level, then feed id, then age.
     *
     * WARNING: passing a Partial level weakens the trust guarantee. Fewer
     * guardians need to collude to forge an update that passes.
     *
     * @param currentTime Current Unix time in seconds
     * @param maximumAge Maximum accepted age in seconds; saturates, so a
     *                   huge value means the price never goes stale
     * @param feedId Expected feed
     * @param requiredLevel Minimum acceptable verification level
     */
    GetPriceResult GetPriceNoOlderThanWithCustomVerificationLevel(
        Timestamp currentTime,
        uint64_t maximumAge,
        const FeedId& feedId,
        const VerificationLevel& requiredLevel) const;

    GetPriceResult GetPriceNoOlderThanWithCustomVerificationLevel(
        const util::IClock& clock,
        uint64_t maximumAge,
        const FeedId& feedId,
        const VerificationLevel& requiredLevel) const;

    /**
     * Get the price for a feed, no older than maximumAge seconds, requiring
     * Full verification. This is the entry point to use by default.
     */
    GetPriceResult GetPriceNoOlderThan(
        Timestamp currentTime,
        uint64_t maximumAge,
        const FeedId& feedId) const;

    GetPriceResult GetPriceNoOlderThan(
        const util::IClock& clock,
        uint64_t maximumAge,
        const FeedId& feedId) const;
};

// ============================================================================
// Utility Functions
// ============================================================================

/**
 * Parse a feed id from its hex form.
 *
 * Accepts 64 hex characters, or "0x" followed by 64 hex characters, in
 * either case. The bytes come out in the order written; there is no byte
 * reversal.
 *
 * Example:
 *   ParseFeedId("0xef0d8b6fda2ceba41da15d4095d1da392a0d2f8ed0c6c7bc0f4cfac8c280b56d")
 */
FeedIdParseResult ParseFeedId(const std::string& input);

} // namespace receiver
} // namespace pricegate

#endif // PRICEGATE_RECEIVER_PRICE_UPDATE_H
