// PRICEGATE - Price Update Records Implementation
// Copyright (c) 2024 PRICEGATE Developers
// MIT License

#include "pricegate/receiver/price_update.h"
#include "pricegate/core/hex.h"

#include <sstream>

namespace pricegate {
namespace receiver {

namespace {

constexpr size_t FEED_ID_HEX_LEN = FeedId::SIZE * 2;
constexpr size_t FEED_ID_PREFIXED_HEX_LEN = FEED_ID_HEX_LEN + 2;

} // namespace

// ============================================================================
// Errors
// ============================================================================

const char* GetPriceErrorToString(GetPriceError err) {
    switch (err) {
        case GetPriceError::OK: return "OK";
        case GetPriceError::MismatchedFeedId: return "This price feed update's feed id does not match the requested feed id";
        case GetPriceError::InsufficientVerificationLevel: return "This price feed update has an insufficient verification level";
        case GetPriceError::PriceTooOld: return "This price feed update is too old";
        case GetPriceError::FeedIdMustBe32Bytes: return "Feed id must be 32 bytes (64 hex characters, optionally 0x-prefixed)";
        case GetPriceError::FeedIdNonHexCharacter: return "Feed id contains a non-hex character";
        default: return "Unknown error";
    }
}

// ============================================================================
// Price / PriceFeedMessage
// ============================================================================

std::string Price::ToString() const {
    std::ostringstream oss;
    oss << "Price{price=" << price
        << ", conf=" << conf
        << ", exponent=" << exponent
        << ", publishTime=" << publishTime << "}";
    return oss.str();
}

bool PriceFeedMessage::operator==(const PriceFeedMessage& other) const {
    return feedId == other.feedId &&
           price == other.price &&
           conf == other.conf &&
           exponent == other.exponent &&
           publishTime == other.publishTime &&
           prevPublishTime == other.prevPublishTime &&
           emaPrice == other.emaPrice &&
           emaConf == other.emaConf;
}

std::string PriceFeedMessage::ToString() const {
    std::ostringstream oss;
    oss << "PriceFeedMessage{feed=" << feedId.ToHexPrefixed()
        << ", price=" << price
        << ", conf=" << conf
        << ", exponent=" << exponent
        << ", publishTime=" << publishTime
        << ", prevPublishTime=" << prevPublishTime
        << ", emaPrice=" << emaPrice
        << ", emaConf=" << emaConf << "}";
    return oss.str();
}

// ============================================================================
// PriceUpdateRecord Accessors
// ============================================================================

GetPriceResult PriceUpdateRecord::GetPriceUnchecked(const FeedId& feedId) const {
    if (priceMessage.feedId != feedId) {
        return GetPriceResult::Failure(GetPriceError::MismatchedFeedId);
    }

    Price p;
    p.price = priceMessage.price;
    p.conf = priceMessage.conf;
    p.exponent = priceMessage.exponent;
    p.publishTime = priceMessage.publishTime;
    return GetPriceResult::Success(p);
}

GetPriceResult PriceUpdateRecord::GetPriceNoOlderThanWithCustomVerificationLevel(
    Timestamp currentTime,
    uint64_t maximumAge,
    const FeedId& feedId,
    const VerificationLevel& requiredLevel) const {

    // Trust first, then identity, then freshness
    if (!verificationLevel.Gte(requiredLevel)) {
        return GetPriceResult::Failure(GetPriceError::InsufficientVerificationLevel);
    }

    GetPriceResult result = GetPriceUnchecked(feedId);
    if (!result.IsValid()) {
        return result;
    }

    if (SaturatingAdd(result.price.publishTime, maximumAge) < currentTime) {
        return GetPriceResult::Failure(GetPriceError::PriceTooOld);
    }

    return result;
}

GetPriceResult PriceUpdateRecord::GetPriceNoOlderThanWithCustomVerificationLevel(
    const util::IClock& clock,
    uint64_t maximumAge,
    const FeedId& feedId,
    const VerificationLevel& requiredLevel) const {
    return GetPriceNoOlderThanWithCustomVerificationLevel(
        clock.Now(), maximumAge, feedId, requiredLevel);
}

GetPriceResult PriceUpdateRecord::GetPriceNoOlderThan(
    Timestamp currentTime,
    uint64_t maximumAge,
    const FeedId& feedId) const {
    return GetPriceNoOlderThanWithCustomVerificationLevel(
        currentTime, maximumAge, feedId, VerificationLevel::Full());
}

GetPriceResult PriceUpdateRecord::GetPriceNoOlderThan(
    const util::IClock& clock,
    uint64_t maximumAge,
    const FeedId& feedId) const {
    return GetPriceNoOlderThan(clock.Now(), maximumAge, feedId);
}

// ============================================================================
// Utility Functions
// ============================================================================

FeedIdParseResult ParseFeedId(const std::string& input) {
    size_t offset = 0;

    if (input.length() == FEED_ID_PREFIXED_HEX_LEN) {
        // Only "0x" / "0X" may occupy the two extra characters
        if (input[0] != '0' || (input[1] != 'x' && input[1] != 'X')) {
            return FeedIdParseResult::Failure(GetPriceError::FeedIdNonHexCharacter);
        }
        offset = 2;
    } else if (input.length() != FEED_ID_HEX_LEN) {
        return FeedIdParseResult::Failure(GetPriceError::FeedIdMustBe32Bytes);
    }

    std::array<Byte, FeedId::SIZE> bytes{};
    if (!DecodeHexInto(input, offset, bytes)) {
        return FeedIdParseResult::Failure(GetPriceError::FeedIdNonHexCharacter);
    }

    return FeedIdParseResult::Success(FeedId(bytes));
}

} // namespace receiver
} // namespace pricegate
