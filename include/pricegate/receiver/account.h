// PRICEGATE - Price Update Account Codec
// Copyright (c) 2024 PRICEGATE Developers
// MIT License
//
// Byte layout of price update accounts as written by the receiver program.
// Little-endian, fixed-width fields in declaration order (Borsh):
//
//   discriminator      8   first 8 bytes of SHA-256("account:PriceUpdateV2")
//   write_authority   32
//   verification_level 1 + 0..1   tag 0 = Partial(u8), tag 1 = Full
//   price_message     84   feed_id(32) price(8) conf(8) exponent(4)
//                          publish_time(8) prev_publish_time(8)
//                          ema_price(8) ema_conf(8)
//   posted_slot        8
//
// Accounts are allocated at PRICE_UPDATE_ACCOUNT_LEN bytes. A Full record is
// one byte shorter than a Partial one, leaving a trailing zero byte.

#ifndef PRICEGATE_RECEIVER_ACCOUNT_H
#define PRICEGATE_RECEIVER_ACCOUNT_H

#include <pricegate/core/serialize.h>
#include <pricegate/core/types.h>
#include <pricegate/receiver/price_update.h>
#include <pricegate/receiver/verification.h>

#include <array>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace pricegate {
namespace receiver {

// ============================================================================
// Layout Constants
// ============================================================================

/// Size of the account type discriminator header
constexpr size_t ACCOUNT_DISCRIMINATOR_SIZE = 8;

/// Encoded size of a PriceFeedMessage
constexpr size_t PRICE_FEED_MESSAGE_SIZE = 32 + 8 + 8 + 4 + 8 + 8 + 8 + 8;

/// Largest encoding of a VerificationLevel (tag + signature count)
constexpr size_t VERIFICATION_LEVEL_MAX_SIZE = 2;

/// Allocated size of a price update account, header included
constexpr size_t PRICE_UPDATE_ACCOUNT_LEN =
    ACCOUNT_DISCRIMINATOR_SIZE + 32 + VERIFICATION_LEVEL_MAX_SIZE +
    PRICE_FEED_MESSAGE_SIZE + 8;

/// Account name hashed into the discriminator
constexpr const char* PRICE_UPDATE_ACCOUNT_NAME = "PriceUpdateV2";

using Discriminator = std::array<Byte, ACCOUNT_DISCRIMINATOR_SIZE>;

/// First 8 bytes of SHA-256("account:" + accountName)
Discriminator ComputeAccountDiscriminator(const std::string& accountName);

/// Discriminator of price update accounts (computed once)
const Discriminator& PriceUpdateDiscriminator();

// ============================================================================
// Decode Errors
// ============================================================================

enum class DecodeError {
    OK = 0,

    /// Input ended before the record was complete
    TooShort,

    /// Header does not match the price update account discriminator
    BadDiscriminator,

    /// Verification level tag is neither Partial nor Full
    InvalidVerificationTag,
};

/// Convert error to string
const char* DecodeErrorToString(DecodeError err);

/**
 * Result of decoding a record or account.
 */
struct DecodeResult {
    DecodeError error{DecodeError::OK};
    PriceUpdateRecord record;

    /// Bytes consumed by the record (header included for accounts)
    size_t bytesRead{0};

    static DecodeResult Success(const PriceUpdateRecord& r, size_t n) {
        DecodeResult result;
        result.record = r;
        result.bytesRead = n;
        return result;
    }

    static DecodeResult Failure(DecodeError err) {
        DecodeResult result;
        result.error = err;
        return result;
    }

    bool IsValid() const { return error == DecodeError::OK; }
};

// ============================================================================
// Serialize/Unserialize
// ============================================================================

template<typename Stream>
void Serialize(Stream& s, const VerificationLevel& level) {
    WriteLE(s, static_cast<uint8_t>(level.GetKind()));
    if (level.IsPartial()) {
        WriteLE(s, level.NumSignatures());
    }
}

/// Throws std::invalid_argument on an unknown tag
template<typename Stream>
void Unserialize(Stream& s, VerificationLevel& level) {
    uint8_t tag = ReadLE<uint8_t>(s);
    switch (tag) {
        case static_cast<uint8_t>(VerificationLevel::Kind::Partial):
            level = VerificationLevel::Partial(ReadLE<uint8_t>(s));
            return;
        case static_cast<uint8_t>(VerificationLevel::Kind::Full):
            level = VerificationLevel::Full();
            return;
        default:
            throw std::invalid_argument(
                "Invalid verification level tag: " + std::to_string(tag));
    }
}

template<typename Stream>
void Serialize(Stream& s, const PriceFeedMessage& msg) {
    Serialize(s, msg.feedId);
    Serialize(s, msg.price);
    Serialize(s, msg.conf);
    Serialize(s, msg.exponent);
    Serialize(s, msg.publishTime);
    Serialize(s, msg.prevPublishTime);
    Serialize(s, msg.emaPrice);
    Serialize(s, msg.emaConf);
}

template<typename Stream>
void Unserialize(Stream& s, PriceFeedMessage& msg) {
    Unserialize(s, msg.feedId);
    Unserialize(s, msg.price);
    Unserialize(s, msg.conf);
    Unserialize(s, msg.exponent);
    Unserialize(s, msg.publishTime);
    Unserialize(s, msg.prevPublishTime);
    Unserialize(s, msg.emaPrice);
    Unserialize(s, msg.emaConf);
}

template<typename Stream>
void Serialize(Stream& s, const PriceUpdateRecord& record) {
    Serialize(s, record.writeAuthority);
    Serialize(s, record.verificationLevel);
    Serialize(s, record.priceMessage);
    Serialize(s, record.postedSlot);
}

template<typename Stream>
void Unserialize(Stream& s, PriceUpdateRecord& record) {
    Unserialize(s, record.writeAuthority);
    Unserialize(s, record.verificationLevel);
    Unserialize(s, record.priceMessage);
    Unserialize(s, record.postedSlot);
}

// ============================================================================
// Record / Account Codec
// ============================================================================

/// Encode a record without the account header
std::vector<Byte> EncodePriceUpdateRecord(const PriceUpdateRecord& record);

/// Decode a record without the account header. Trailing bytes are ignored.
DecodeResult DecodePriceUpdateRecord(const Byte* data, size_t len);

/// Encode discriminator + record, zero-padded to PRICE_UPDATE_ACCOUNT_LEN
std::vector<Byte> EncodePriceUpdateAccount(const PriceUpdateRecord& record);

/**
 * Decode a full price update account.
 *
 * @param data Account data
 * @param len Account data length
 * @param checkDiscriminator If false, the header is skipped unchecked
 * @return Decoded record or the reason decoding failed
 */
DecodeResult DecodePriceUpdateAccount(const Byte* data, size_t len,
                                      bool checkDiscriminator = true);

inline DecodeResult DecodePriceUpdateAccount(const std::vector<Byte>& data,
                                             bool checkDiscriminator = true) {
    return DecodePriceUpdateAccount(data.data(), data.size(), checkDiscriminator);
}

} // namespace receiver
} // namespace pricegate

#endif // PRICEGATE_RECEIVER_ACCOUNT_H
