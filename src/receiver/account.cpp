// PRICEGATE - Price Update Account Codec Implementation
// Copyright (c) 2024 PRICEGATE Developers
// MIT License

#include "pricegate/receiver/account.h"
#include "pricegate/core/hex.h"
#include "pricegate/util/logging.h"

#include <openssl/evp.h>

#include <cstring>
#include <ios>

namespace pricegate {
namespace receiver {

// ============================================================================
// Discriminator
// ============================================================================

Discriminator ComputeAccountDiscriminator(const std::string& accountName) {
    std::string preimage = "account:" + accountName;

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLen = 0;
    if (EVP_Digest(preimage.data(), preimage.size(), digest, &digestLen,
                   EVP_sha256(), nullptr) != 1 ||
        digestLen < ACCOUNT_DISCRIMINATOR_SIZE) {
        throw std::runtime_error("SHA-256 digest failed");
    }

    Discriminator result;
    std::memcpy(result.data(), digest, ACCOUNT_DISCRIMINATOR_SIZE);
    return result;
}

const Discriminator& PriceUpdateDiscriminator() {
    static const Discriminator discriminator =
        ComputeAccountDiscriminator(PRICE_UPDATE_ACCOUNT_NAME);
    return discriminator;
}

// ============================================================================
// Decode Errors
// ============================================================================

const char* DecodeErrorToString(DecodeError err) {
    switch (err) {
        case DecodeError::OK: return "OK";
        case DecodeError::TooShort: return "Account data too short";
        case DecodeError::BadDiscriminator: return "Account discriminator mismatch";
        case DecodeError::InvalidVerificationTag: return "Invalid verification level tag";
        default: return "Unknown error";
    }
}

// ============================================================================
// Record Codec
// ============================================================================

std::vector<Byte> EncodePriceUpdateRecord(const PriceUpdateRecord& record) {
    DataStream stream;
    stream.reserve(GetSerializeSize(record));
    stream << record;
    return stream.Data();
}

DecodeResult DecodePriceUpdateRecord(const Byte* data, size_t len) {
    if (data == nullptr && len > 0) {
        return DecodeResult::Failure(DecodeError::TooShort);
    }

    DataStream stream(data, len);
    PriceUpdateRecord record;

    try {
        stream >> record;
    } catch (const std::invalid_argument& e) {
        LOG_DEBUG(util::LogCategory::RECEIVER) << "Record decode failed: " << e.what();
        return DecodeResult::Failure(DecodeError::InvalidVerificationTag);
    } catch (const std::ios_base::failure& e) {
        LOG_DEBUG(util::LogCategory::RECEIVER) << "Record decode failed: " << e.what()
                                               << " (" << len << " bytes)";
        return DecodeResult::Failure(DecodeError::TooShort);
    }

    return DecodeResult::Success(record, stream.ReadPosition());
}

// ============================================================================
// Account Codec
// ============================================================================

std::vector<Byte> EncodePriceUpdateAccount(const PriceUpdateRecord& record) {
    DataStream stream;
    stream.reserve(PRICE_UPDATE_ACCOUNT_LEN);
    stream << PriceUpdateDiscriminator();
    stream << record;
    if (stream.TotalSize() < PRICE_UPDATE_ACCOUNT_LEN) {
        stream.WriteZeros(PRICE_UPDATE_ACCOUNT_LEN - stream.TotalSize());
    }
    return stream.Data();
}

DecodeResult DecodePriceUpdateAccount(const Byte* data, size_t len,
                                      bool checkDiscriminator) {
    if (data == nullptr || len < ACCOUNT_DISCRIMINATOR_SIZE) {
        return DecodeResult::Failure(DecodeError::TooShort);
    }

    if (checkDiscriminator) {
        const Discriminator& expected = PriceUpdateDiscriminator();
        if (std::memcmp(data, expected.data(), ACCOUNT_DISCRIMINATOR_SIZE) != 0) {
            LOG_DEBUG(util::LogCategory::RECEIVER)
                << "Discriminator mismatch: got "
                << BytesToHex(data, ACCOUNT_DISCRIMINATOR_SIZE)
                << ", expected " << BytesToHex(expected);
            return DecodeResult::Failure(DecodeError::BadDiscriminator);
        }
    }

    DecodeResult result = DecodePriceUpdateRecord(
        data + ACCOUNT_DISCRIMINATOR_SIZE, len - ACCOUNT_DISCRIMINATOR_SIZE);
    if (result.IsValid()) {
        result.bytesRead += ACCOUNT_DISCRIMINATOR_SIZE;
    }
    return result;
}

} // namespace receiver
} // namespace pricegate
