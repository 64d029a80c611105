// PRICEGATE - Guardian Verification Level
// Copyright (c) 2024 PRICEGATE Developers
// MIT License
//
// Price updates are bridged from the source chain with signatures from a
// federation of guardians. Checking two thirds of the current guardian set
// is the normal requirement, but a receiver may have checked fewer when
// transaction size limits get in the way. VerificationLevel records how much
// of that checking was actually done for a stored price update.
//
// WARNING: accepting Partial updates lowers the number of guardians that
// would need to collude to forge a price.

#ifndef PRICEGATE_RECEIVER_VERIFICATION_H
#define PRICEGATE_RECEIVER_VERIFICATION_H

#include <cstdint>
#include <optional>
#include <string>

namespace pricegate {
namespace receiver {

/**
 * How much a price update has been verified.
 *
 * - Full: signatures from two thirds of the current guardian set were checked.
 * - Partial(n): exactly n guardian signatures were checked.
 *
 * Full dominates every Partial value. Partial values are ordered by their
 * signature count. Two Partial values with equal counts satisfy Gte in both
 * directions.
 */
class VerificationLevel {
public:
    /// Variant tag. The values are the on-chain encoding of the tag byte.
    enum class Kind : uint8_t {
        Partial = 0,
        Full = 1
    };

    /// Default is Partial(0), the weakest level
    VerificationLevel() = default;

    static VerificationLevel Partial(uint8_t numSignatures) {
        return VerificationLevel(Kind::Partial, numSignatures);
    }

    static VerificationLevel Full() {
        return VerificationLevel(Kind::Full, 0);
    }

    Kind GetKind() const { return kind_; }
    bool IsFull() const { return kind_ == Kind::Full; }
    bool IsPartial() const { return kind_ == Kind::Partial; }

    /// Signature count of a Partial level; 0 for Full
    uint8_t NumSignatures() const { return numSignatures_; }

    /**
     * Does this level meet or exceed the trust demanded by `other`?
     *
     * Full >= anything. Partial(n) >= Full is false.
     * Partial(n) >= Partial(m) iff n >= m.
     */
    bool Gte(const VerificationLevel& other) const;

    /// Structural equality (same variant, same count)
    bool operator==(const VerificationLevel& other) const {
        return kind_ == other.kind_ && numSignatures_ == other.numSignatures_;
    }

    bool operator!=(const VerificationLevel& other) const {
        return !(*this == other);
    }

    /// "Full" or "Partial(n)"
    std::string ToString() const;

    /// Parse "full" or "partial:<n>" (case-insensitive, n in 0..255)
    static std::optional<VerificationLevel> FromString(const std::string& str);

private:
    VerificationLevel(Kind kind, uint8_t numSignatures)
        : kind_(kind), numSignatures_(numSignatures) {}

    Kind kind_{Kind::Partial};
    uint8_t numSignatures_{0};
};

} // namespace receiver
} // namespace pricegate

#endif // PRICEGATE_RECEIVER_VERIFICATION_H
