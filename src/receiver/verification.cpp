// PRICEGATE - Guardian Verification Level Implementation
// Copyright (c) 2024 PRICEGATE Developers
// MIT License

#include "pricegate/receiver/verification.h"

#include <algorithm>
#include <cctype>

namespace pricegate {
namespace receiver {

bool VerificationLevel::Gte(const VerificationLevel& other) const {
    switch (kind_) {
        case Kind::Full:
            return true;
        case Kind::Partial:
            switch (other.kind_) {
                case Kind::Full:
                    return false;
                case Kind::Partial:
                    return numSignatures_ >= other.numSignatures_;
            }
    }
    // Unreachable for well-formed values
    return false;
}

std::string VerificationLevel::ToString() const {
    switch (kind_) {
        case Kind::Full:
            return "Full";
        case Kind::Partial:
            return "Partial(" + std::to_string(numSignatures_) + ")";
    }
    return "Unknown";
}

std::optional<VerificationLevel> VerificationLevel::FromString(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    if (lower == "full") {
        return Full();
    }

    const std::string prefix = "partial:";
    if (lower.compare(0, prefix.size(), prefix) != 0) {
        return std::nullopt;
    }

    std::string count = lower.substr(prefix.size());
    if (count.empty() || count.size() > 3) {
        return std::nullopt;
    }
    for (char c : count) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
    }

    int value = std::stoi(count);
    if (value > 255) {
        return std::nullopt;
    }
    return Partial(static_cast<uint8_t>(value));
}

} // namespace receiver
} // namespace pricegate
