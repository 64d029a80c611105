// PRICEGATE - Price Check Command Implementation
// Copyright (c) 2024 PRICEGATE Developers
// MIT License

#include "pricegate/cli/check.h"

#include "pricegate/core/hex.h"
#include "pricegate/receiver/account.h"
#include "pricegate/receiver/policy.h"
#include "pricegate/receiver/price_update.h"
#include "pricegate/util/config.h"
#include "pricegate/util/logging.h"
#include "pricegate/util/time.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace pricegate {
namespace cli {

namespace {

void PrintUsage(std::ostream& out) {
    out << CLIENT_NAME << " v" << VERSION << "\n\n"
        << "Usage: pricegate-check [options] <account-hex | @file>\n\n"
        << "Options:\n"
        << "  -feed=<hex>           Feed id (64 hex chars, optional 0x prefix)\n"
        << "  -maxage=<seconds>     Maximum price age (default "
        << receiver::DEFAULT_MAXIMUM_AGE << ")\n"
        << "  -level=<level>        full | partial:<n> (default full)\n"
        << "  -now=<unix-seconds>   Current time override\n"
        << "  -unchecked            Skip verification level and age checks\n"
        << "  -nodiscriminator      Do not check the account header\n"
        << "  -conf=<file>          Config file ([policy] section)\n"
        << "  -debug                Debug logging\n"
        << "  -help                 Show this help\n"
        << "  -version              Show version\n\n"
        << "Exit codes: 0 accepted, 1 rejected, 2 usage or input error\n";
}

std::string StripWhitespace(std::string str) {
    str.erase(std::remove_if(str.begin(), str.end(),
                             [](unsigned char c) { return std::isspace(c); }),
              str.end());
    return str;
}

/// Account hex from the argument, or from a file when prefixed with '@'
bool ReadAccountHex(const std::string& arg, std::string& hex) {
    if (arg.empty() || arg[0] != '@') {
        hex = StripWhitespace(arg);
        return true;
    }

    std::string path = arg.substr(1);
    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_ERROR(util::LogCategory::CLI) << "Cannot open account file: " << path;
        return false;
    }

    std::ostringstream content;
    content << file.rdbuf();
    hex = StripWhitespace(content.str());
    return true;
}

bool LoadConfig(int argc, const char* const argv[], util::ConfigManager& config) {
    util::ConfigParseResult result = config.ParseCommandLine(argc, argv);
    if (!result.success) {
        LOG_ERROR(util::LogCategory::CONFIG) << result.ToString();
        return false;
    }

    auto confPath = config.TryGetString(util::ConfigKeys::CONF);
    if (!confPath) {
        return true;
    }

    result = config.ParseFile(*confPath);
    if (!result.success) {
        LOG_ERROR(util::LogCategory::CONFIG) << result.ToString();
        return false;
    }

    // Command line wins over the file
    result = config.ParseCommandLine(argc, argv);
    if (!result.success) {
        LOG_ERROR(util::LogCategory::CONFIG) << result.ToString();
        return false;
    }
    return true;
}

void PrintPrice(const receiver::Price& price, std::ostream& out) {
    out << "price=" << price.price
        << " conf=" << price.conf
        << " exponent=" << price.exponent
        << " publish_time=" << price.publishTime
        << " (" << util::FormatISO8601(price.publishTime) << ")"
        << std::endl;
}

} // namespace

int RunCheck(int argc, const char* const argv[], std::ostream& out) {
    util::ConfigManager config;
    if (!LoadConfig(argc, argv, config)) {
        return RESULT_USAGE_ERROR;
    }

    if (config.GetBool("help", false) || config.GetBool("h", false)) {
        PrintUsage(out);
        return RESULT_ACCEPTED;
    }
    if (config.GetBool("version", false)) {
        out << CLIENT_NAME << " v" << VERSION << std::endl;
        return RESULT_ACCEPTED;
    }

    bool debug = config.GetBool(util::ConfigKeys::DEBUG, false) ||
                 config.GetBool(util::ConfigKeys::DEBUG, false, util::ConfigKeys::POLICY_SECTION);
    if (debug) {
        util::Logger::Instance().SetLevel(util::LogLevel::Debug);
    }

    const auto& args = config.GetPositionalArgs();
    if (args.size() != 1) {
        LOG_ERROR(util::LogCategory::CLI) << "Expected exactly one account argument";
        PrintUsage(out);
        return RESULT_USAGE_ERROR;
    }

    receiver::PolicyLoadResult loaded = receiver::LoadPricePolicy(config);
    if (!loaded.success) {
        LOG_ERROR(util::LogCategory::CONFIG) << loaded.errorMessage;
        return RESULT_USAGE_ERROR;
    }
    const receiver::PricePolicy& policy = loaded.policy;

    std::string hex;
    if (!ReadAccountHex(args[0], hex)) {
        return RESULT_USAGE_ERROR;
    }

    std::vector<Byte> data;
    try {
        data = HexToBytes(StripHexPrefix(hex));
    } catch (const std::invalid_argument& e) {
        LOG_ERROR(util::LogCategory::CLI) << "Account data is not valid hex: " << e.what();
        return RESULT_USAGE_ERROR;
    }

    receiver::DecodeResult decoded =
        receiver::DecodePriceUpdateAccount(data, policy.checkDiscriminator);
    if (!decoded.IsValid()) {
        LOG_ERROR(util::LogCategory::RECEIVER)
            << "Cannot decode account: " << receiver::DecodeErrorToString(decoded.error);
        return RESULT_USAGE_ERROR;
    }

    const receiver::PriceUpdateRecord& record = decoded.record;
    LOG_DEBUG(util::LogCategory::RECEIVER)
        << "Record: authority=" << record.writeAuthority.ToHex()
        << " level=" << record.verificationLevel.ToString()
        << " slot=" << record.postedSlot
        << " " << record.priceMessage.ToString();

    util::WallClock clock;
    receiver::GetPriceResult result = receiver::ApplyPricePolicy(record, policy, clock);
    if (!result.IsValid()) {
        out << "rejected: " << receiver::GetPriceErrorToString(result.error) << std::endl;
        return RESULT_REJECTED;
    }

    PrintPrice(result.price, out);
    return RESULT_ACCEPTED;
}

} // namespace cli
} // namespace pricegate
