// PRICEGATE - Price Check Command
// Copyright (c) 2024 PRICEGATE Developers
// MIT License
//
// Command behind pricegate-check: decode a price update account and print
// its price if it passes the configured policy.

#ifndef PRICEGATE_CLI_CHECK_H
#define PRICEGATE_CLI_CHECK_H

#include <ostream>

namespace pricegate {
namespace cli {

constexpr const char* VERSION = "0.1.0";
constexpr const char* CLIENT_NAME = "PRICEGATE Check";

// ============================================================================
// Exit Codes
// ============================================================================

constexpr int RESULT_ACCEPTED = 0;
constexpr int RESULT_REJECTED = 1;
constexpr int RESULT_USAGE_ERROR = 2;

/**
 * Run the check command.
 *
 * Options come from the command line and, with -conf, from a config file;
 * command-line values take priority. Usage text, the accepted price and
 * "rejected: <reason>" lines are written to out; diagnostics go through
 * the logger.
 *
 * @return RESULT_ACCEPTED, RESULT_REJECTED or RESULT_USAGE_ERROR
 */
int RunCheck(int argc, const char* const argv[], std::ostream& out);

} // namespace cli
} // namespace pricegate

#endif // PRICEGATE_CLI_CHECK_H
