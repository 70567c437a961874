// SECPCORE - Command Line Application
// Copyright (c) 2024 SECPCORE Developers
// MIT License
//
// The secpcore-cli tool exercises the field and curve arithmetic from the
// command line: validating elements and points, lifting x coordinates and
// computing scalar multiples of the generator.

#ifndef SECPCORE_CLI_APP_H
#define SECPCORE_CLI_APP_H

#include <iosfwd>

namespace secpcore {
namespace cli {

constexpr const char* VERSION = "0.1.0";
constexpr const char* CLIENT_NAME = "SECPCORE CLI";

/// Exit codes returned by Run
enum ExitCode : int {
    EXIT_OK = 0,
    /// Bad usage, unparsable number or unusable option
    EXIT_USAGE = 1,
    /// Field or curve operation failed (EcException)
    EXIT_EC_ERROR = 2,
};

/**
 * Parse argv, run one command and write its result to out.
 * Diagnostics go to err.
 */
int Run(int argc, const char* const argv[], std::ostream& out, std::ostream& err);

} // namespace cli
} // namespace secpcore

#endif // SECPCORE_CLI_APP_H
