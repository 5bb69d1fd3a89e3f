#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "FileScanner.hpp"

namespace ScanReport
{
    constexpr int ExitOk = 0;
    constexpr int ExitConfigurationError = 1;
    constexpr int ExitPermissionError = 2;
    constexpr int ExitUnexpectedError = 3;
    constexpr int ExitCancelled = 130;

    int ExitCodeFor(ScanStatus Status);

    // Describes the keyspaces a scan skipped, e.g. " (excluding system keyspaces)".
    // Empty when nothing was excluded.
    std::string ExclusionSuffix(const std::vector<std::string>& ExcludedKeyspaces);

    // Writes the operator-facing summary of a finished scan and returns the process exit code.
    int Print(const ScanOutcome& Outcome, const std::string& RootPath, const std::string& TargetFileName,
              const std::vector<std::string>& ExcludedKeyspaces, std::ostream& Out);
}
