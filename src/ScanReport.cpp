#include <algorithm>

#include "ScanReport.hpp"
#include "ConfigGlobal.hpp"
#include "TimeUtils.hpp"
#include "Logger.hpp"

namespace ScanReport
{
    int ExitCodeFor(ScanStatus Status)
    {
        switch (Status)
        {
        case ScanStatus::Ok:                 return ExitOk;
        case ScanStatus::ConfigurationError: return ExitConfigurationError;
        case ScanStatus::PermissionError:    return ExitPermissionError;
        case ScanStatus::Cancelled:          return ExitCancelled;
        case ScanStatus::UnexpectedError:
        default:                             return ExitUnexpectedError;
        }
    }

    std::string ExclusionSuffix(const std::vector<std::string>& ExcludedKeyspaces)
    {
        if (ExcludedKeyspaces.empty())
        {
            return "";
        }

        std::vector<std::string> Excluded = ExcludedKeyspaces;
        std::vector<std::string> System = ConfigGlobal::SystemKeyspaces;
        std::sort(Excluded.begin(), Excluded.end());
        std::sort(System.begin(), System.end());
        if (Excluded == System)
        {
            return " (excluding system keyspaces)";
        }

        std::string Suffix = " (excluding keyspaces: ";
        for (size_t i = 0; i < ExcludedKeyspaces.size(); i++)
        {
            if (i > 0)
            {
                Suffix += ", ";
            }
            Suffix += ExcludedKeyspaces[i];
        }
        return Suffix + ")";
    }

    int Print(const ScanOutcome& Outcome, const std::string& RootPath, const std::string& TargetFileName,
              const std::vector<std::string>& ExcludedKeyspaces, std::ostream& Out)
    {
        switch (Outcome.Status)
        {
        case ScanStatus::ConfigurationError:
            Out << "Error: Cassandra data directory not found at '" << RootPath << "'\n";
            Out << "Please ensure you are running this tool on the correct server.\n";
            break;

        case ScanStatus::PermissionError:
            Out << "Permission denied: Could not scan directory. Please run with appropriate permissions.\n";
            Out << "Details: " << Outcome.ErrorMessage << "\n";
            break;

        case ScanStatus::UnexpectedError:
            Out << "An unexpected error occurred: " << Outcome.ErrorMessage << "\n";
            break;

        case ScanStatus::Cancelled:
            Out << "Scan cancelled before completion.\n";
            break;

        case ScanStatus::Ok:
            if (Outcome.Oldest)
            {
                const std::string Readable = FormatFileTime(Outcome.Oldest->MTime);
                Out << "--- Oldest SSTable Found Across All Keyspaces ---\n";
                Out << "Path: " << Outcome.Oldest->Path << "\n";
                Out << "Modification Time: " << Readable << "\n";
                Log.Info("Oldest " + TargetFileName + ": " + Outcome.Oldest->Path + " (" + Readable + ")");
            }
            else
            {
                Out << "No '" << TargetFileName << "' files were found under '" << RootPath << "'" << ExclusionSuffix(ExcludedKeyspaces) << ".\n";
                Log.Info("No " + TargetFileName + " files found under " + RootPath);
            }
            break;
        }

        return ExitCodeFor(Outcome.Status);
    }
}
