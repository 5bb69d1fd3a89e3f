#include <algorithm>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include "ControlFlow.hpp"
#include "Logger.hpp"
#include "ConfigGlobal.hpp"
#include "ScanReport.hpp"

ControlFlow::ControlFlow(std::ostream& OutStream, std::ostream& ErrStream) : Out(&OutStream), Err(&ErrStream)
{
}

void ControlFlow::SetCancelFlag(const std::atomic<bool>* Flag)
{
    Scanner.SetCancelFlag(Flag);
}

int ControlFlow::Run(const CommandLineOverrides& Overrides)
{
    if (!LoadConfiguration(Overrides))
    {
        for (const auto& Error : Parser.GetErrors())
        {
            *Err << "Config Error: " << Error << "\n";
        }
        *Err << "Check Errors and Fix Them, Exiting Scan\n";
        return ScanReport::ExitConfigurationError;
    }

    if (ConfigGlobal::EnableFileLog && Log.Init(ConfigGlobal::LogDir))
    {
        Log.CleanupOldLogs();
    }
    LogSettings();

    for (const auto& Info : Parser.GetInfos())
    {
        Log.Info(Info);
    }

    Scanner.SetExcludes(ConfigGlobal::ExcludedKeyspaces);
    Scanner.SetTargetFileName(ConfigGlobal::TargetFileName);

    // The scanner reports a missing or unusable root itself; the banner is
    // only shown for a root that is a directory.
    std::error_code Ec;
    if (std::filesystem::is_directory(ConfigGlobal::DataDir, Ec))
    {
        *Out << "Scanning for the oldest " << ConfigGlobal::TargetFileName << " file under: " << ConfigGlobal::DataDir << "\n\n";
    }

    const ScanOutcome Outcome = Scanner.FindOldest(ConfigGlobal::DataDir);
    if (Outcome.Status != ScanStatus::Ok)
    {
        Log.Error(std::string("Scan ended with status ") + ScanStatusToString(Outcome.Status) +
                  (Outcome.ErrorMessage.empty() ? "" : ": " + Outcome.ErrorMessage));
    }

    const int ExitCode = ScanReport::Print(Outcome, ConfigGlobal::DataDir, ConfigGlobal::TargetFileName,
                                         ConfigGlobal::ExcludedKeyspaces, *Out);

    if (Log.IsOpen())
    {
        *Out << "\nLogs Saved to : " << Log.CurrentLogFilePath << "\n";
    }
    return ExitCode;
}

bool ControlFlow::LoadConfiguration(const CommandLineOverrides& Overrides)
{
    if (!ConfigGlobal::ConfigFile.empty() && !Parser.Parse(ConfigGlobal::ConfigFile))
    {
        return false;
    }
    return ApplyOverrides(Overrides);
}

bool ControlFlow::ApplyOverrides(const CommandLineOverrides& Overrides)
{
    std::vector<std::string> Errors;

    if (Overrides.DataDir)
    {
        if (Overrides.DataDir->empty())
        {
            Errors.push_back("Data directory argument must not be empty.");
        }
        ConfigGlobal::DataDir = *Overrides.DataDir;
    }

    if (Overrides.TargetFileName)
    {
        if (!ConfigParser::IsPlainName(*Overrides.TargetFileName))
        {
            Errors.push_back("--target must be a plain file name: '" + *Overrides.TargetFileName + "'");
        }
        ConfigGlobal::TargetFileName = *Overrides.TargetFileName;
    }

    if (Overrides.LogDir)
    {
        ConfigGlobal::LogDir = *Overrides.LogDir;
    }

    if (Overrides.DisableFileLog)
    {
        ConfigGlobal::EnableFileLog = false;
    }

    auto& Excluded = ConfigGlobal::ExcludedKeyspaces;
    if (Overrides.IncludeSystemKeyspaces)
    {
        const auto& System = ConfigGlobal::SystemKeyspaces;
        Excluded.erase(std::remove_if(Excluded.begin(), Excluded.end(), [&System](const std::string& Name)
        {
            return std::find(System.begin(), System.end(), Name) != System.end();
        }), Excluded.end());
    }

    for (const auto& Name : Overrides.ExtraExcludes)
    {
        if (!ConfigParser::IsPlainName(Name))
        {
            Errors.push_back("--exclude must be a single directory name: '" + Name + "'");
            continue;
        }
        if (std::find(Excluded.begin(), Excluded.end(), Name) == Excluded.end())
        {
            Excluded.push_back(Name);
        }
    }

    for (const auto& Error : Errors)
    {
        *Err << "Argument Error: " << Error << "\n";
    }
    return Errors.empty();
}

void ControlFlow::LogSettings()
{
    Log.Info("Data Directory:");
    Log.Info("  " + ConfigGlobal::DataDir);

    Log.Info("Target File Name:");
    Log.Info("  " + ConfigGlobal::TargetFileName);

    if (!ConfigGlobal::ExcludedKeyspaces.empty())
    {
        Log.Info("Excluded Keyspaces:");
        for (const auto& Exclude : ConfigGlobal::ExcludedKeyspaces)
        {
            Log.Info("  " + Exclude);
        }
    }
}
