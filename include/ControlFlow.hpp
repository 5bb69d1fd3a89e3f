#pragma once

#include <atomic>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "FileScanner.hpp"
#include "ConfigParser.hpp"
#include "ConfigGlobal.hpp"

// Settings given on the command line; they take precedence over the config file.
struct CommandLineOverrides
{
    std::optional<std::string> DataDir;
    std::optional<std::string> TargetFileName;
    std::optional<std::string> LogDir;
    std::vector<std::string> ExtraExcludes;
    bool IncludeSystemKeyspaces = false;
    bool DisableFileLog = false;
};

class ControlFlow
{
public:
    ControlFlow() = default;
    ControlFlow(std::ostream& OutStream, std::ostream& ErrStream);

    void SetCancelFlag(const std::atomic<bool>* Flag);

    int Run(const CommandLineOverrides& Overrides);

private:
    FileScanner Scanner;
    ConfigParser Parser;

    std::ostream* Out = &std::cout;
    std::ostream* Err = &std::cerr;

    bool LoadConfiguration(const CommandLineOverrides& Overrides);
    bool ApplyOverrides(const CommandLineOverrides& Overrides);
    void LogSettings();
};
