#pragma once

#include <string>
#include <vector>

namespace ConfigGlobal
{
    extern std::string DataDir;
    extern std::string TargetFileName;
    extern std::vector<std::string> ExcludedKeyspaces;
    extern std::string ConfigFile;
    extern std::string LogDir;
    extern bool EnableFileLog;

    extern unsigned short int MaxLogFiles;

    extern const std::vector<std::string> SystemKeyspaces;

    void InitializeDefaults();
}
