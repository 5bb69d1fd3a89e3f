#include "ConfigGlobal.hpp"

namespace ConfigGlobal
{
    std::string DataDir;
    std::string TargetFileName;
    std::vector<std::string> ExcludedKeyspaces;
    std::string ConfigFile;
    std::string LogDir;
    bool EnableFileLog;

    unsigned short int MaxLogFiles;

    const std::vector<std::string> SystemKeyspaces =
    {
        "system",
        "system_schema",
        "system_auth",
        "system_distributed",
        "system_traces",
        "system_views"
    };

    void InitializeDefaults()
    {
        DataDir = "/mnt/cassandra";
        TargetFileName = "Data.db";
        ExcludedKeyspaces = SystemKeyspaces;
        ConfigFile.clear(); //Empty means no config file, settings come from defaults and command line only
        LogDir = "Scan_Logs"; //Relative to working directory unless absolute, never place it under DataDir
        EnableFileLog = true;
        MaxLogFiles = 10;
    }
}
