#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <argparse/argparse.hpp>

#include "ControlFlow.hpp"
#include "ConfigGlobal.hpp"
#include "Logger.hpp"
#include "ScanReport.hpp"
#include "SignalHandler.hpp"

int main(int argc, char* argv[])
{
    ConfigGlobal::InitializeDefaults();

    argparse::ArgumentParser Program("OldestSSTable", "1.0");
    Program.add_description("Find the SSTable data file with the oldest modification time "
                            "across all non-system keyspaces of a Cassandra data directory.");

    Program.add_argument("data_dir")
        .help("Cassandra data directory to scan (default: " + ConfigGlobal::DataDir + ")")
        .nargs(argparse::nargs_pattern::optional);

    Program.add_argument("--config")
        .help("read settings from a Key = Value config file")
        .metavar("FILE");

    Program.add_argument("--exclude")
        .help("additional keyspace to skip, may be repeated")
        .metavar("NAME")
        .append();

    Program.add_argument("--include-system-keyspaces")
        .help("scan the system keyspaces as well")
        .default_value(false)
        .implicit_value(true);

    Program.add_argument("--target")
        .help("data file name to look for (default: " + ConfigGlobal::TargetFileName + ")")
        .metavar("NAME");

    Program.add_argument("--log-dir")
        .help("directory for run logs (default: " + ConfigGlobal::LogDir + ")")
        .metavar("DIR");

    Program.add_argument("--no-log-file")
        .help("do not write a run log")
        .default_value(false)
        .implicit_value(true);

    try
    {
        Program.parse_args(argc, argv);
    }
    catch (const std::runtime_error& e)
    {
        std::cerr << e.what() << "\n";
        std::cerr << Program;
        return ScanReport::ExitConfigurationError;
    }

    CommandLineOverrides Overrides;
    Overrides.DataDir = Program.present("data_dir");
    Overrides.TargetFileName = Program.present("--target");
    Overrides.LogDir = Program.present("--log-dir");
    if (auto Excludes = Program.present<std::vector<std::string>>("--exclude"))
    {
        Overrides.ExtraExcludes = std::move(*Excludes);
    }
    Overrides.IncludeSystemKeyspaces = Program.get<bool>("--include-system-keyspaces");
    Overrides.DisableFileLog = Program.get<bool>("--no-log-file");

    if (auto ConfigPath = Program.present("--config"))
    {
        ConfigGlobal::ConfigFile = *ConfigPath;
    }

    SignalHandler::Init();

    ControlFlow Flow;
    Flow.SetCancelFlag(&SignalHandler::StopFlag());
    const int ExitCode = Flow.Run(Overrides);

    if (const char* Reason = SignalHandler::Reason())
    {
        Log.Warn(std::string("Stopped by ") + Reason);
    }
    return ExitCode;
}
