#include <fstream>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <string>

#include "ConfigParser.hpp"
#include "ConfigGlobal.hpp"

namespace FS = std::filesystem;

const std::vector<std::string>& ConfigParser::GetExcludes() const
{
    return Excludes;
}

const std::vector<std::string>& ConfigParser::GetErrors() const
{
    return Errors;
}

const std::vector<std::string>& ConfigParser::GetInfos() const
{
    return Infos;
}

void ConfigParser::Reset()
{
    Excludes.clear();
    Errors.clear();
    Infos.clear();
    DataDirSeen = false;
    IncludeSystemKeyspaces = false;

    ConfigGlobal::InitializeDefaults();
}

void ConfigParser::AddError(const std::string& Message)
{
    Errors.push_back(Message);
}

void ConfigParser::AddInfo(const std::string& Message)
{
    Infos.push_back(Message);
}

bool ConfigParser::IsAbsolutePath(const std::string& Path)
{
#ifdef _WIN32
    if (Path.size() >= 3 && std::isalpha(static_cast<unsigned char>(Path[0])) && Path[1] == ':' && (Path[2] == '\\' || Path[2] == '/'))
    {
        return true;
    }

    if (Path.size() >= 2 && Path[0] == '\\' && Path[1] == '\\')
    {
        return true;
    }
    return false;
#else
    return !Path.empty() && Path[0] == '/';
#endif
}

// A single path component: no separators, not a relative marker.
bool ConfigParser::IsPlainName(const std::string& Name)
{
    if (Name.empty() || Name == "." || Name == "..")
    {
        return false;
    }
    return Name.find('/') == std::string::npos && Name.find('\\') == std::string::npos;
}

bool ConfigParser::ParseYesNo(const std::string& Value, int LineNumber, bool& Out)
{
    if (Value == "YES")
    {
        Out = true;
        return true;
    }
    if (Value == "NO")
    {
        Out = false;
        return true;
    }
    AddError("Line " + std::to_string(LineNumber) + ": Invalid Input. Use 'YES' or 'NO'.");
    return false;
}

bool ConfigParser::Parse(const std::string& FilePath)
{
    std::error_code Ec;
    if (!FS::exists(FilePath, Ec))
    {
        AddError("Config file does not exist: " + FilePath);
        return false;
    }

    std::ifstream File(FilePath);
    if (!File.is_open())
    {
        AddError("Failed to open config file: " + FilePath);
        return false;
    }

    std::string Line;
    int LineNumber = 0;

    while (std::getline(File, Line))
    {
        LineNumber++;

        // Trim leading whitespace
        Line.erase(Line.begin(), std::find_if(Line.begin(), Line.end(),[](char Ch) { return !std::isspace(static_cast<unsigned char>(Ch)); }));
        // Trim trailing whitespace
        Line.erase(std::find_if(Line.rbegin(), Line.rend(),[](char Ch) { return !std::isspace(static_cast<unsigned char>(Ch)); }).base(), Line.end());

        if (Line.empty() || Line[0] == '#')
        {
            continue;
        }

        std::string::size_type EqualPos = Line.find('=');
        if (EqualPos == std::string::npos)
        {
            AddError("Invalid format on line " + std::to_string(LineNumber) + ": No '=' found.");
            continue;
        }

        std::string Key = Line.substr(0, EqualPos);
        std::string Value = Line.substr(EqualPos + 1);

        Key.erase(std::remove_if(Key.begin(), Key.end(),[](char Ch) { return std::isspace(static_cast<unsigned char>(Ch)); }), Key.end());
        Value.erase(Value.begin(), std::find_if(Value.begin(), Value.end(),[](char Ch) { return !std::isspace(static_cast<unsigned char>(Ch)); }));
        Value.erase(std::find_if(Value.rbegin(), Value.rend(),[](char Ch) { return !std::isspace(static_cast<unsigned char>(Ch)); }).base(), Value.end());

        if (Key == "DataDir")
        {
            if (!IsAbsolutePath(Value))
            {
                AddError("Line " + std::to_string(LineNumber) + ": DataDir path is not absolute.");
                continue;
            }
            if (DataDirSeen)
            {
                AddError("Line " + std::to_string(LineNumber) + ": Multiple DataDir entries found.");
                continue;
            }
            DataDirSeen = true;
            ConfigGlobal::DataDir = Value;
            AddInfo("DataDir set to " + Value);
        }

        else if (Key == "ExcludeKeyspace")
        {
            if (!IsPlainName(Value))
            {
                AddError("Line " + std::to_string(LineNumber) + ": ExcludeKeyspace must be a single directory name.");
                continue;
            }
            if (std::find(Excludes.begin(), Excludes.end(), Value) != Excludes.end())
            {
                AddInfo("Line " + std::to_string(LineNumber) + ": Duplicate excluded keyspace '" + Value + "'. Ignored.");
                continue;
            }
            Excludes.push_back(Value);
        }

        else if (Key == "IncludeSystemKeyspaces")
        {
            bool Flag = false;
            if (ParseYesNo(Value, LineNumber, Flag))
            {
                IncludeSystemKeyspaces = Flag;
                AddInfo(Flag ? "System keyspaces will be scanned." : "System keyspaces will be skipped.");
            }
        }

        else if (Key == "TargetFile")
        {
            if (!IsPlainName(Value))
            {
                AddError("Line " + std::to_string(LineNumber) + ": TargetFile must be a plain file name.");
                continue;
            }
            ConfigGlobal::TargetFileName = Value;
            AddInfo("TargetFile set to " + Value);
        }

        else if (Key == "LogDir")
        {
            if (Value.empty())
            {
                AddError("Line " + std::to_string(LineNumber) + ": LogDir must not be empty.");
                continue;
            }
            ConfigGlobal::LogDir = Value;
        }

        else if (Key == "EnableFileLog")
        {
            bool Flag = true;
            if (ParseYesNo(Value, LineNumber, Flag))
            {
                ConfigGlobal::EnableFileLog = Flag;
            }
        }

        else if (Key == "MaxLogFiles")
        {
            try
            {
                std::size_t Consumed = 0;
                int ValueNum = std::stoi(Value, &Consumed);
                if (Consumed != Value.size() || ValueNum <= 0 || ValueNum > 65535)
                {
                    AddError("Line " + std::to_string(LineNumber) + ": Invalid number for MaxLogFiles. Select between 1 and 65,535");
                    continue;
                }
                ConfigGlobal::MaxLogFiles = static_cast<unsigned short int>(ValueNum);
                AddInfo("MaxLogFiles set to " + std::to_string(ValueNum));
            }
            catch (const std::exception&)
            {
                AddError("Line " + std::to_string(LineNumber) + ": Invalid number for MaxLogFiles. Select between 1 and 65,535");
            }
        }

        else
        {
            AddError("Line " + std::to_string(LineNumber) + ": Unknown key '" + Key + "'.");
            continue;
        }
    }

    std::vector<std::string> Merged;
    if (!IncludeSystemKeyspaces)
    {
        Merged = ConfigGlobal::SystemKeyspaces;
    }
    for (const auto& Exclude : Excludes)
    {
        if (std::find(Merged.begin(), Merged.end(), Exclude) == Merged.end())
        {
            Merged.push_back(Exclude);
        }
    }
    ConfigGlobal::ExcludedKeyspaces = std::move(Merged);

    return Errors.empty();  // Return false only if fatal errors present
}
