#pragma once

#include <string>
#include <vector>

class ConfigParser
{
public:
    ConfigParser() = default;
    bool Parse(const std::string& FilePath);

    const std::vector<std::string>& GetErrors() const;
    const std::vector<std::string>& GetInfos() const;
    const std::vector<std::string>& GetExcludes() const;
    void Reset();

    static bool IsAbsolutePath(const std::string& Path);
    static bool IsPlainName(const std::string& Name);

private:
    void AddError(const std::string& Message);
    void AddInfo(const std::string& Message);

    bool ParseYesNo(const std::string& Value, int LineNumber, bool& Out);

    std::vector<std::string> Excludes;
    std::vector<std::string> Errors;
    std::vector<std::string> Infos;

    bool DataDirSeen = false;
    bool IncludeSystemKeyspaces = false;
};
