#include "Logger.hpp"
#include "ConfigGlobal.hpp"
#include "TimeUtils.hpp"
#include <chrono>
#include <filesystem>
#include <iostream>
#include <vector>
#include <algorithm>

Logger Log;
namespace FS = std::filesystem;

static const std::string LogFilePrefix = "Scan_Log";

bool Logger::Init(const std::string& LogDir)
{
    std::error_code Ec;
    if (!FS::exists(LogDir, Ec))
    {
        FS::create_directories(LogDir, Ec);
        if (Ec)
        {
            std::cerr << "Logger: Failed to create log directory: " << LogDir << " (" << Ec.message() << ")\n";
            return false;
        }
    }

    LogDirectory = LogDir;
    CurrentLogFilePath = (FS::path(LogDir) / (LogFilePrefix + GetTimestampForFilename() + ".txt")).string();

    OpenLogFile(CurrentLogFilePath);
    if (!LogFile.is_open())
    {
        return false;
    }

    Info("Scan Started at " + GetTimestamp());
    return true;
}

Logger::~Logger()
{
    if (LogFile.is_open())
    {
        Info("Scan Finished at " + GetTimestamp());
        LogFile.close();
    }
}

bool Logger::IsOpen() const
{
    return LogFile.is_open();
}

void Logger::OpenLogFile(const std::string& FilePath)
{
    LogFile.open(FilePath, std::ios::out);

    if (!LogFile.is_open())
    {
        std::cerr << "Logger: Failed to open log file: " << FilePath << "\n";
    }
}

// Keeps the newest MaxLogFiles run logs; file names sort chronologically.
void Logger::CleanupOldLogs()
{
    if (LogDirectory.empty())
    {
        return;
    }

    std::vector<FS::path> Logs;
    std::error_code Ec;

    for (FS::directory_iterator It(LogDirectory, Ec), End; !Ec && It != End; It.increment(Ec))
    {
        std::error_code TypeEc;
        if (It->is_regular_file(TypeEc) && It->path().filename().string().find(LogFilePrefix) == 0)
        {
            Logs.push_back(It->path());
        }
    }
    if (Ec)
    {
        Warn("Could not list log directory for cleanup: " + Ec.message());
        return;
    }

    if (Logs.size() <= ConfigGlobal::MaxLogFiles)
    {
        return;
    }

    std::sort(Logs.begin(), Logs.end(), [](const FS::path& A, const FS::path& B)
    {
            return A.filename().string() < B.filename().string();
    });

    const std::size_t Excess = Logs.size() - ConfigGlobal::MaxLogFiles;
    for (std::size_t Index = 0; Index < Excess; ++Index)
    {
        std::error_code RemoveEc;
        FS::remove(Logs[Index], RemoveEc);
        if (RemoveEc)
        {
            Warn("Could not remove old log " + Logs[Index].string() + ": " + RemoveEc.message());
        }
    }
}

void Logger::Log(LogLevel Level, const std::string& Message)
{
    std::lock_guard<std::mutex> Lock(LogWriteMutex);

    if (!LogFile.is_open())
    {
        return;
    }

    LogFile << "[" << GetTimestamp() << "]" << " [" << LevelToString(Level) << "] " << Message << "\n";
    LogFile.flush();
}

void Logger::Info(const std::string& Message)
{
    Log(LogLevel::INFO, Message);
}

void Logger::Warn(const std::string& Message)
{
    Log(LogLevel::WARN, Message);
}

void Logger::Error(const std::string& Message)
{
    Log(LogLevel::ERROR, Message);
}

std::string Logger::GetTimestampForFilename()
{
    return FormatLocalTime(std::chrono::system_clock::now(), "%Y%m%d_%H%M%S");
}

std::string Logger::GetTimestamp() const
{
    return FormatLocalTime(std::chrono::system_clock::now(), "%Y-%m-%d %H:%M:%S"); // human-readable timestamp for logs
}

std::string Logger::LevelToString(LogLevel Level) const
{
    switch (Level)
    {
    case LogLevel::INFO:  return "INFO";
    case LogLevel::WARN:  return "WARN";
    case LogLevel::ERROR: return "ERROR";
    default:              return "UNKNOWN";
    }
}
