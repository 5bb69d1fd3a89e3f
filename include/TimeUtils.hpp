#pragma once

#include <filesystem>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

inline std::chrono::system_clock::time_point ToSystemTime(std::filesystem::file_time_type FTime)
{
    using namespace std::chrono;
    return time_point_cast<system_clock::duration>(file_clock::to_sys(FTime));
}

//UNIX Time since Epoch, whole seconds rounded towards the past
inline std::time_t ToTimeT(std::filesystem::file_time_type FTime)
{
    using namespace std::chrono;
    return system_clock::to_time_t(std::chrono::floor<seconds>(ToSystemTime(FTime)));
}

inline std::string FormatLocalTime(std::chrono::system_clock::time_point Point, const char* Format)
{
    using namespace std::chrono;
    std::time_t Time = system_clock::to_time_t(std::chrono::floor<seconds>(Point));
    std::tm Local{};

#ifdef _WIN32
    localtime_s(&Local, &Time);
#else
    localtime_r(&Time, &Local);
#endif

    std::ostringstream Stream;
    Stream << std::put_time(&Local, Format);
    return Stream.str();
}

// YYYY-MM-DD HH:MM:SS in the local time zone
inline std::string FormatFileTime(std::filesystem::file_time_type FTime)
{
    return FormatLocalTime(ToSystemTime(FTime), "%Y-%m-%d %H:%M:%S");
}
