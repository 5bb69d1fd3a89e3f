#include <gtest/gtest.h>

#include <chrono>
#include <cstdlib>
#include <ctime>
#include <sstream>
#include <string>
#include <vector>

#include "ConfigGlobal.hpp"
#include "ScanReport.hpp"

using namespace std::chrono;

namespace
{
    ScanOutcome WithStatus(ScanStatus Status, const std::string& Message = "")
    {
        ScanOutcome Outcome;
        Outcome.Status = Status;
        Outcome.ErrorMessage = Message;
        return Outcome;
    }

    const std::vector<std::string> NoExcludes;
}

TEST(ScanReport, PrintsOldestCandidate)
{
    setenv("TZ", "UTC", 1);
    tzset();

    ScanOutcome Outcome;
    Outcome.Oldest = CandidateFile{"/mnt/cassandra/shop/orders-5b1c/nb-1-big/Data.db",
                                   file_clock::from_sys(sys_seconds{sys_days{year{2022} / 7 / 1} + hours{8} + minutes{30}})};

    std::ostringstream Out;
    int Code = ScanReport::Print(Outcome, "/mnt/cassandra", "Data.db", NoExcludes, Out);

    EXPECT_EQ(Code, ScanReport::ExitOk);
    EXPECT_EQ(Out.str(),
              "--- Oldest SSTable Found Across All Keyspaces ---\n"
              "Path: /mnt/cassandra/shop/orders-5b1c/nb-1-big/Data.db\n"
              "Modification Time: 2022-07-01 08:30:00\n");

    unsetenv("TZ");
    tzset();
}

TEST(ScanReport, NoCandidateIsReportedExplicitly)
{
    std::ostringstream Out;
    int Code = ScanReport::Print(WithStatus(ScanStatus::Ok), "/data", "Data.db", ConfigGlobal::SystemKeyspaces, Out);

    EXPECT_EQ(Code, ScanReport::ExitOk);
    EXPECT_EQ(Out.str(), "No 'Data.db' files were found under '/data' (excluding system keyspaces).\n");
}

TEST(ScanReport, NoCandidateWithoutExcludesHasNoExclusionNote)
{
    std::ostringstream Out;
    int Code = ScanReport::Print(WithStatus(ScanStatus::Ok), "/data", "Data.db", NoExcludes, Out);

    EXPECT_EQ(Code, ScanReport::ExitOk);
    EXPECT_EQ(Out.str(), "No 'Data.db' files were found under '/data'.\n");
}

TEST(ScanReport, ExclusionSuffixNamesCustomExcludes)
{
    EXPECT_EQ(ScanReport::ExclusionSuffix({}), "");
    EXPECT_EQ(ScanReport::ExclusionSuffix({"audit", "scratch"}), " (excluding keyspaces: audit, scratch)");

    std::vector<std::string> Reordered(ConfigGlobal::SystemKeyspaces.rbegin(), ConfigGlobal::SystemKeyspaces.rend());
    EXPECT_EQ(ScanReport::ExclusionSuffix(Reordered), " (excluding system keyspaces)");

    std::vector<std::string> SystemAndMore = ConfigGlobal::SystemKeyspaces;
    SystemAndMore.push_back("audit");
    EXPECT_NE(ScanReport::ExclusionSuffix(SystemAndMore).find("audit"), std::string::npos);
}

TEST(ScanReport, MissingRootNamesThePath)
{
    std::ostringstream Out;
    int Code = ScanReport::Print(WithStatus(ScanStatus::ConfigurationError, "Data directory does not exist"), "/mnt/cassandra", "Data.db", NoExcludes, Out);

    EXPECT_EQ(Code, ScanReport::ExitConfigurationError);
    EXPECT_NE(Out.str().find("Error: Cassandra data directory not found at '/mnt/cassandra'"), std::string::npos);
}

TEST(ScanReport, PermissionErrorCarriesCause)
{
    std::ostringstream Out;
    int Code = ScanReport::Print(WithStatus(ScanStatus::PermissionError, "Permission denied: '/data/ks/t1'"), "/data", "Data.db", NoExcludes, Out);

    EXPECT_EQ(Code, ScanReport::ExitPermissionError);
    EXPECT_EQ(Out.str(),
              "Permission denied: Could not scan directory. Please run with appropriate permissions.\n"
              "Details: Permission denied: '/data/ks/t1'\n");
}

TEST(ScanReport, UnexpectedErrorCarriesCause)
{
    std::ostringstream Out;
    int Code = ScanReport::Print(WithStatus(ScanStatus::UnexpectedError, "Input/output error"), "/data", "Data.db", NoExcludes, Out);

    EXPECT_EQ(Code, ScanReport::ExitUnexpectedError);
    EXPECT_EQ(Out.str(), "An unexpected error occurred: Input/output error\n");
}

TEST(ScanReport, CancelledScan)
{
    std::ostringstream Out;
    int Code = ScanReport::Print(WithStatus(ScanStatus::Cancelled), "/data", "Data.db", NoExcludes, Out);

    EXPECT_EQ(Code, ScanReport::ExitCancelled);
    EXPECT_EQ(Out.str(), "Scan cancelled before completion.\n");
}
