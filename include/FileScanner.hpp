#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <unordered_set>
#include <vector>

struct CandidateFile
{
    std::string Path;
    std::filesystem::file_time_type MTime{};
};

enum class ScanStatus
{
    Ok,
    ConfigurationError,
    PermissionError,
    UnexpectedError,
    Cancelled
};

struct ScanStats
{
    uint64_t KeyspacesScanned = 0;
    uint64_t KeyspacesExcluded = 0;
    uint64_t TablesScanned = 0;
    uint64_t CandidatesSeen = 0;
    uint64_t CandidatesSkipped = 0;
    uint64_t DirectoriesSkipped = 0;
};

struct ScanOutcome
{
    ScanStatus Status = ScanStatus::Ok;
    std::optional<CandidateFile> Oldest;
    std::string ErrorMessage;
    std::string ErrorPath;
    ScanStats Stats;
};

// One directory child as seen at listing time. Type flags follow symlinks,
// except IsSymlink which describes the entry itself.
struct DirectoryEntryInfo
{
    std::filesystem::path Path;
    std::string Name;
    bool IsDirectory = false;
    bool IsRegularFile = false;
    bool IsSymlink = false;
};

const char* ScanStatusToString(ScanStatus Status);

/*
 * Walks <root>/<keyspace>/<table>/... and reports the target file with the
 * oldest modification time. Keyspaces listed in the excludes are skipped
 * together with their subtrees. Entries are visited in byte-wise name order,
 * so ties on modification time resolve to the first file in that order.
 */
class FileScanner
{
public:
    FileScanner() = default;
    virtual ~FileScanner() = default;

    void SetExcludes(const std::vector<std::string>& ExcludedKeyspaces);
    void SetTargetFileName(const std::string& FileName);
    void SetCancelFlag(const std::atomic<bool>* Flag);

    ScanOutcome FindOldest(const std::string& RootPath);
    ScanOutcome FindOldest(const std::string& RootPath, const std::vector<std::string>& ExcludedKeyspaces);

protected:
    // Throws std::filesystem::filesystem_error when the directory cannot be listed.
    virtual std::vector<DirectoryEntryInfo> ListDirectory(const std::filesystem::path& Dir);

    virtual std::filesystem::file_status ReadStatus(const std::filesystem::path& Path, std::error_code& Ec);

    virtual bool ReadModificationTime(const std::filesystem::path& File, std::filesystem::file_time_type& MTime, std::error_code& Ec);

private:
    struct ScanState
    {
        std::optional<CandidateFile> Oldest;
        ScanStats Stats;
    };

    std::unordered_set<std::string> Excludes;
    std::string TargetFileName = "Data.db";
    const std::atomic<bool>* CancelFlag = nullptr;

    void ScanKeyspace(const std::filesystem::path& KeyspaceDir, ScanState& State);
    void ScanTable(const std::filesystem::path& TableDir, ScanState& State);
    void ConsiderCandidate(const std::filesystem::path& File, ScanState& State);

    void CheckCancelled() const;
    bool IsExcluded(const std::string& Name) const;
};
