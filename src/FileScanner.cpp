#include <algorithm>
#include <filesystem>
#include <stack>
#include <stdexcept>

#include "FileScanner.hpp"
#include "TimeUtils.hpp"
#include "Logger.hpp"

namespace FS = std::filesystem;

namespace
{
    struct ScanCancelledError : std::runtime_error
    {
        ScanCancelledError() : std::runtime_error("scan cancelled") {}
    };

    bool IsPermissionFailure(const std::error_code& Ec)
    {
        return Ec == std::errc::permission_denied || Ec == std::errc::operation_not_permitted;
    }

    bool IsMissingFailure(const std::error_code& Ec)
    {
        return Ec == std::errc::no_such_file_or_directory || Ec == std::errc::not_a_directory;
    }

    std::string DescribeFilesystemError(const FS::filesystem_error& e)
    {
        std::string Message = e.code().message();
        if (!e.path1().empty())
        {
            Message += ": '" + e.path1().string() + "'";
        }
        return Message;
    }
}

const char* ScanStatusToString(ScanStatus Status)
{
    switch (Status)
    {
    case ScanStatus::Ok:                 return "Ok";
    case ScanStatus::ConfigurationError: return "ConfigurationError";
    case ScanStatus::PermissionError:    return "PermissionError";
    case ScanStatus::UnexpectedError:    return "UnexpectedError";
    case ScanStatus::Cancelled:          return "Cancelled";
    default:                             return "Unknown";
    }
}

void FileScanner::SetExcludes(const std::vector<std::string>& ExcludedKeyspaces)
{
    Excludes = std::unordered_set<std::string>(ExcludedKeyspaces.begin(), ExcludedKeyspaces.end());
}

void FileScanner::SetTargetFileName(const std::string& FileName)
{
    TargetFileName = FileName;
}

void FileScanner::SetCancelFlag(const std::atomic<bool>* Flag)
{
    CancelFlag = Flag;
}

bool FileScanner::IsExcluded(const std::string& Name) const
{
    return Excludes.find(Name) != Excludes.end();
}

void FileScanner::CheckCancelled() const
{
    if (CancelFlag != nullptr && CancelFlag->load(std::memory_order_relaxed))
    {
        throw ScanCancelledError();
    }
}

std::vector<DirectoryEntryInfo> FileScanner::ListDirectory(const FS::path& Dir)
{
    std::vector<DirectoryEntryInfo> Entries;

    for (const auto& Entry : FS::directory_iterator(Dir))
    {
        // Type lookups on an entry that vanished after listing report
        // neither a directory nor a file; the entry is then ignored.
        std::error_code Ec;
        DirectoryEntryInfo Info;
        Info.Path = Entry.path();
        Info.Name = Entry.path().filename().string();
        Info.IsSymlink = Entry.is_symlink(Ec);
        Info.IsDirectory = Entry.is_directory(Ec);
        Info.IsRegularFile = !Info.IsDirectory && Entry.is_regular_file(Ec);
        Entries.push_back(std::move(Info));
    }

    std::sort(Entries.begin(), Entries.end(), [](const DirectoryEntryInfo& A, const DirectoryEntryInfo& B)
    {
        return A.Name < B.Name;
    });
    return Entries;
}

FS::file_status FileScanner::ReadStatus(const FS::path& Path, std::error_code& Ec)
{
    return FS::status(Path, Ec);
}

bool FileScanner::ReadModificationTime(const FS::path& File, FS::file_time_type& MTime, std::error_code& Ec)
{
    MTime = FS::last_write_time(File, Ec);
    return !Ec;
}

ScanOutcome FileScanner::FindOldest(const std::string& RootPath, const std::vector<std::string>& ExcludedKeyspaces)
{
    SetExcludes(ExcludedKeyspaces);
    return FindOldest(RootPath);
}

ScanOutcome FileScanner::FindOldest(const std::string& RootPath)
{
    ScanOutcome Outcome;
    std::error_code Ec;

    FS::path Root = FS::absolute(FS::path(RootPath), Ec);
    if (Ec)
    {
        Root = FS::path(RootPath);
    }
    Root = Root.lexically_normal();
    if (!Root.has_filename() && Root != Root.root_path())
    {
        Root = Root.parent_path(); // drop trailing separator
    }

    FS::file_status RootStatus = ReadStatus(Root, Ec);
    if (Ec && !IsMissingFailure(Ec))
    {
        Outcome.Status = IsPermissionFailure(Ec) ? ScanStatus::PermissionError : ScanStatus::UnexpectedError;
        Outcome.ErrorMessage = Ec.message() + ": '" + Root.string() + "'";
        Outcome.ErrorPath = Root.string();
        Log.Error("Cannot inspect scan root " + Root.string() + ": " + Ec.message());
        return Outcome;
    }
    if (!FS::exists(RootStatus))
    {
        Outcome.Status = ScanStatus::ConfigurationError;
        Outcome.ErrorMessage = "Data directory does not exist";
        Outcome.ErrorPath = Root.string();
        Log.Error("Scan root does not exist: " + Root.string());
        return Outcome;
    }
    if (!FS::is_directory(RootStatus))
    {
        Outcome.Status = ScanStatus::ConfigurationError;
        Outcome.ErrorMessage = "Data directory is not a directory";
        Outcome.ErrorPath = Root.string();
        Log.Error("Scan root is not a directory: " + Root.string());
        return Outcome;
    }

    Log.Info("Scanning for the oldest " + TargetFileName + " under: " + Root.string());

    ScanState State;
    try
    {
        CheckCancelled();
        for (const auto& Entry : ListDirectory(Root))
        {
            if (!Entry.IsDirectory)
            {
                continue;
            }
            if (IsExcluded(Entry.Name))
            {
                State.Stats.KeyspacesExcluded++;
                Log.Info("Skipping excluded keyspace: " + Entry.Name);
                continue;
            }
            ScanKeyspace(Entry.Path, State);
        }
    }
    catch (const ScanCancelledError&)
    {
        Outcome.Status = ScanStatus::Cancelled;
        Outcome.ErrorMessage = "Scan cancelled before completion";
        Outcome.Stats = State.Stats;
        Log.Warn("Scan cancelled, partial result discarded.");
        return Outcome;
    }
    catch (const FS::filesystem_error& e)
    {
        Outcome.Status = IsPermissionFailure(e.code()) ? ScanStatus::PermissionError : ScanStatus::UnexpectedError;
        Outcome.ErrorMessage = DescribeFilesystemError(e);
        Outcome.ErrorPath = e.path1().string();
        Outcome.Stats = State.Stats;
        Log.Error(std::string("Filesystem error during scan: ") + e.what());
        return Outcome;
    }
    catch (const std::exception& e)
    {
        Outcome.Status = ScanStatus::UnexpectedError;
        Outcome.ErrorMessage = e.what();
        Outcome.Stats = State.Stats;
        Log.Error(std::string("Unexpected error during scan: ") + e.what());
        return Outcome;
    }

    Outcome.Oldest = std::move(State.Oldest);
    Outcome.Stats = State.Stats;

    Log.Info("Keyspaces scanned: " + std::to_string(Outcome.Stats.KeyspacesScanned) +
             ", excluded: " + std::to_string(Outcome.Stats.KeyspacesExcluded) +
             ", tables: " + std::to_string(Outcome.Stats.TablesScanned) +
             ", candidates: " + std::to_string(Outcome.Stats.CandidatesSeen) +
             ", skipped: " + std::to_string(Outcome.Stats.CandidatesSkipped) +
             ", vanished directories: " + std::to_string(Outcome.Stats.DirectoriesSkipped));
    return Outcome;
}

void FileScanner::ScanKeyspace(const FS::path& KeyspaceDir, ScanState& State)
{
    CheckCancelled();
    State.Stats.KeyspacesScanned++;
    Log.Info("Scanning keyspace: " + KeyspaceDir.filename().string());

    for (const auto& Entry : ListDirectory(KeyspaceDir))
    {
        // Table directories carry a generated id suffix, any directory qualifies.
        if (Entry.IsDirectory)
        {
            ScanTable(Entry.Path, State);
        }
    }
}

// Depth-first over the table subtree. Files of a directory are considered
// before its subdirectories; symlinked directories below the table root are
// not followed. A directory removed between being seen and being listed
// (compaction, snapshot cleanup) is skipped like a vanished file.
void FileScanner::ScanTable(const FS::path& TableDir, ScanState& State)
{
    State.Stats.TablesScanned++;

    std::stack<FS::path> DirStack;
    DirStack.push(TableDir);
    while (!DirStack.empty())
    {
        FS::path Current = DirStack.top();
        DirStack.pop();

        CheckCancelled();
        std::vector<DirectoryEntryInfo> Entries;
        try
        {
            Entries = ListDirectory(Current);
        }
        catch (const FS::filesystem_error& e)
        {
            if (!IsMissingFailure(e.code()))
            {
                throw;
            }
            State.Stats.DirectoriesSkipped++;
            Log.Info("Skipping directory removed during scan: " + Current.string());
            continue;
        }

        for (const auto& Entry : Entries)
        {
            if (Entry.IsRegularFile && Entry.Name == TargetFileName)
            {
                ConsiderCandidate(Entry.Path, State);
            }
        }

        for (auto It = Entries.rbegin(); It != Entries.rend(); ++It)
        {
            if (It->IsDirectory && !It->IsSymlink)
            {
                DirStack.push(It->Path);
            }
        }
    }
}

void FileScanner::ConsiderCandidate(const FS::path& File, ScanState& State)
{
    FS::file_time_type MTime;
    std::error_code Ec;
    if (!ReadModificationTime(File, MTime, Ec))
    {
        State.Stats.CandidatesSkipped++;
        if (IsMissingFailure(Ec))
        {
            Log.Info("Skipping file removed during scan: " + File.string());
        }
        else
        {
            Log.Warn("Skipping file with unreadable metadata: " + File.string() + " (" + Ec.message() + ")");
        }
        return;
    }

    State.Stats.CandidatesSeen++;
    if (!State.Oldest || MTime < State.Oldest->MTime)
    {
        State.Oldest = CandidateFile{File.string(), MTime};
        Log.Info("New oldest candidate: " + File.string() + " mtime: " + std::to_string(ToTimeT(MTime)));
    }
}
