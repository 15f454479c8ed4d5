#pragma once

#include <pmat/refactor/state_machine.hpp>
#include <pmat/result.hpp>
#include <filesystem>
#include <string>

namespace pmat::refactor {

constexpr int SNAPSHOT_SCHEMA_VERSION = 1;

// One JSON document per session at <dir>/refactor-<session_id>.json.
// Writes go to a temp sibling, are fsynced, renamed over the target and
// the directory is fsynced, so a reader sees the old or the new state.
class SnapshotStore {
public:
    explicit SnapshotStore(std::filesystem::path dir) : dir_(std::move(dir)) {}

    const std::filesystem::path& dir() const { return dir_; }

    // BadRequest unless the id is a single non-empty file name component
    static Status check_id(const std::string& session_id);
    std::filesystem::path path_for(const std::string& session_id) const;

    // Candidate files written during Transform
    std::filesystem::path spill_dir(const std::string& session_id) const;

    // Io (retryable) on any write failure
    Status save(const RefactorStateMachine& sm) const;

    // NotFound, Io, Serialization or BadRequest
    Result<RefactorStateMachine> load(const std::string& session_id) const;
    Result<RefactorStateMachine> load_file(const std::filesystem::path& path) const;

    // Session id of the most recently updated snapshot; NotFound if none
    Result<std::string> latest() const;

    // Snapshot and spill directory; missing ones are not an error
    Status remove(const std::string& session_id) const;

private:
    std::filesystem::path dir_;
};

// Write content to path via temp file, fsync, rename and directory fsync
Status write_file_atomic(const std::filesystem::path& path, const std::string& content);

} // namespace pmat::refactor
