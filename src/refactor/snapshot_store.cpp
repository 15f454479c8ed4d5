#include <pmat/refactor/snapshot_store.hpp>
#include <pmat/json.hpp>
#include <pmat/log.hpp>

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace fs = std::filesystem;

namespace pmat::refactor {

static const char* SNAPSHOT_PREFIX = "refactor-";
static const char* SNAPSHOT_SUFFIX = ".json";

static PmatError errno_error(const std::string& what, const fs::path& path) {
    return PmatError::io(what + ": " + std::strerror(errno), true).with_file(path.string());
}

static Status fsync_path(const fs::path& path, int flags) {
    int fd = ::open(path.c_str(), flags);
    if (fd < 0) return errno_error("cannot open for fsync", path);
    int rc = ::fsync(fd);
    int saved = errno;
    ::close(fd);
    if (rc != 0) {
        errno = saved;
        return errno_error("fsync failed", path);
    }
    return ok_status();
}

Status write_file_atomic(const fs::path& path, const std::string& content) {
    std::error_code ec;
    fs::path parent = path.parent_path().empty() ? fs::path(".") : path.parent_path();
    fs::create_directories(parent, ec);
    if (ec) {
        return PmatError::io("cannot create directory: " + ec.message(), true)
            .with_file(parent.string());
    }

    fs::path tmp = path;
    tmp += ".tmp." + std::to_string(::getpid());

    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) return errno_error("cannot create temp file", tmp);
    const char* data = content.data();
    size_t left = content.size();
    while (left > 0) {
        ssize_t n = ::write(fd, data, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            auto err = errno_error("write failed", tmp);
            ::close(fd);
            fs::remove(tmp, ec);
            return err;
        }
        data += n;
        left -= static_cast<size_t>(n);
    }
    if (::fsync(fd) != 0) {
        auto err = errno_error("fsync failed", tmp);
        ::close(fd);
        fs::remove(tmp, ec);
        return err;
    }
    if (::close(fd) != 0) {
        auto err = errno_error("close failed", tmp);
        fs::remove(tmp, ec);
        return err;
    }

    if (::rename(tmp.c_str(), path.c_str()) != 0) {
        auto err = errno_error("rename failed", path);
        fs::remove(tmp, ec);
        return err;
    }
    return fsync_path(parent, O_RDONLY | O_DIRECTORY);
}

// jsoncpp throws on conversions such as asUInt64 of a negative number
static Result<RefactorStateMachine> decode(const Json::Value& j, const fs::path& path) {
    try {
        return RefactorStateMachine::from_json(j);
    } catch (const Json::Exception& e) {
        return PmatError(PmatError::Serialization,
                         std::string("snapshot has a field of the wrong type: ") + e.what())
            .with_file(path.string());
    }
}

Status SnapshotStore::check_id(const std::string& session_id) {
    if (session_id.empty() || session_id == "." || session_id == ".." ||
        session_id.find_first_of("/\\") != std::string::npos ||
        session_id.find('\0') != std::string::npos) {
        PmatError e(PmatError::BadRequest, "invalid session id '" + session_id + "'");
        e.field = "session_id";
        e.reason = "must be a plain file name";
        return e;
    }
    return ok_status();
}

fs::path SnapshotStore::path_for(const std::string& session_id) const {
    return dir_ / (SNAPSHOT_PREFIX + session_id + SNAPSHOT_SUFFIX);
}

fs::path SnapshotStore::spill_dir(const std::string& session_id) const {
    return dir_ / (session_id + ".spill");
}

Status SnapshotStore::save(const RefactorStateMachine& sm) const {
    Json::Value doc = sm.to_json();
    doc["schema_version"] = SNAPSHOT_SCHEMA_VERSION;
    auto st = write_file_atomic(path_for(sm.session_id()), json::pretty(doc) + "\n");
    if (st.is_err()) {
        log::error("snapshot write failed for %s: %s", sm.session_id().c_str(),
                   st.error().message.c_str());
        return st;
    }
    log::trace("snapshot %s at phase %s", sm.session_id().c_str(), phase_name(sm.phase()));
    return ok_status();
}

Result<RefactorStateMachine> SnapshotStore::load(const std::string& session_id) const {
    PMAT_TRY(check_id(session_id));
    return load_file(path_for(session_id));
}

Result<RefactorStateMachine> SnapshotStore::load_file(const fs::path& path) const {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return PmatError(PmatError::NotFound, "no snapshot at " + path.string(),
                         "start a new session with `pmat refactor serve`");
    }
    std::ifstream in(path, std::ios::binary);
    if (!in) return PmatError::io("cannot read snapshot").with_file(path.string());
    std::stringstream ss;
    ss << in.rdbuf();
    if (in.bad()) return PmatError::io("cannot read snapshot").with_file(path.string());

    auto doc = json::parse(ss.str());
    if (doc.is_err()) {
        return PmatError(PmatError::Serialization, "snapshot is not valid JSON")
            .with_file(path.string())
            .with_cause(doc.error());
    }
    const Json::Value& j = doc.value();
    if (!j.isObject() || !j["schema_version"].isInt()) {
        return PmatError(PmatError::Serialization, "snapshot has no schema_version")
            .with_file(path.string());
    }
    int version = j["schema_version"].asInt();
    if (version != SNAPSHOT_SCHEMA_VERSION) {
        return PmatError(PmatError::Serialization,
                         "unsupported snapshot schema version " + std::to_string(version),
                         "start a new session")
            .with_file(path.string());
    }
    auto sm = decode(j, path);
    if (sm.is_err() && sm.error().code == PmatError::Serialization) return sm;
    if (sm.is_err()) {
        return PmatError(PmatError::Serialization, "snapshot is malformed")
            .with_file(path.string())
            .with_cause(sm.error());
    }
    return sm;
}

Result<std::string> SnapshotStore::latest() const {
    std::error_code ec;
    if (!fs::is_directory(dir_, ec)) {
        return PmatError(PmatError::NotFound, "no checkpoint directory " + dir_.string());
    }

    std::string best_id;
    int64_t best_updated = -1;
    std::string prefix = SNAPSHOT_PREFIX;
    std::string suffix = SNAPSHOT_SUFFIX;
    for (const auto& entry : fs::directory_iterator(dir_, ec)) {
        std::string name = entry.path().filename().string();
        if (name.size() <= prefix.size() + suffix.size() || name.rfind(prefix, 0) != 0 ||
            name.compare(name.size() - suffix.size(), suffix.size(), suffix) != 0) {
            continue;
        }
        auto sm = load_file(entry.path());
        if (sm.is_err()) {
            log::warn("ignoring unreadable snapshot %s: %s", name.c_str(),
                      sm.error().message.c_str());
            continue;
        }
        int64_t updated = sm.value().updated_at();
        if (updated > best_updated || (updated == best_updated && sm.value().session_id() > best_id)) {
            best_updated = updated;
            best_id = sm.value().session_id();
        }
    }
    if (ec) return PmatError::io("cannot list checkpoints: " + ec.message()).with_file(dir_.string());
    if (best_id.empty()) {
        return PmatError(PmatError::NotFound, "no refactor snapshots in " + dir_.string());
    }
    return Result<std::string>::ok(best_id);
}

Status SnapshotStore::remove(const std::string& session_id) const {
    PMAT_TRY(check_id(session_id));
    std::error_code ec;
    fs::remove(path_for(session_id), ec);
    if (ec) return PmatError::io("cannot delete snapshot: " + ec.message()).with_file(path_for(session_id).string());
    fs::remove_all(spill_dir(session_id), ec);
    if (ec) return PmatError::io("cannot delete spill directory: " + ec.message()).with_file(spill_dir(session_id).string());
    return ok_status();
}

} // namespace pmat::refactor
