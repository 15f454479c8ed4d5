#include <pmat/process.hpp>
#include <pmat/log.hpp>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <map>
#include <sstream>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace pmat {

// ---------------------------------------------------------------------------
// Subprocess
// ---------------------------------------------------------------------------

static void drain(int fd, std::string& out) {
    char buf[4096];
    ssize_t n;
    while ((n = read(fd, buf, sizeof(buf))) > 0) {
        out.append(buf, static_cast<size_t>(n));
    }
}

Result<CommandResult> run_command(const std::vector<std::string>& args,
                                  const std::string& working_dir,
                                  int timeout_seconds) {
    if (args.empty()) {
        return PmatError{PmatError::BadRequest, "run_command: empty args"};
    }

    std::vector<const char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    int out_pipe[2];
    int err_pipe[2];
    if (pipe(out_pipe) != 0) {
        return PmatError::io(std::string("pipe() failed: ") + strerror(errno));
    }
    if (pipe(err_pipe) != 0) {
        close(out_pipe[0]); close(out_pipe[1]);
        return PmatError::io(std::string("pipe() failed: ") + strerror(errno));
    }

    pid_t pid = fork();
    if (pid < 0) {
        close(out_pipe[0]); close(out_pipe[1]);
        close(err_pipe[0]); close(err_pipe[1]);
        return PmatError::io(std::string("fork() failed: ") + strerror(errno), true);
    }

    if (pid == 0) {
        // Child: never inherit our stdin, it may be the RPC transport
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) { dup2(devnull, STDIN_FILENO); close(devnull); }
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        close(out_pipe[0]); close(out_pipe[1]);
        close(err_pipe[0]); close(err_pipe[1]);
        if (!working_dir.empty() && chdir(working_dir.c_str()) != 0) _exit(127);
        execvp(argv[0], const_cast<char* const*>(argv.data()));
        _exit(127);
    }

    close(out_pipe[1]);
    close(err_pipe[1]);
    fcntl(out_pipe[0], F_SETFL, O_NONBLOCK);
    fcntl(err_pipe[0], F_SETFL, O_NONBLOCK);

    std::string out_buf, err_buf;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(timeout_seconds);
    int status = 0;

    for (;;) {
        if (std::chrono::steady_clock::now() >= deadline) {
            kill(pid, SIGKILL);
            waitpid(pid, nullptr, 0);
            close(out_pipe[0]);
            close(err_pipe[0]);
            return PmatError{PmatError::Timeout,
                "'" + args[0] + "' timed out after " + std::to_string(timeout_seconds) + "s"};
        }

        pollfd fds[2] = {{out_pipe[0], POLLIN, 0}, {err_pipe[0], POLLIN, 0}};
        poll(fds, 2, 50);
        drain(out_pipe[0], out_buf);
        drain(err_pipe[0], err_buf);

        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) break;
        if (w < 0 && errno != EINTR) {
            close(out_pipe[0]);
            close(err_pipe[0]);
            return PmatError::io(std::string("waitpid failed: ") + strerror(errno));
        }
    }

    drain(out_pipe[0], out_buf);
    drain(err_pipe[0], err_buf);
    close(out_pipe[0]);
    close(err_pipe[0]);

    int exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    if (exit_code == 127 && out_buf.empty()) {
        return PmatError{PmatError::NotFound, "cannot execute '" + args[0] + "'"};
    }
    return Result<CommandResult>::ok(
        CommandResult{exit_code, std::move(out_buf), std::move(err_buf)});
}

// ---------------------------------------------------------------------------
// Churn log parsing
// ---------------------------------------------------------------------------

std::vector<FileChurn> parse_numstat_log(const std::string& output) {
    std::map<std::string, FileChurn> by_path;
    std::istringstream stream(output);
    std::string line;
    std::string author;
    int64_t when = 0;

    while (std::getline(stream, line)) {
        if (line.empty()) continue;

        if (line.compare(0, 7, "commit:") == 0) {
            // commit:<sha>|<author>|<unix time>
            auto p1 = line.find('|');
            auto p2 = line.find('|', p1 == std::string::npos ? p1 : p1 + 1);
            author = (p1 == std::string::npos) ? "" : line.substr(p1 + 1, p2 - p1 - 1);
            when = 0;
            if (p2 != std::string::npos) {
                when = std::strtoll(line.c_str() + p2 + 1, nullptr, 10);
            }
            continue;
        }

        // <added>\t<deleted>\t<path>; binary files report "-"
        auto t1 = line.find('\t');
        if (t1 == std::string::npos) continue;
        auto t2 = line.find('\t', t1 + 1);
        if (t2 == std::string::npos) continue;

        std::string added = line.substr(0, t1);
        std::string deleted = line.substr(t1 + 1, t2 - t1 - 1);
        std::string path = line.substr(t2 + 1);

        auto& rec = by_path[path];
        rec.path = path;
        rec.commits++;
        if (added != "-") rec.additions += std::atoi(added.c_str());
        if (deleted != "-") rec.deletions += std::atoi(deleted.c_str());
        if (!author.empty() &&
            std::find(rec.authors.begin(), rec.authors.end(), author) == rec.authors.end()) {
            rec.authors.push_back(author);
        }
        rec.last_commit_time = std::max(rec.last_commit_time, when);
    }

    std::vector<FileChurn> result;
    result.reserve(by_path.size());
    for (auto& [_, rec] : by_path) result.push_back(std::move(rec));
    std::stable_sort(result.begin(), result.end(), [](const FileChurn& a, const FileChurn& b) {
        return a.commits > b.commits;
    });
    return result;
}

// ---------------------------------------------------------------------------
// Diff parsing
// ---------------------------------------------------------------------------

std::map<std::string, std::vector<int>> parse_diff_added_lines(const std::string& diff) {
    std::map<std::string, std::vector<int>> out;
    std::istringstream stream(diff);
    std::string line;
    std::string current;

    while (std::getline(stream, line)) {
        if (line.compare(0, 4, "+++ ") == 0) {
            std::string target = line.substr(4);
            if (target == "/dev/null") {
                current.clear();
            } else {
                current = target.compare(0, 2, "b/") == 0 ? target.substr(2) : target;
                out[current];
            }
            continue;
        }
        if (current.empty() || line.compare(0, 3, "@@ ") != 0) continue;

        // @@ -<old>[,<n>] +<start>[,<count>] @@
        auto plus = line.find(" +");
        if (plus == std::string::npos) continue;
        const char* p = line.c_str() + plus + 2;
        char* end = nullptr;
        long start = std::strtol(p, &end, 10);
        long count = 1;
        if (end && *end == ',') count = std::strtol(end + 1, nullptr, 10);
        auto& lines = out[current];
        for (long i = 0; i < count; ++i) lines.push_back(static_cast<int>(start + i));
    }
    return out;
}

// ---------------------------------------------------------------------------
// GitCli
// ---------------------------------------------------------------------------

Result<std::string> GitCli::run_git(const std::vector<std::string>& args) const {
    std::vector<std::string> full{"git", "-C", repo_};
    full.insert(full.end(), args.begin(), args.end());
    log::trace("git -C %s %s", repo_.c_str(), args.empty() ? "" : args[0].c_str());

    auto r = run_command(full, "", timeout_seconds_);
    if (r.is_err()) return std::move(r).error();
    auto& cmd = r.value();
    if (cmd.exit_code != 0) {
        return PmatError{PmatError::IO,
            "git " + (args.empty() ? std::string() : args[0]) + " failed: " + cmd.stderr_str};
    }
    return Result<std::string>::ok(std::move(cmd.stdout_str));
}

static std::string trim_newline(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ')) s.pop_back();
    return s;
}

bool GitCli::is_repository() const {
    auto r = run_git({"rev-parse", "--is-inside-work-tree"});
    return r.is_ok() && trim_newline(r.value()) == "true";
}

Result<std::string> GitCli::head_commit() const {
    return run_git({"rev-parse", "HEAD"}).map(trim_newline);
}

Result<std::string> GitCli::current_branch() const {
    return run_git({"rev-parse", "--abbrev-ref", "HEAD"}).map(trim_newline);
}

Result<std::vector<FileChurn>> GitCli::churn(int period_days) const {
    auto r = run_git({"log", "--numstat", "--no-renames",
                      "--since=" + std::to_string(period_days) + ".days",
                      "--format=commit:%H|%an|%at"});
    if (r.is_err()) return std::move(r).error();
    return Result<std::vector<FileChurn>>::ok(parse_numstat_log(r.value()));
}

Result<std::string> GitCli::rev_parse(const std::string& ref) const {
    return run_git({"rev-parse", "--verify", ref + "^{commit}"}).map(trim_newline);
}

Result<std::map<std::string, std::vector<int>>> GitCli::changed_lines(const std::string& base) const {
    auto r = run_git({"diff", "-U0", "--no-color", "--no-ext-diff", "--relative", base, "--"});
    if (r.is_err()) return std::move(r).error();
    return Result<std::map<std::string, std::vector<int>>>::ok(parse_diff_added_lines(r.value()));
}

Result<std::vector<std::string>> GitCli::untracked_files() const {
    auto r = run_git({"ls-files", "--others", "--exclude-standard"});
    if (r.is_err()) return std::move(r).error();
    std::vector<std::string> files;
    std::istringstream stream(r.value());
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty()) files.push_back(line);
    }
    return Result<std::vector<std::string>>::ok(std::move(files));
}

Status GitCli::commit(const std::vector<std::string>& files, const std::string& message) const {
    if (files.empty()) return ok_status();
    std::vector<std::string> add{"add", "--"};
    add.insert(add.end(), files.begin(), files.end());
    auto staged = run_git(add);
    if (staged.is_err()) return std::move(staged).error();

    auto committed = run_git({"commit", "-m", message, "--no-verify"});
    if (committed.is_err()) return std::move(committed).error();
    log::info("committed %zu file(s)", files.size());
    return ok_status();
}

} // namespace pmat
