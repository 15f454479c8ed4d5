#pragma once

#include <pmat/config.hpp>
#include <pmat/protocol/request.hpp>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace pmat { class AppContext; }

namespace pmat::protocol {

enum class CliMode {
    Request,         // one service call, rendered to stdout
    Rpc,             // JSON-RPC over stdin/stdout
    Http,            // serve the HTTP surface
    RefactorServe,   // start a session and advance it to the end
};

// Everything a command line asks for. Built by parse_cli, carried out by
// run_cli once the application context exists.
struct CliInvocation {
    CliMode mode = CliMode::Request;
    UnifiedRequest request;

    std::string format = "json";      // table | json | yaml | markdown
    std::string output_path;          // generate -o
    bool create_dirs = false;
    std::string output_dir = ".";     // scaffold destination
    bool write_files = false;         // scaffold writes its files

    int verbosity = 0;
    std::string config_path;
    std::string project_root = ".";
    std::string checkpoint;           // refactor --checkpoint (directory or snapshot file)
    std::optional<int64_t> port;      // serve / demo --port
};

// Parse argv. Returns an exit code when parsing ended the run (help,
// usage error = 2); otherwise fills inv.
std::optional<int> parse_cli(const std::vector<std::string>& args, CliInvocation& inv,
                             std::ostream& out, std::ostream& err);

// Apply command line settings that must exist before the context is built
void apply_cli_overrides(const CliInvocation& inv, Config& config);

// Carry out inv. Exit code 0 on success, 1 on a handled error, 2 for an
// unknown method. Errors print one error[...] line on err.
int run_cli(AppContext& ctx, const CliInvocation& inv, std::istream& in, std::ostream& out,
            std::ostream& err);

// Render a result body in the requested format
std::string render_output(const std::string& method, const Json::Value& body,
                          const std::string& format);

} // namespace pmat::protocol
