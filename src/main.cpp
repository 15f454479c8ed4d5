#include <pmat/app_context.hpp>
#include <pmat/log.hpp>
#include <pmat/protocol/cli_adapter.hpp>

#include <cstdlib>
#include <iostream>
#include <string>
#include <unistd.h>
#include <vector>

using namespace pmat;

// An MCP host launches us with MCP_VERSION set, or with no arguments and a
// pipe on stdin
static bool launched_by_mcp_host(int argc) {
    if (std::getenv("MCP_VERSION") != nullptr) return true;
    return argc == 1 && !isatty(STDIN_FILENO);
}

int main(int argc, char** argv) {
    protocol::CliInvocation inv;
    if (launched_by_mcp_host(argc)) {
        inv.mode = protocol::CliMode::Rpc;
    } else {
        std::vector<std::string> args(argv + 1, argv + argc);
        if (auto code = protocol::parse_cli(args, inv, std::cout, std::cerr)) return *code;
    }

    // RPC mode keeps stderr quiet unless asked
    log::Level fallback = inv.mode == protocol::CliMode::Rpc ? log::Warn : log::Info;
    log::set_level(log::level_for_verbosity(inv.verbosity, fallback));

    auto config = load_config(inv.project_root, inv.config_path);
    if (config.is_err()) {
        std::cerr << config.error().format() << "\n";
        return 1;
    }
    protocol::apply_cli_overrides(inv, config.value());

    auto ctx = AppContext::create(config.value(), inv.project_root);
    if (ctx.is_err()) {
        std::cerr << ctx.error().format() << "\n";
        return 1;
    }
    return protocol::run_cli(*ctx.value(), inv, std::cin, std::cout, std::cerr);
}
