#pragma once

#include <pmat/protocol/service.hpp>

namespace pmat { class AppContext; }

namespace pmat::protocol {

// list, search, generate, scaffold, validate, context, analyze.<kind>,
// refactor.*, demo, cache.stats and cache.clear
void register_core_handlers(ProtocolService& service, AppContext& ctx);

// initialize, tools/*, prompts/*, resources/*. Tool calls are routed back
// through service to the core handlers.
void register_mcp_handlers(ProtocolService& service, AppContext& ctx);

// Deep-context result rendered for humans
std::string render_context_markdown(const Json::Value& context);

} // namespace pmat::protocol
