#pragma once
#include <string_view>

namespace zmcp {

constexpr std::string_view LIBRARY_VERSION     = "1.0.0";
constexpr std::string_view PROTOCOL_VERSION    = "2024-11-05";
constexpr std::string_view JSONRPC_VERSION     = "2.0";
constexpr std::string_view SERVER_NAME         = "ZetMem MCP Server";

/// Default strategyGuideSummary for servers built from a Config.
constexpr std::string_view DEFAULT_STRATEGY_GUIDE_SUMMARY =
    "This server follows the Zetmem strategic principles for AI collaboration. "
    "Key concepts include workspace-first organization, consistent memory management "
    "habits, and iterative development patterns. For comprehensive onboarding guidance, "
    "see the Zetmem Onboarding Strategy document at: ZETMEM_ONBOARDING_STRATEGY.md";

} // namespace zmcp
