#pragma once

#include <string>
#include <string_view>

#include "forge/orchestrator/v1.hpp"

namespace forge::graph {

/*
  Parses a stored flow into its node and edge lists.

  Node order is the order of the stored array and is the execution order.
  Editor decoration (position, width, selected, ...) is ignored. Malformed
  input throws util::ParseError.
*/
forge::orchestrator::v1::FlowGraph ParseFlowGraph(std::string_view raw);

inline constexpr std::string_view kAgentNodeType = "agent";

inline bool IsAgentNode(const forge::orchestrator::v1::Node& node) {
  return node.type() == kAgentNodeType;
}

} // namespace forge::graph
