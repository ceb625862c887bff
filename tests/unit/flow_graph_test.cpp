#include "internal/graph/flow_graph.hpp"

#include <cassert>
#include <iostream>

#include "internal/util/errors.hpp"

namespace {

using forge::graph::IsAgentNode;
using forge::graph::ParseFlowGraph;

void TestEditorDecorationIsIgnored() {
  const auto graph = ParseFlowGraph(R"({
    "nodes": [
      {"id": "a", "type": "agent", "position": {"x": 10, "y": 20}, "selected": true,
       "data": {"label": "Plan", "role": "Architect", "prompt": "design it", "provider": "Anthropic", "color": "#fff"}},
      {"id": "note", "type": "comment", "data": {"label": "ignore me"}},
      {"id": "b", "type": "agent", "data": {"label": "Build", "role": "dev", "prompt": "build it", "provider": "OpenAI"}}
    ],
    "edges": [{"id": "e1", "source": "a", "target": "b", "animated": true}],
    "viewport": {"zoom": 1.5}
  })");

  assert(graph.nodes_size() == 3);
  assert(graph.nodes(0).id() == "a");
  assert(graph.nodes(0).data().provider() == "Anthropic");
  assert(graph.nodes(2).data().role() == "dev");
  assert(IsAgentNode(graph.nodes(0)));
  assert(!IsAgentNode(graph.nodes(1)));

  assert(graph.edges_size() == 1);
  assert(graph.edges(0).source() == "a");
  assert(graph.edges(0).target() == "b");
}

void TestArrayOrderIsPreserved() {
  const auto graph = ParseFlowGraph(R"({"nodes": [{"id": "z", "type": "agent"}, {"id": "m", "type": "agent"}, {"id": "a", "type": "agent"}]})");

  assert(graph.nodes_size() == 3);
  assert(graph.nodes(0).id() == "z");
  assert(graph.nodes(1).id() == "m");
  assert(graph.nodes(2).id() == "a");
  assert(graph.edges_size() == 0);
}

void TestEmptyGraphParses() {
  const auto graph = ParseFlowGraph("{}");
  assert(graph.nodes_size() == 0);
  assert(graph.edges_size() == 0);
}

void TestMalformedInputThrowsParseError() {
  for (const char* raw : {"not json", "{\"nodes\": \"oops\"}", "{\"nodes\": [{\"id\": 1, \"data\": []}]}"}) {
    bool threw = false;
    try {
      (void)ParseFlowGraph(raw);
    } catch (const forge::util::ParseError&) {
      threw = true;
    }
    assert(threw);
  }
}

} // namespace

int main() {
  TestEditorDecorationIsIgnored();
  TestArrayOrderIsPreserved();
  TestEmptyGraphParses();
  TestMalformedInputThrowsParseError();

  std::cout << "forge_unit_flow_graph: pass\n";
  return 0;
}
