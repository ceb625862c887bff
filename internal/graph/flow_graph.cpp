#include "flow_graph.hpp"

#include <google/protobuf/util/json_util.h>

#include "internal/util/errors.hpp"

namespace forge::graph {

namespace v1 = forge::orchestrator::v1;

v1::FlowGraph ParseFlowGraph(std::string_view raw) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  v1::FlowGraph graph;
  const auto    status = google::protobuf::util::JsonStringToMessage(google::protobuf::StringPiece(raw.data(), raw.size()), &graph, options);
  if (!status.ok()) {
    throw util::ParseError("failed to parse flow data: " + std::string(status.message()));
  }

  return graph;
}

} // namespace forge::graph
