#include "sluice/node.h"
#include "sluice/detail/overloaded.h"

namespace Sluice {

    const std::string &node_name(const NodeSpec &spec) {
        return std::visit([](const auto &config) -> const std::string & { return config.name; },
                          spec);
    }

    NodeKind node_kind(const NodeSpec &spec) {
        return std::visit(detail::overloaded{
                              [](const SourceConfig &) { return NodeKind::Source; },
                              [](const ProcessorConfig &) { return NodeKind::Processor; },
                              [](const SinkConfig &) { return NodeKind::Sink; },
                          },
                          spec);
    }

    const std::vector<std::string> &node_parents(const NodeSpec &spec) {
        static const std::vector<std::string> no_parents;
        return std::visit(
            detail::overloaded{
                [](const SourceConfig &) -> const std::vector<std::string> & { return no_parents; },
                [](const ProcessorConfig &config) -> const std::vector<std::string> & {
                    return config.parents;
                },
                [](const SinkConfig &config) -> const std::vector<std::string> & {
                    return config.parents;
                },
            },
            spec);
    }

    const char *to_string(NodeKind kind) {
        switch (kind) {
        case NodeKind::Source:
            return "Source";
        case NodeKind::Processor:
            return "Processor";
        case NodeKind::Sink:
            return "Sink";
        }
        return "Unknown";
    }

}
