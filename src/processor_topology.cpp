#include "sluice/processor_topology.h"
#include <iostream>

namespace Sluice {

    const ProcessorTopology::Node *ProcessorTopology::find(const std::string &name) const {
        for (const auto &node : nodes) {
            if (node.name == name)
                return &node;
        }
        return nullptr;
    }

    const ProcessorTopology::Node *
    ProcessorTopology::source_for_topic(const std::string &topic) const {
        if (auto it = topic_sources.find(topic); it != topic_sources.end()) {
            return &nodes[it->second];
        }
        return nullptr;
    }

    void ProcessorTopology::dump_debug(std::ostream &os) const {
        os << "Processor Topology Dump:\n";
        os << "Total Nodes: " << nodes.size() << "\n";
        os << "State Stores: ";
        for (const auto &supplier : state_store_suppliers) {
            os << supplier->name() << " ";
        }
        os << "\n\n";

        for (size_t i = 0; i < nodes.size(); ++i) {
            const auto &node = nodes[i];
            os << "[" << i << "] " << node.name << " (" << to_string(node.kind) << ")\n";
            switch (node.kind) {
            case NodeKind::Source:
                os << "  Topics: ";
                for (const auto &topic : node.topics) {
                    os << topic << " ";
                }
                os << "\n";
                break;
            case NodeKind::Processor:
                os << "  State Stores: ";
                if (node.state_stores.empty()) {
                    os << "None";
                } else {
                    for (const auto &store : node.state_stores) {
                        os << store << " ";
                    }
                }
                os << "\n";
                break;
            case NodeKind::Sink:
                os << "  Topic: " << node.topic << "\n";
                break;
            }
            os << "  Children: ";
            if (node.children.empty()) {
                os << "None";
            } else {
                for (int child : node.children) {
                    os << child << " ";
                }
            }
            os << "\n----------------------------------------\n";
        }
    }
}
