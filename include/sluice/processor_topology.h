#pragma once
#include "sluice/node.h"
#include "sluice/state_store.h"
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace Sluice {

    /**
     * @brief A built, runnable topology for one task (or the whole graph).
     *
     * Produced by TopologyBuilder::build(). Nodes are stored in topological
     * order and link to each other by index into `nodes`. The topology owns its
     * processor instances and shares nothing mutable with the builder.
     */
    struct ProcessorTopology {
        struct Node {
            NodeKind kind = NodeKind::Processor;
            std::string name;
            std::vector<int> parents;  ///< Indices of upstream nodes
            std::vector<int> children; ///< Indices of downstream nodes

            // Source
            std::vector<std::string> topics;
            DeserializerPtr key_deserializer;
            DeserializerPtr value_deserializer;

            // Processor
            std::unique_ptr<Processor> processor;
            std::vector<std::string> state_stores;

            // Sink
            std::string topic;
            SerializerPtr key_serializer;
            SerializerPtr value_serializer;
        };

        std::vector<Node> nodes;                  ///< All nodes, parents before children
        std::map<std::string, int> topic_sources; ///< Topic -> index of the source consuming it

        /// @brief Suppliers of every store used by a processor in this topology, in first-use order.
        std::vector<StateStoreSupplierPtr> state_store_suppliers;

        /**
         * @brief Looks up a node by name.
         * @return The node, or nullptr if it is not part of this topology.
         */
        const Node *find(const std::string &name) const;

        /**
         * @brief Returns the source node consuming the topic, or nullptr.
         */
        const Node *source_for_topic(const std::string &topic) const;

        bool empty() const { return nodes.empty(); }

        /**
         * @brief Dumps a textual representation of the topology to the given stream.
         */
        void dump_debug(std::ostream &os) const;
    };
}
