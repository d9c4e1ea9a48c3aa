#pragma once
#include "sluice/processor.h"
#include "sluice/serde.h"
#include <cstdint>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace Sluice {

    /// @brief Identifier of a task group (node group), dense from 0.
    using NodeGroupID = uint32_t;

    /**
     * @brief The three kinds of node a topology is made of.
     */
    enum class NodeKind {
        Source,    ///< Consumes topics and forwards records to its children.
        Processor, ///< Transforms records received from its parents.
        Sink       ///< Writes records received from its parents to a topic.
    };

    /**
     * @brief Configuration for a source node.
     */
    struct SourceConfig {
        std::string name;                ///< Unique node name.
        std::vector<std::string> topics; ///< Topics consumed. At least one, each claimed only once.

        /// @brief Key decoder. Null selects the engine default.
        DeserializerPtr key_deserializer;

        /// @brief Value decoder. Null selects the engine default.
        DeserializerPtr value_deserializer;
    };

    /**
     * @brief Configuration for a processor node.
     */
    struct ProcessorConfig {
        std::string name;                 ///< Unique node name.
        ProcessorSupplier supplier;       ///< Creates the processing stage. Must not be empty.
        std::vector<std::string> parents; ///< Upstream nodes, all registered before this one.

        /**
         * @brief State stores this processor uses.
         *
         * Every store must already be registered. Later bindings made through
         * TopologyBuilder::connect_processor_and_state_stores() are added to this set.
         */
        std::set<std::string> state_stores;
    };

    /**
     * @brief Configuration for a sink node.
     */
    struct SinkConfig {
        std::string name;                 ///< Unique node name.
        std::string topic;                ///< Topic the sink writes to.
        std::vector<std::string> parents; ///< Upstream nodes, all registered before this one.

        SerializerPtr key_serializer;   ///< Null selects the engine default.
        SerializerPtr value_serializer; ///< Null selects the engine default.
    };

    /**
     * @brief A registered node specification.
     *
     * Closed set of variants; code that behaves differently per kind uses
     * std::visit so that every kind is handled.
     */
    using NodeSpec = std::variant<SourceConfig, ProcessorConfig, SinkConfig>;

    const std::string &node_name(const NodeSpec &spec);

    NodeKind node_kind(const NodeSpec &spec);

    /**
     * @brief Parent names of a node. Empty for sources.
     */
    const std::vector<std::string> &node_parents(const NodeSpec &spec);

    const char *to_string(NodeKind kind);
}
