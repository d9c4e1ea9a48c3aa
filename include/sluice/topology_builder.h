#pragma once
#include "sluice/node.h"
#include "sluice/processor_topology.h"
#include "sluice/quick_union.h"
#include "sluice/state_store.h"
#include "sluice/topology_error.h"
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace Sluice {

    /**
     * @brief Builds processor topologies from sources, processors, sinks and state stores.
     *
     * The TopologyBuilder is responsible for:
     * 1. Accepting node registration and validating names, topics and parents.
     * 2. Binding state stores to processor nodes.
     * 3. Partitioning the nodes into task groups: a node always shares a group
     *    with its parents, and all processors using one store share a group.
     * 4. Building a ProcessorTopology for the whole graph or for one group.
     *
     * Nodes can only name parents that already exist, so registration order is
     * a valid topological order.
     *
     * The specification is append-only. Registration is not thread-safe; once
     * it is complete, node_groups() and build() may be called from several
     * threads.
     */
    class TopologyBuilder {
    public:
        using NodeGroups = std::map<NodeGroupID, std::set<std::string>>;
        using TopicGroups = std::map<NodeGroupID, std::set<std::string>>;

        TopologyBuilder() = default;
        TopologyBuilder(const TopologyBuilder &) = delete;
        TopologyBuilder &operator=(const TopologyBuilder &) = delete;

        /**
         * @brief Registers a source node consuming the given topics.
         * @throws TopologyException DuplicateNodeName, MissingTopics or DuplicateTopic.
         */
        TopologyBuilder &add_source(SourceConfig config);

        /**
         * @brief Registers a processor node fed by the given parents.
         *
         * Stores listed in `config.state_stores` are connected as if by
         * connect_processor_and_state_stores().
         *
         * @throws TopologyException DuplicateNodeName, SelfParent, UnknownParent,
         * InvalidSupplier or UnknownStateStore.
         */
        TopologyBuilder &add_processor(ProcessorConfig config);

        /**
         * @brief Registers a sink node writing the output of its parents to a topic.
         * @throws TopologyException DuplicateNodeName, SelfParent or UnknownParent.
         */
        TopologyBuilder &add_sink(SinkConfig config);

        /**
         * @brief Registers a state store and connects it to the named processors.
         * @param supplier Creates the store; its name() identifies the store.
         * @param processor_names Processor nodes using the store.
         * @throws TopologyException InvalidSupplier, DuplicateStateStore, or any
         * error of connect_processor_and_state_stores().
         */
        TopologyBuilder &add_state_store(StateStoreSupplierPtr supplier,
                                         const std::vector<std::string> &processor_names = {});

        /**
         * @brief Connects a processor node to already registered state stores.
         *
         * Processors sharing a store are placed in the same task group.
         *
         * @throws TopologyException UnknownStateStore, UnknownProcessor or NotAProcessorNode.
         */
        TopologyBuilder &connect_processor_and_state_stores(const std::string &processor_name,
                                                            const std::vector<std::string> &state_store_names);

        /**
         * @brief Declares that the topics of the given sources must be co-partitioned.
         *
         * Names that are not sources contribute no topics.
         */
        TopologyBuilder &copartition_sources(const std::set<std::string> &source_names);

        /**
         * @brief All topics consumed by any source node.
         */
        const std::set<std::string> &source_topics() const { return m_source_topics; }

        /**
         * @brief Returns the task groups, keyed by group id.
         *
         * Computed on first call and cached. Nodes or bindings added afterwards
         * are not reflected; finish the specification before calling this.
         */
        const NodeGroups &node_groups() const;

        /**
         * @brief Returns, per task group, the topics consumed by the group's sources.
         */
        TopicGroups topic_groups() const;

        /**
         * @brief Returns the topics of each co-partition declaration, in declaration order.
         */
        std::vector<std::set<std::string>> copartition_groups() const;

        /**
         * @brief Instantiates a ProcessorTopology.
         *
         * @param group_id The task group to build, or std::nullopt for every node.
         * An unknown group id yields an empty topology.
         * @return ProcessorTopology Freshly created nodes owned by the caller.
         * @throws TopologyException InternalConstructionFailure if a node could not be created.
         */
        ProcessorTopology build(std::optional<NodeGroupID> group_id = std::nullopt) const;

        size_t node_count() const { return m_nodes.size(); }

        /**
         * @brief Returns the registered specification of a node, or nullptr.
         */
        const NodeSpec *find_node(const std::string &name) const;

        /**
         * @brief Returns the names of the processors bound to a store, in binding order.
         */
        std::vector<std::string> state_store_users(const std::string &state_store_name) const;

    private:
        struct StateStoreEntry {
            StateStoreSupplierPtr supplier;
            std::vector<std::string> users;
        };

        void check_new_name(const std::string &name) const;
        void check_parents(const std::string &name, const std::vector<std::string> &parents) const;
        void check_processor(const std::string &processor_name, const std::string &state_store_name) const;
        void register_node(NodeSpec spec);
        void connect(const std::string &processor_name, const std::string &state_store_name);
        void warn_if_grouped(const std::string &what) const;

        NodeGroups make_node_groups() const;
        ProcessorTopology build_nodes(const std::set<std::string> *node_group) const;

        std::vector<NodeSpec> m_nodes; ///< In registration (topological) order
        std::map<std::string, NodeIndex> m_node_index;

        std::set<std::string> m_source_topics;
        std::map<std::string, std::vector<std::string>> m_node_to_topics; ///< Source name -> topics
        QuickUnion m_grouper;

        std::map<std::string, StateStoreEntry> m_state_stores;
        std::vector<std::set<std::string>> m_copartition_source_groups;

        mutable std::mutex m_groups_mutex;
        mutable std::optional<NodeGroups> m_node_groups;
    };

}
