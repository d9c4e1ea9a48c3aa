#include "sluice/topology_builder.h"
#include "sluice/detail/overloaded.h"
#include "sluice/topology_error.h"
#include <algorithm>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>

namespace Sluice {

    TopologyBuilder &TopologyBuilder::add_source(SourceConfig config) {
        check_new_name(config.name);

        if (config.topics.empty()) {
            throw TopologyException(TopologyError::MissingTopics,
                                    "Source " + config.name + " must consume at least one topic.");
        }

        std::set<std::string> claimed;
        for (const auto &topic : config.topics) {
            if (m_source_topics.count(topic)) {
                throw TopologyException(TopologyError::DuplicateTopic,
                                        "Topic " + topic +
                                            " has already been registered by another source.");
            }
            if (!claimed.insert(topic).second) {
                throw TopologyException(TopologyError::DuplicateTopic,
                                        "Topic " + topic + " is listed more than once by source " +
                                            config.name + ".");
            }
        }

        warn_if_grouped("source " + config.name);

        m_source_topics.insert(claimed.begin(), claimed.end());
        m_node_to_topics[config.name] = config.topics;

        spdlog::debug("Registered source '{}' consuming {} topic(s)", config.name,
                      config.topics.size());
        register_node(std::move(config));
        return *this;
    }

    TopologyBuilder &TopologyBuilder::add_processor(ProcessorConfig config) {
        check_new_name(config.name);

        if (!config.supplier) {
            throw TopologyException(TopologyError::InvalidSupplier,
                                    "Processor " + config.name + " has no processor supplier.");
        }

        check_parents(config.name, config.parents);

        for (const auto &store : config.state_stores) {
            if (!m_state_stores.count(store)) {
                throw TopologyException(TopologyError::UnknownStateStore,
                                        "StateStore " + store + " is not added yet.");
            }
        }

        warn_if_grouped("processor " + config.name);

        // Stores are bound through connect() so that their users are tracked
        auto stores = std::move(config.state_stores);
        config.state_stores.clear();
        auto name = config.name;

        spdlog::debug("Registered processor '{}' with {} parent(s)", name, config.parents.size());
        register_node(std::move(config));

        for (const auto &store : stores) {
            connect(name, store);
        }
        return *this;
    }

    TopologyBuilder &TopologyBuilder::add_sink(SinkConfig config) {
        check_new_name(config.name);
        check_parents(config.name, config.parents);

        warn_if_grouped("sink " + config.name);

        spdlog::debug("Registered sink '{}' writing to topic '{}'", config.name, config.topic);
        register_node(std::move(config));
        return *this;
    }

    TopologyBuilder &TopologyBuilder::add_state_store(StateStoreSupplierPtr supplier,
                                                      const std::vector<std::string> &processor_names) {
        if (!supplier) {
            throw TopologyException(TopologyError::InvalidSupplier,
                                    "StateStore supplier must not be null.");
        }

        const auto &name = supplier->name();
        if (m_state_stores.count(name)) {
            throw TopologyException(TopologyError::DuplicateStateStore,
                                    "StateStore " + name + " is already added.");
        }

        for (const auto &processor_name : processor_names) {
            check_processor(processor_name, name);
        }

        m_state_stores[name] = StateStoreEntry{supplier, {}};
        spdlog::debug("Registered state store '{}'", name);

        for (const auto &processor_name : processor_names) {
            connect(processor_name, name);
        }
        return *this;
    }

    TopologyBuilder &
    TopologyBuilder::connect_processor_and_state_stores(const std::string &processor_name,
                                                        const std::vector<std::string> &state_store_names) {
        for (const auto &store : state_store_names) {
            if (!m_state_stores.count(store)) {
                throw TopologyException(TopologyError::UnknownStateStore,
                                        "StateStore " + store + " is not added yet.");
            }
            check_processor(processor_name, store);
        }

        for (const auto &store : state_store_names) {
            connect(processor_name, store);
        }
        return *this;
    }

    TopologyBuilder &TopologyBuilder::copartition_sources(const std::set<std::string> &source_names) {
        m_copartition_source_groups.push_back(source_names);
        return *this;
    }

    const TopologyBuilder::NodeGroups &TopologyBuilder::node_groups() const {
        std::lock_guard<std::mutex> lock(m_groups_mutex);
        if (!m_node_groups) {
            m_node_groups = make_node_groups();
            spdlog::debug("Computed {} node group(s) from {} node(s)", m_node_groups->size(),
                          m_nodes.size());
        }
        return *m_node_groups;
    }

    TopologyBuilder::TopicGroups TopologyBuilder::topic_groups() const {
        TopicGroups topic_groups;
        for (const auto &[group_id, node_names] : node_groups()) {
            auto &topic_group = topic_groups[group_id];
            for (const auto &node : node_names) {
                if (auto it = m_node_to_topics.find(node); it != m_node_to_topics.end()) {
                    topic_group.insert(it->second.begin(), it->second.end());
                }
            }
        }
        return topic_groups;
    }

    std::vector<std::set<std::string>> TopologyBuilder::copartition_groups() const {
        std::vector<std::set<std::string>> groups;
        groups.reserve(m_copartition_source_groups.size());
        for (const auto &source_names : m_copartition_source_groups) {
            std::set<std::string> copartition_group;
            for (const auto &node : source_names) {
                if (auto it = m_node_to_topics.find(node); it != m_node_to_topics.end()) {
                    copartition_group.insert(it->second.begin(), it->second.end());
                }
            }
            groups.push_back(std::move(copartition_group));
        }
        return groups;
    }

    ProcessorTopology TopologyBuilder::build(std::optional<NodeGroupID> group_id) const {
        if (!group_id) {
            auto topology = build_nodes(nullptr);
            spdlog::debug("Built full topology with {} node(s) and {} state store(s)",
                          topology.nodes.size(), topology.state_store_suppliers.size());
            return topology;
        }

        const auto &groups = node_groups();
        auto it = groups.find(*group_id);
        if (it == groups.end()) {
            spdlog::warn("Node group {} does not exist; building an empty topology", *group_id);
            return {};
        }

        auto topology = build_nodes(&it->second);
        spdlog::debug("Built topology for node group {} with {} node(s) and {} state store(s)",
                      *group_id, topology.nodes.size(), topology.state_store_suppliers.size());
        return topology;
    }

    const NodeSpec *TopologyBuilder::find_node(const std::string &name) const {
        if (auto it = m_node_index.find(name); it != m_node_index.end()) {
            return &m_nodes[it->second];
        }
        return nullptr;
    }

    std::vector<std::string> TopologyBuilder::state_store_users(const std::string &state_store_name) const {
        if (auto it = m_state_stores.find(state_store_name); it != m_state_stores.end()) {
            return it->second.users;
        }
        return {};
    }

    void TopologyBuilder::check_new_name(const std::string &name) const {
        if (auto it = m_node_index.find(name); it != m_node_index.end()) {
            throw TopologyException(TopologyError::DuplicateNodeName,
                                    std::string(to_string(node_kind(m_nodes[it->second]))) + " " +
                                        name + " is already added.");
        }
    }

    void TopologyBuilder::check_parents(const std::string &name,
                                        const std::vector<std::string> &parents) const {
        for (const auto &parent : parents) {
            if (parent == name) {
                throw TopologyException(TopologyError::SelfParent,
                                        "Processor " + name + " cannot be a parent of itself.");
            }
            if (!m_node_index.count(parent)) {
                throw TopologyException(TopologyError::UnknownParent,
                                        "Parent processor " + parent + " is not added yet.");
            }
        }
    }

    void TopologyBuilder::check_processor(const std::string &processor_name,
                                          const std::string &state_store_name) const {
        auto it = m_node_index.find(processor_name);
        if (it == m_node_index.end()) {
            throw TopologyException(TopologyError::UnknownProcessor,
                                    "Processor " + processor_name + " is not added yet.");
        }
        if (!std::holds_alternative<ProcessorConfig>(m_nodes[it->second])) {
            throw TopologyException(TopologyError::NotAProcessorNode,
                                    "Cannot connect state store " + state_store_name + " to " +
                                        to_string(node_kind(m_nodes[it->second])) + " node " +
                                        processor_name + ".");
        }
    }

    void TopologyBuilder::register_node(NodeSpec spec) {
        auto index = m_grouper.add();
        m_node_index.emplace(node_name(spec), index);
        m_nodes.push_back(std::move(spec));

        // A node always runs in the same task as its parents
        for (const auto &parent : node_parents(m_nodes.back())) {
            m_grouper.unite(index, m_node_index.at(parent));
        }
    }

    void TopologyBuilder::connect(const std::string &processor_name,
                                  const std::string &state_store_name) {
        auto store_it = m_state_stores.find(state_store_name);
        if (store_it == m_state_stores.end()) {
            throw TopologyException(TopologyError::UnknownStateStore,
                                    "StateStore " + state_store_name + " is not added yet.");
        }
        check_processor(processor_name, state_store_name);

        auto &users = store_it->second.users;
        if (std::find(users.begin(), users.end(), processor_name) != users.end())
            return;

        warn_if_grouped("binding of state store " + state_store_name + " to " + processor_name);

        auto index = m_node_index.at(processor_name);

        // Local state cannot be shared across tasks, so all users of a store share a group
        if (!users.empty()) {
            m_grouper.unite(m_node_index.at(users.front()), index);
        }
        users.push_back(processor_name);
        std::get<ProcessorConfig>(m_nodes[index]).state_stores.insert(state_store_name);

        spdlog::debug("Connected processor '{}' to state store '{}'", processor_name,
                      state_store_name);
    }

    void TopologyBuilder::warn_if_grouped(const std::string &what) const {
        std::lock_guard<std::mutex> lock(m_groups_mutex);
        if (m_node_groups) {
            spdlog::warn("Node groups were already computed; {} will not be reflected in them",
                         what);
        }
    }

    TopologyBuilder::NodeGroups TopologyBuilder::make_node_groups() const {
        NodeGroups node_groups;
        std::map<NodeIndex, NodeGroupID> root_to_group;
        NodeGroupID next_group_id = 0;

        auto assign = [&](const std::string &name) {
            auto root = m_grouper.root(m_node_index.at(name));
            auto [it, inserted] = root_to_group.emplace(root, next_group_id);
            if (inserted)
                next_group_id++;
            node_groups[it->second].insert(name);
        };

        // 1. Source nodes first, in name order. This keeps group ids stable and predictable.
        for (const auto &[name, topics] : m_node_to_topics) {
            assign(name);
        }

        // 2. Remaining nodes, in name order
        for (const auto &[name, index] : m_node_index) {
            if (!m_node_to_topics.count(name))
                assign(name);
        }

        return node_groups;
    }

    ProcessorTopology TopologyBuilder::build_nodes(const std::set<std::string> *node_group) const {
        ProcessorTopology topology;
        std::map<std::string, int> node_map;
        std::set<std::string> collected_stores;

        try {
            // m_nodes is already in topological order, so parents are always created first
            for (const auto &spec : m_nodes) {
                const auto &name = node_name(spec);
                if (node_group && !node_group->count(name))
                    continue;

                int idx = static_cast<int>(topology.nodes.size());
                ProcessorTopology::Node node;
                node.kind = node_kind(spec);
                node.name = name;

                auto link_parents = [&](const std::vector<std::string> &parents) {
                    for (const auto &parent : parents) {
                        int parent_idx = node_map.at(parent);
                        // A parent listed twice still yields a single edge
                        if (std::find(node.parents.begin(), node.parents.end(), parent_idx) !=
                            node.parents.end())
                            continue;
                        topology.nodes[parent_idx].children.push_back(idx);
                        node.parents.push_back(parent_idx);
                    }
                };

                std::visit(detail::overloaded{
                               [&](const SourceConfig &source) {
                                   node.topics = source.topics;
                                   node.key_deserializer = source.key_deserializer;
                                   node.value_deserializer = source.value_deserializer;
                                   for (const auto &topic : source.topics) {
                                       topology.topic_sources[topic] = idx;
                                   }
                               },
                               [&](const ProcessorConfig &processor) {
                                   node.processor = processor.supplier();
                                   if (!node.processor) {
                                       throw std::runtime_error("supplier of processor " + name +
                                                                " returned no instance");
                                   }
                                   link_parents(processor.parents);
                                   for (const auto &store : processor.state_stores) {
                                       node.state_stores.push_back(store);
                                       if (collected_stores.insert(store).second) {
                                           topology.state_store_suppliers.push_back(
                                               m_state_stores.at(store).supplier);
                                       }
                                   }
                               },
                               [&](const SinkConfig &sink) {
                                   node.topic = sink.topic;
                                   node.key_serializer = sink.key_serializer;
                                   node.value_serializer = sink.value_serializer;
                                   link_parents(sink.parents);
                               },
                           },
                           spec);

                topology.nodes.push_back(std::move(node));
                node_map.emplace(name, idx);
            }
        } catch (const std::exception &e) {
            spdlog::error("ProcessorNode construction failed: {}", e.what());
            throw TopologyException(TopologyError::InternalConstructionFailure,
                                    std::string("ProcessorNode construction failed: this should not "
                                                "happen (") +
                                        e.what() + ")");
        } catch (...) {
            spdlog::error("ProcessorNode construction failed: unknown exception");
            throw TopologyException(TopologyError::InternalConstructionFailure,
                                    "ProcessorNode construction failed: this should not happen "
                                    "(unknown exception)");
        }

        return topology;
    }
}
