#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace Sluice {

    /// @brief Dense index of a node inside a TopologyBuilder registry.
    using NodeIndex = uint32_t;

    /**
     * @brief Disjoint-set forest over dense node indices.
     *
     * Tracks which nodes must be scheduled in the same task. Two nodes belong
     * to the same class iff root() returns the same index for both.
     *
     * unite() uses union by rank and compresses the paths it walks, so root()
     * can stay const and never rewrites the forest.
     */
    class QuickUnion {
    public:
        /**
         * @brief Adds a new singleton class.
         * @return NodeIndex The index of the new element (equal to the previous size()).
         */
        NodeIndex add();

        /**
         * @brief Merges the classes of two elements.
         * @throws std::out_of_range If either index was never added.
         */
        void unite(NodeIndex a, NodeIndex b);

        /**
         * @brief Returns the canonical representative of an element's class.
         * @throws std::out_of_range If the index was never added.
         */
        NodeIndex root(NodeIndex id) const;

        bool connected(NodeIndex a, NodeIndex b) const { return root(a) == root(b); }

        size_t size() const { return m_parent.size(); }

    private:
        void check(NodeIndex id) const;
        NodeIndex compress(NodeIndex id);

        std::vector<NodeIndex> m_parent;
        std::vector<uint8_t> m_rank;
    };

}
