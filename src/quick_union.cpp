#include "sluice/quick_union.h"
#include <stdexcept>
#include <string>
#include <utility>

namespace Sluice {

    NodeIndex QuickUnion::add() {
        auto id = static_cast<NodeIndex>(m_parent.size());
        m_parent.push_back(id);
        m_rank.push_back(0);
        return id;
    }

    void QuickUnion::unite(NodeIndex a, NodeIndex b) {
        check(a);
        check(b);

        auto root_a = compress(a);
        auto root_b = compress(b);
        if (root_a == root_b)
            return;

        // Union by rank: attach the shallower tree below the deeper one
        if (m_rank[root_a] < m_rank[root_b])
            std::swap(root_a, root_b);

        m_parent[root_b] = root_a;
        if (m_rank[root_a] == m_rank[root_b])
            m_rank[root_a]++;
    }

    NodeIndex QuickUnion::root(NodeIndex id) const {
        check(id);
        while (m_parent[id] != id)
            id = m_parent[id];
        return id;
    }

    void QuickUnion::check(NodeIndex id) const {
        if (id >= m_parent.size()) {
            throw std::out_of_range("QuickUnion: unknown element " + std::to_string(id));
        }
    }

    NodeIndex QuickUnion::compress(NodeIndex id) {
        auto r = root(id);
        while (m_parent[id] != r) {
            auto next = m_parent[id];
            m_parent[id] = r;
            id = next;
        }
        return r;
    }

}
