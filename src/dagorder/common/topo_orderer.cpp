/**
 * @file topo_orderer.cpp
 */
#include "dagorder/common/topo_orderer.hpp"
#include "dagorder/common/dag_format.hpp"

#include <algorithm>

namespace dagorder
{

TopoOrderer::TopoOrderer(const EdgeStore& store)
    : m_store(store)
{
}

NodeIdList TopoOrderer::order() const
{
    NodeIdList order;
    order.reserve(m_store.size());
    std::set<NodeId> visited;

    for (const auto& entry : m_store.adjacency())
    {
        const NodeId& id = entry.first;
        if (visited.count(id) > 0)
        {
            continue;
        }
        m_store.logger()->trace("[action=order] walk from id={}", id);
        walk_from(id, visited, order);
    }
    return order;
}

void TopoOrderer::walk_from(const NodeId& start, std::set<NodeId>& visited, NodeIdList& order) const
{
    std::vector<Frame> stack;
    std::set<NodeId> on_path;

    stack.push_back(Frame{start, m_store.sorted_children_of(start)});
    on_path.insert(start);

    while (!stack.empty())
    {
        Frame& top = stack.back();
        if (top.next < top.children.size())
        {
            NodeId child = top.children[top.next];
            ++top.next;
            if (visited.count(child) > 0)
            {
                continue;
            }

            if (on_path.count(child) > 0)
            {
                NodeIdList branch;
                for (const auto& frame : stack)
                {
                    branch.push_back(frame.id);
                }
                auto first = std::find(branch.begin(), branch.end(), child);
                NodeIdList cycle(first, branch.end());
                throw DagCycleError(format_cycle_path(first, branch.cend(), child),
                                    std::move(cycle));
            }

            on_path.insert(child);
            NodeIdList grandchildren = m_store.sorted_children_of(child);
            stack.push_back(Frame{std::move(child), std::move(grandchildren)});
        }
        else
        {
            m_store.logger()->trace("[action=order] append id={}", top.id);
            order.push_back(top.id);
            visited.insert(top.id);
            on_path.erase(top.id);
            stack.pop_back();
        }
    }
}

} // namespace dagorder
