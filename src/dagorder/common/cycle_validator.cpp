/**
 * @file cycle_validator.cpp
 */
#include "dagorder/common/cycle_validator.hpp"
#include "dagorder/common/dag_format.hpp"

#include <algorithm>

namespace dagorder
{

CycleValidator::CycleValidator(const EdgeStore& store)
    : m_store(store)
{
}

CycleReport CycleValidator::run() const
{
    CycleReport report;
    std::set<NodeId> clean;

    for (const auto& entry : m_store.adjacency())
    {
        const NodeId& id = entry.first;
        if (clean.count(id) > 0)
        {
            continue;
        }

        m_store.logger()->trace("[action=validate] id={}", id);
        if (search_from(id, clean, report))
        {
            report.found = true;
            report.origin = id;
            m_store.logger()->debug("[action=validate] cycle detected: {}", report.path);
            return report;
        }
    }
    return report;
}

bool CycleValidator::search_from(const NodeId& origin,
                                 std::set<NodeId>& clean,
                                 CycleReport& report) const
{
    // The ids of the frames on the stack form the current branch.
    std::vector<Frame> stack;
    stack.push_back(Frame{origin, m_store.sorted_children_of(origin)});
    if (find_back_edge(stack, report))
    {
        return true;
    }

    while (!stack.empty())
    {
        Frame& top = stack.back();
        if (top.next < top.children.size())
        {
            NodeId child = top.children[top.next];
            ++top.next;
            if (clean.count(child) > 0)
            {
                continue;
            }

            m_store.logger()->trace("[action=validate] from={} visit={}", top.id, child);
            NodeIdList grandchildren = m_store.sorted_children_of(child);
            stack.push_back(Frame{std::move(child), std::move(grandchildren)});
            if (find_back_edge(stack, report))
            {
                return true;
            }
        }
        else
        {
            clean.insert(top.id);
            stack.pop_back();
        }
    }
    return false;
}

bool CycleValidator::find_back_edge(const std::vector<Frame>& stack, CycleReport& report) const
{
    const NodeIdList& frontier = stack.back().children;

    for (size_t i = 0; i < stack.size(); ++i)
    {
        const NodeId& id = stack[i].id;
        if (std::find(frontier.begin(), frontier.end(), id) == frontier.end())
        {
            continue;
        }

        NodeIdList branch;
        branch.reserve(stack.size());
        for (const auto& frame : stack)
        {
            branch.push_back(frame.id);
        }

        report.path = format_cycle_path(branch.cbegin(), branch.cend(), id);
        report.cycle.assign(branch.begin() + static_cast<std::ptrdiff_t>(i), branch.end());
        return true;
    }
    return false;
}

} // namespace dagorder
