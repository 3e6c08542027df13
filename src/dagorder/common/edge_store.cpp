/**
 * @file edge_store.cpp
 */
#include "dagorder/common/edge_store.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace dagorder
{

// ============================================================================
// Constructor
// ============================================================================

EdgeStore::EdgeStore(std::shared_ptr<spdlog::logger> logger)
    : m_logger(logger ? std::move(logger) : spdlog::default_logger())
{
}

// ============================================================================
// Query methods
// ============================================================================

size_t EdgeStore::size() const noexcept
{
    return m_adjacency.size();
}

bool EdgeStore::contains(const NodeId& id) const noexcept
{
    return m_adjacency.find(id) != m_adjacency.end();
}

const NodeIdList& EdgeStore::children_of(const NodeId& id) const noexcept
{
    static const NodeIdList empty;
    auto it = m_adjacency.find(id);
    if (it == m_adjacency.end())
    {
        return empty;
    }
    return it->second;
}

NodeIdList EdgeStore::sorted_children_of(const NodeId& id) const
{
    NodeIdList children = children_of(id);
    m_logger->trace("[action=sorted_children_of] id={} count={}", id, children.size());
    std::sort(children.begin(), children.end());
    return children;
}

NodeIdList EdgeStore::ids() const
{
    // std::map keys are already in ascending order.
    NodeIdList result;
    result.reserve(m_adjacency.size());
    for (const auto& entry : m_adjacency)
    {
        result.push_back(entry.first);
    }
    return result;
}

// ============================================================================
// Mutation
// ============================================================================

void EdgeStore::ensure_node(const NodeId& id)
{
    m_adjacency.try_emplace(id);
}

void EdgeStore::add_edge(const NodeId& from, const NodeId& to)
{
    auto it = m_adjacency.find(from);
    if (it == m_adjacency.end())
    {
        throw DagError(
            DagErrorCode::InvariantViolation,
            "internal error: edge list of \"" + from + "\" must exist before adding an edge");
    }

    NodeIdList& edges = it->second;
    if (std::find(edges.begin(), edges.end(), to) == edges.end())
    {
        m_logger->trace("[action=add_edge] from={} to={}", from, to);
        edges.push_back(to);
    }

    // Endpoints are always known, even when they never get a value.
    ensure_node(to);
}

void EdgeStore::add_edges(const NodeId& from, const NodeIdList& targets)
{
    for (const auto& to : targets)
    {
        add_edge(from, to);
    }
}

} // namespace dagorder
