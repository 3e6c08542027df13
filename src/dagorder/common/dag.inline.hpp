/**
 * @file dag.inline.hpp
 * @brief Implementations for the member methods of the Dag class template.
 */
#pragma once
#include "dagorder/common/dag.hpp"

namespace dagorder
{

template <typename Value>
Dag<Value>::Dag(DagOptions options)
    : m_options(std::move(options))
    , m_store(m_options.logger)
{
}

// ============================================================================
// Store
// ============================================================================

template <typename Value>
void Dag<Value>::add_node(const NodeId& id,
                          Value value,
                          const NodeIdList& predecessors,
                          const NodeIdList& successors)
{
    if (has_value(id))
    {
        throw DagError(
            DagErrorCode::DuplicateNode,
            "duplicate node: adding node id \"" + id + "\"");
    }

    m_store.logger()->trace("[action=add_node] id={} predecessors={} successors={}",
                            id, predecessors.size(), successors.size());
    for (const auto& pred : predecessors)
    {
        m_store.ensure_node(pred);
        m_store.add_edge(pred, id);
    }
    m_store.ensure_node(id);
    m_store.add_edges(id, successors);
    m_values.emplace(id, std::move(value));
    m_validated = false;
}

template <typename Value>
const Value& Dag<Value>::node(const NodeId& id) const
{
    auto it = m_values.find(id);
    if (it == m_values.end())
    {
        throw DagError(
            DagErrorCode::NodeNotFound,
            "node not found: \"" + id + "\"");
    }
    return it->second;
}

template <typename Value>
const Value* Dag<Value>::try_node(const NodeId& id) const noexcept
{
    auto it = m_values.find(id);
    return it == m_values.end() ? nullptr : &it->second;
}

// ============================================================================
// Validation
// ============================================================================

template <typename Value>
CycleReport Dag<Value>::run_validation()
{
    CycleReport report = CycleValidator(m_store).run();

    m_cycles.clear();
    if (report.found)
    {
        m_cycles.insert(report.cycle.begin(), report.cycle.end());
        m_cycles.insert(report.origin);
    }
    m_validated = true;
    return report;
}

template <typename Value>
void Dag<Value>::validate()
{
    CycleReport report = run_validation();
    if (report.found)
    {
        throw DagCycleError(std::move(report.path), std::move(report.cycle));
    }
}

template <typename Value>
bool Dag<Value>::has_cycle(const NodeId& id)
{
    if (!m_validated)
    {
        m_store.logger()->trace("[action=has_cycle] id={} revalidate", id);
        if (!run_validation().found)
        {
            return false;
        }
    }
    return m_cycles.count(id) > 0;
}

// ============================================================================
// Ordering
// ============================================================================

template <typename Value>
NodeIdList Dag<Value>::order() const
{
    return TopoOrderer(m_store).order();
}

} // namespace dagorder
