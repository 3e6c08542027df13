/**
 * @file dag.hpp
 * @brief Definition of the Dag class template.
 * @see dag.inline.hpp for implementations of the member methods.
 */
#pragma once
#include "dagorder/common/common.hpp"
#include "dagorder/common/dag_types.hpp"
#include "dagorder/common/dag_exceptions.hpp"
#include "dagorder/common/dag_options.hpp"
#include "dagorder/common/edge_store.hpp"
#include "dagorder/common/cycle_validator.hpp"
#include "dagorder/common/topo_orderer.hpp"

namespace dagorder
{

/**
 * @brief A directed acyclic graph of identified nodes carrying values.
 *
 * @details
 * `Dag` registers nodes under unique identifiers, records ordering
 * constraints between them as forward edges, detects cycles, and computes a
 * deterministic ordering of every known identifier.
 *
 * @par Construction workflow
 * 1. Create a `Dag` instance.
 * 2. Add nodes via `add_node()`, each with its predecessor and successor
 *    identifiers. A predecessor `p` adds the edge `p -> id`; a successor `s`
 *    adds the edge `id -> s`. Identifiers that only appear in these lists
 *    become known edge endpoints without a value.
 * 3. Call `validate()` (or `has_cycle()`) before trusting the graph.
 * 4. Call `order()` to obtain the sequence. Every identifier appears after all
 *    identifiers reachable from it.
 *
 * @par Validation cache
 * The result of the latest validation pass (the cycle set and the validated
 * flag) is kept on the instance. Every successful `add_node()` invalidates it.
 * Insertion itself never validates.
 *
 * @par Reference stability
 * Insertion only adds adjacency entries and appends to edge lists, so a
 * reference returned by `children_of()` for a known identifier stays valid
 * for the lifetime of the instance.
 *
 * @tparam Value The node payload type. The graph never inspects it.
 *
 * @par Thread safety
 * - No internal synchronization.
 * - `has_cycle()` and `validate()` update the cache and count as writes.
 * - Concurrent const calls are safe if no concurrent writes occur.
 */
template <typename Value>
class Dag
{
public:
    using value_type = Value;

    explicit Dag(DagOptions options = {});

    /**
     * @brief Add a node with a value and its ordering constraints.
     * @param id Identifier of the node. Must not already carry a value.
     * @param value The payload attached to `id`.
     * @param predecessors Identifiers `p` for which the edge `p -> id` is added.
     * @param successors Identifiers `s` for which the edge `id -> s` is added.
     * @throw DagError with `DuplicateNode` if `id` already has a value. Nothing
     *        is modified in that case.
     */
    void add_node(const NodeId& id,
                  Value value,
                  const NodeIdList& predecessors = {},
                  const NodeIdList& successors = {});

    /**
     * @brief Get the value attached to `id`.
     * @throw DagError with `NodeNotFound` if `id` has no value, including the
     *        case where it is only known as an edge endpoint.
     */
    const Value& node(const NodeId& id) const;

    /**
     * @brief Get the value attached to `id`, or nullptr if there is none.
     */
    const Value* try_node(const NodeId& id) const noexcept;

    /**
     * @brief Check whether `id` is known, as a node or as an edge endpoint.
     */
    bool contains(const NodeId& id) const noexcept
    {
        return m_store.contains(id);
    }

    /**
     * @brief Check whether a value was attached to `id`.
     */
    bool has_value(const NodeId& id) const noexcept
    {
        return m_values.find(id) != m_values.end();
    }

    /**
     * @brief Number of known identifiers.
     */
    size_t size() const noexcept
    {
        return m_store.size();
    }

    /**
     * @brief Forward edges of `id` in the order they were declared.
     * @return Empty if `id` is unknown or has no outgoing edges.
     */
    const NodeIdList& children_of(const NodeId& id) const noexcept
    {
        return m_store.children_of(id);
    }

    /**
     * @brief All known identifiers, sorted ascending.
     */
    NodeIdList ids() const
    {
        return m_store.ids();
    }

    /**
     * @brief Search the graph for a cycle and cache the result.
     * @throw DagCycleError describing the first cycle found.
     */
    void validate();

    /**
     * @brief Check whether `id` is part of a detected cycle.
     *
     * @details
     * Runs a full validation first if the graph changed since the last one.
     * Never throws for a cyclic graph.
     */
    bool has_cycle(const NodeId& id);

    /**
     * @brief Compute the deterministic ordering of all known identifiers.
     * @pre The graph is acyclic. Call `validate()` first.
     * @throw DagCycleError if the walk runs into a cycle.
     */
    NodeIdList order() const;

    /**
     * @brief True if a validation pass ran since the last mutation.
     */
    bool is_validated() const noexcept
    {
        return m_validated;
    }

    const DagOptions& options() const noexcept
    {
        return m_options;
    }

private:
    /// Run the validator and refresh the cycle set and validated flag.
    CycleReport run_validation();

    DagOptions m_options;
    EdgeStore m_store;
    std::map<NodeId, Value> m_values;
    std::set<NodeId> m_cycles;
    bool m_validated = false;
};

} // namespace dagorder
