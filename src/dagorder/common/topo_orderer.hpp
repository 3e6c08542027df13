/**
 * @file topo_orderer.hpp
 */
#pragma once
#include "dagorder/common/common.hpp"
#include "dagorder/common/dag_types.hpp"
#include "dagorder/common/dag_exceptions.hpp"
#include "dagorder/common/edge_store.hpp"

namespace dagorder
{

/**
 * @brief Deterministic post-order walk over an `EdgeStore`.
 *
 * @details
 * Produces every known identifier exactly once. An identifier is emitted only
 * after every identifier reachable from it through forward edges, so the
 * result is a reverse topological order of the edge relation. Start
 * identifiers and children are both taken in ascending order, which makes the
 * output depend only on the graph, not on the order edges were declared.
 *
 * @par Precondition
 * The graph must be acyclic. If the walk re-enters an identifier that is still
 * on its current path, `order()` throws `DagCycleError` naming that path.
 *
 * @par Lifetime
 * Holds a reference to the store. The store must outlive the orderer.
 */
class TopoOrderer
{
public:
    explicit TopoOrderer(const EdgeStore& store);

    /**
     * @brief Compute the ordering.
     * @throw DagCycleError if a cycle is walked.
     */
    NodeIdList order() const;

private:
    struct Frame
    {
        NodeId id;
        NodeIdList children;
        size_t next = 0;
    };

    void walk_from(const NodeId& start, std::set<NodeId>& visited, NodeIdList& order) const;

    const EdgeStore& m_store;
};

} // namespace dagorder
