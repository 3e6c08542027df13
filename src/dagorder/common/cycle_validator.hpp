/**
 * @file cycle_validator.hpp
 */
#pragma once
#include "dagorder/common/common.hpp"
#include "dagorder/common/dag_types.hpp"
#include "dagorder/common/edge_store.hpp"

namespace dagorder
{

/**
 * @brief Outcome of a validation pass.
 */
struct CycleReport
{
    /// True if a cycle was found.
    bool found = false;

    /// The start identifier whose search found the cycle.
    NodeId origin;

    /// Traversal path closing the cycle, e.g. "A -> B -> C -> A".
    std::string path;

    /// Identifiers on the cycle, in traversal order.
    NodeIdList cycle;
};

/**
 * @brief Depth-first cycle detection over an `EdgeStore`.
 *
 * @details
 * Start identifiers are taken in ascending order. From each start, the search
 * follows forward edges while keeping the current branch. At every node, the
 * node's children are first checked against the branch; a match closes a
 * cycle. Otherwise the children are visited in ascending order. The first
 * cycle found ends the whole pass.
 *
 * A node whose subtree has been fully searched without finding a cycle is
 * remembered for the rest of the pass and not searched again, so each node
 * is expanded at most once per pass.
 *
 * The search uses an explicit frame stack; depth is bounded by memory, not
 * by the call stack.
 *
 * @par Lifetime
 * Holds a reference to the store. The store must outlive the validator and
 * must not be mutated during `run()`.
 */
class CycleValidator
{
public:
    explicit CycleValidator(const EdgeStore& store);

    /**
     * @brief Search the whole graph for a cycle.
     * @return The report for the first cycle found, or a report with
     *         `found == false`.
     */
    CycleReport run() const;

private:
    struct Frame
    {
        NodeId id;
        NodeIdList children;
        size_t next = 0;
    };

    /// Search from one start identifier; fills `report` on success.
    bool search_from(const NodeId& origin, std::set<NodeId>& clean, CycleReport& report) const;

    /// Check the top frame's children against the branch held by `stack`.
    bool find_back_edge(const std::vector<Frame>& stack, CycleReport& report) const;

    const EdgeStore& m_store;
};

} // namespace dagorder
