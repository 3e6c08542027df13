/**
 * @file edge_store.hpp
 */
#pragma once
#include "dagorder/common/common.hpp"
#include "dagorder/common/dag_types.hpp"
#include "dagorder/common/dag_exceptions.hpp"

#include <spdlog/logger.h>

namespace dagorder
{

/**
 * @brief Forward-edge storage for a `Dag`.
 *
 * @details
 * `EdgeStore` owns the adjacency map. Every identifier that has been
 * registered, or that appears as the target of an edge, has an entry, which
 * may hold an empty edge list. Node values are not stored here.
 *
 * @par Edge rules
 * - An edge between an ordered pair of identifiers is stored at most once.
 * - Edge lists keep the order in which edges were first added.
 * - There is no removal.
 *
 * @par Thread safety
 * - No internal synchronization.
 * - Concurrent reads (const methods) are safe if no concurrent writes occur.
 */
class EdgeStore
{
public:
    /**
     * @brief Constructor for EdgeStore.
     * @param logger Sink for trace events. Null selects `spdlog::default_logger()`.
     */
    explicit EdgeStore(std::shared_ptr<spdlog::logger> logger = nullptr);

    /**
     * @brief Number of known identifiers (registered nodes and edge endpoints).
     */
    size_t size() const noexcept;

    /**
     * @brief Check whether `id` has an adjacency entry.
     */
    bool contains(const NodeId& id) const noexcept;

    /**
     * @brief Create an empty adjacency entry for `id` if it has none.
     * @note An existing entry is left untouched.
     */
    void ensure_node(const NodeId& id);

    /**
     * @brief Add the edge `from -> to` unless it already exists.
     * @param from Source identifier. Must already have an adjacency entry.
     * @param to Target identifier. An entry is created for it if absent.
     * @throw DagError with `InvariantViolation` if `from` has no entry.
     */
    void add_edge(const NodeId& from, const NodeId& to);

    /**
     * @brief Add `from -> t` for every `t` in `targets`, in order.
     */
    void add_edges(const NodeId& from, const NodeIdList& targets);

    /**
     * @brief Forward edges of `id` in insertion order.
     * @return The edge list, or an empty list if `id` is unknown.
     */
    const NodeIdList& children_of(const NodeId& id) const noexcept;

    /**
     * @brief Forward edges of `id`, sorted ascending.
     */
    NodeIdList sorted_children_of(const NodeId& id) const;

    /**
     * @brief All known identifiers, sorted ascending.
     */
    NodeIdList ids() const;

    const AdjacencyMap& adjacency() const noexcept
    {
        return m_adjacency;
    }

    const std::shared_ptr<spdlog::logger>& logger() const noexcept
    {
        return m_logger;
    }

private:
    std::shared_ptr<spdlog::logger> m_logger;
    AdjacencyMap m_adjacency;
};

} // namespace dagorder
