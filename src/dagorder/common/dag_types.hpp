/**
 * @file dag_types.hpp
 */
#pragma once
#include "dagorder/common/common.hpp"

namespace dagorder
{

// ============================================================================
// Identifier type aliases
// ============================================================================

/**
 * @brief Type alias for node identifiers.
 *
 * @details
 * `NodeId` is an opaque, totally ordered token. Ordering is lexicographic, and
 * every deterministic traversal in the library breaks ties by ascending
 * `NodeId`.
 */
using NodeId = std::string;

/**
 * @brief An ordered sequence of node identifiers.
 */
using NodeIdList = std::vector<NodeId>;

/**
 * @brief Forward-edge adjacency lists, keyed by source identifier.
 *
 * @details
 * An ordered map, so that iterating the keys yields identifiers in ascending
 * order. Each edge list keeps insertion order and holds no duplicates.
 */
using AdjacencyMap = std::map<NodeId, NodeIdList>;

} // namespace dagorder
