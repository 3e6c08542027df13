/**
 * @file dag_format.hpp
 * @brief Text rendering of traversal paths, shared by the validator and orderer.
 */
#pragma once
#include "dagorder/common/common.hpp"
#include "dagorder/common/dag_types.hpp"

namespace dagorder
{

/**
 * @brief Render a branch that closes on `closing` as a cycle path.
 *
 * @details
 * The identifiers in `[first, last)` are joined with `" -> "` and followed by
 * `" -> closing"`, e.g. `{A, B, C}` closing on `A` gives `"A -> B -> C -> A"`.
 */
std::string format_cycle_path(NodeIdList::const_iterator first,
                              NodeIdList::const_iterator last,
                              const NodeId& closing);

} // namespace dagorder
