/**
 * @file dag_format.cpp
 */
#include "dagorder/common/dag_format.hpp"

namespace dagorder
{

std::string format_cycle_path(NodeIdList::const_iterator first,
                              NodeIdList::const_iterator last,
                              const NodeId& closing)
{
    std::string path;
    for (auto it = first; it != last; ++it)
    {
        path += *it;
        path += " -> ";
    }
    path += closing;
    return path;
}

} // namespace dagorder
