/**
 * @file dag_exceptions.hpp
 */
#pragma once
#include "dagorder/common/common.hpp"
#include "dagorder/common/dag_types.hpp"

namespace dagorder
{

/**
 * @brief What went wrong in a Dag call.
 */
enum class DagErrorCode
{
    DuplicateNode,      ///< A value was already attached to the identifier.
    NodeNotFound,       ///< No value is attached to the identifier.
    CycleDetected,      ///< The declared edges cannot be ordered.
    InvariantViolation  ///< Internal edge-store inconsistency; a library bug.
};

/**
 * @brief Base exception for every failure reported by this library.
 *
 * @details
 * `add_node()` only fails with `DuplicateNode`, and leaves the graph untouched
 * when it does. `node()` fails with `NodeNotFound` even when the identifier is
 * known as an edge endpoint. Cycles are always reported through the
 * `DagCycleError` subclass, so a handler that only needs the code can catch
 * `DagError` and one that needs the path can catch `DagCycleError`.
 */
class DagError : public std::exception
{
public:
    DagError(DagErrorCode code, std::string message)
        : m_code(code)
        , m_message(std::move(message))
    {
    }

    DagErrorCode code() const noexcept
    {
        return m_code;
    }

    const char* what() const noexcept override
    {
        return m_message.c_str();
    }

private:
    DagErrorCode m_code;
    std::string m_message;
};

/**
 * @brief Exception thrown when a cycle is found in the graph.
 *
 * @details
 * Carries the human-readable path of the cycle as it was traversed, for
 * example `"A -> B -> C -> A"`, and the identifiers on that cycle in
 * traversal order.
 */
class DagCycleError : public DagError
{
public:
    DagCycleError(std::string path, NodeIdList members)
        : DagError(DagErrorCode::CycleDetected, "cycle detected: " + path)
        , m_path(std::move(path))
        , m_members(std::move(members))
    {
    }

    /**
     * @brief The traversal path that closes the cycle.
     */
    const std::string& path() const noexcept
    {
        return m_path;
    }

    /**
     * @brief The identifiers on the cycle, in traversal order.
     */
    const NodeIdList& members() const noexcept
    {
        return m_members;
    }

private:
    std::string m_path;
    NodeIdList m_members;
};

} // namespace dagorder
