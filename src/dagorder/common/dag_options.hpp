/**
 * @file dag_options.hpp
 */
#pragma once
#include "dagorder/common/common.hpp"

#include <spdlog/logger.h>

namespace dagorder
{

/**
 * @brief Construction options for `Dag`.
 *
 * @details
 * Engine events are written at trace level to `logger`. A null logger means
 * `spdlog::default_logger()`.
 */
struct DagOptions
{
    std::shared_ptr<spdlog::logger> logger;
};

} // namespace dagorder
