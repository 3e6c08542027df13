/**
 * @file common.hpp
 */
#pragma once
#include <cstddef>
#include <exception>
#include <map>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
