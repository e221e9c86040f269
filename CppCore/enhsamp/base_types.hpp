/**
 * @brief Aggregator for standard library and common external headers.
 *
 * This header provides a centralized location for foundational STL includes
 * and the formatting headers used for log messages and error strings
 * throughout the library.
 */

#pragma once
// MIT License
// Copyright 2024--present enhsamp developers

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <memory>
#include <numeric>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/ranges.h>
