/**
 * @file common.hpp
 */
#pragma once
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <limits>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace stepflow
{

/**
 * @brief Value type carried by state channels, node inputs, node updates,
 * interrupt payloads and resume values.
 *
 * @details
 * Every value that flows through the engine must be JSON-serializable so that
 * checkpoints can be persisted and restored in another process.
 */
using Value = nlohmann::json;

} // namespace stepflow
