#pragma once

#include <chrono>
#include <functional>

#include <nlohmann/json.hpp>

namespace nekrobox {

using json = nlohmann::json;
using Clock = std::chrono::system_clock;
using Timestamp = std::chrono::time_point<Clock>;

/// Source of wall-clock time; replaceable in tests.
using ClockFn = std::function<Timestamp()>;

/// Absolute point after which in-flight sandbox work must be abandoned.
using Deadline = std::chrono::steady_clock::time_point;

} // namespace nekrobox
