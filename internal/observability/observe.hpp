#pragma once

#include <chrono>
#include <exception>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace infragraph::observability {

// Caller-side outcomes stay below error level; only storage and payload
// failures are errors.
inline spdlog::level::level_enum FailureLevel(const std::exception& ex) {
  if (dynamic_cast<const util::NotFound*>(&ex)) {
    return spdlog::level::debug;
  }
  if (dynamic_cast<const util::InvalidArgument*>(&ex) || dynamic_cast<const util::InvalidState*>(&ex) ||
      dynamic_cast<const util::AlreadyExists*>(&ex) || dynamic_cast<const util::Conflict*>(&ex)) {
    return spdlog::level::warn;
  }
  return spdlog::level::err;
}

/*
  Runs fn inside a span, records count/latency under `operation` and logs
  failures at FailureLevel() before rethrowing them unchanged.
*/
template <typename Fn>
auto ObserveOperation(std::string_view operation, std::string_view subject_id, Fn&& fn) {
  SpanScope span(operation);
  if (!subject_id.empty()) {
    span.SetAttribute("object.id", subject_id);
  }

  const auto started_at = std::chrono::steady_clock::now();
  const auto finish     = [&](bool success) {
    Metrics::Instance().RecordOperation(operation, success);
    Metrics::Instance().ObserveOperationLatencyMs(operation,
                                                  std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      finish(true);
      return;
    } else {
      auto result = fn();
      finish(true);
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    Log(FailureLevel(ex), "operation failed",
        {StringField("operation", operation), StringField("object_id", subject_id), StringField("error", ex.what())});
    finish(false);
    throw;
  }
}

} // namespace infragraph::observability
