#pragma once

#include <chrono>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"

namespace aggregator::service {

// Logs the outcome and latency of one RPC; exceptions are rethrown for the transport to map.
template <typename Fn>
auto ObserveRpc(std::string_view route, Fn&& fn) {
  const auto started_at = std::chrono::steady_clock::now();
  const auto elapsed_us = [&] {
    return static_cast<int64_t>(std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      AGGREGATOR_LOG_DEBUG("RPC ok", {observability::StringField("route", route), observability::IntField("elapsed_us", elapsed_us())});
      return;
    } else {
      auto result = fn();
      AGGREGATOR_LOG_DEBUG("RPC ok", {observability::StringField("route", route), observability::IntField("elapsed_us", elapsed_us())});
      return result;
    }
  } catch (const std::exception& ex) {
    AGGREGATOR_LOG_WARN("RPC failed", {observability::StringField("route", route), observability::StringField("error", ex.what()),
                                       observability::IntField("elapsed_us", elapsed_us())});
    throw;
  }
}

} // namespace aggregator::service
