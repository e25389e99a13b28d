#pragma once

#include <chrono>
#include <deque>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>

namespace finbot_core {

struct ErrorRecord {
  std::chrono::system_clock::time_point timestamp;
  std::string error;
};

// Session-wide counters shared by every request thread
class MetricsCollector {
 public:
  static constexpr size_t kMaxRecentErrors = 50;

  MetricsCollector();

  void record_query(std::chrono::milliseconds response_time,
                    bool is_jailbreak = false,
                    bool is_out_of_domain = false);
  void record_error(const std::string &error);

  nlohmann::json session_stats() const;
  nlohmann::json recent_errors() const;
  void print_session_stats() const;

  size_t query_count() const;
  size_t error_count() const;

  static std::string format_timestamp(const std::chrono::system_clock::time_point &tp);

 private:
  mutable std::mutex mutex_;
  std::chrono::system_clock::time_point session_start_;
  std::chrono::steady_clock::time_point session_start_steady_;
  size_t query_count_ = 0;
  double total_response_ms_ = 0.0;
  size_t jailbreak_attempts_ = 0;
  size_t out_of_domain_queries_ = 0;
  size_t error_count_ = 0;
  std::deque<ErrorRecord> recent_errors_;
};

}  // namespace finbot_core
