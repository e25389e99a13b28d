#include "finbot_core/services/metrics_collector.hpp"

#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace finbot_core {

MetricsCollector::MetricsCollector()
    : session_start_(std::chrono::system_clock::now()),
      session_start_steady_(std::chrono::steady_clock::now()) {}

std::string MetricsCollector::format_timestamp(const std::chrono::system_clock::time_point &tp) {
  auto time_t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm_struct = {};
  gmtime_r(&time_t, &tm_struct);
  std::stringstream ss;
  ss << std::put_time(&tm_struct, "%Y-%m-%dT%H:%M:%SZ");
  return ss.str();
}

void MetricsCollector::record_query(std::chrono::milliseconds response_time,
                                    bool is_jailbreak,
                                    bool is_out_of_domain) {
  std::lock_guard<std::mutex> lock(mutex_);
  ++query_count_;
  total_response_ms_ += static_cast<double>(response_time.count());
  if (is_jailbreak) {
    ++jailbreak_attempts_;
  }
  if (is_out_of_domain) {
    ++out_of_domain_queries_;
  }
}

void MetricsCollector::record_error(const std::string &error) {
  std::lock_guard<std::mutex> lock(mutex_);
  ++error_count_;
  recent_errors_.push_back(ErrorRecord{std::chrono::system_clock::now(), error});
  if (recent_errors_.size() > kMaxRecentErrors) {
    recent_errors_.pop_front();
  }
}

nlohmann::json MetricsCollector::session_stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto duration = std::chrono::duration<double>(std::chrono::steady_clock::now() -
                                                session_start_steady_);
  double average_ms = query_count_ == 0 ? 0.0 : total_response_ms_ / query_count_;
  return {
      {"session_duration_seconds", duration.count()},
      {"total_queries", query_count_},
      {"average_response_time_ms", average_ms},
      {"jailbreak_attempts", jailbreak_attempts_},
      {"out_of_domain_queries", out_of_domain_queries_},
      {"error_count", error_count_},
      {"session_start", format_timestamp(session_start_)},
  };
}

nlohmann::json MetricsCollector::recent_errors() const {
  std::lock_guard<std::mutex> lock(mutex_);
  nlohmann::json errors = nlohmann::json::array();
  for (const auto &record : recent_errors_) {
    errors.push_back({{"timestamp", format_timestamp(record.timestamp)}, {"error", record.error}});
  }
  return errors;
}

void MetricsCollector::print_session_stats() const {
  auto stats = session_stats();
  std::cout << "\n===== FINBOT SESSION STATISTICS =====" << std::endl;
  std::cout << "Session Duration: " << std::fixed << std::setprecision(2)
            << stats["session_duration_seconds"].get<double>() << " seconds" << std::endl;
  std::cout << "Total Queries: " << stats["total_queries"].get<size_t>() << std::endl;
  std::cout << "Average Response Time: " << std::setprecision(1)
            << stats["average_response_time_ms"].get<double>() << " ms" << std::endl;
  std::cout << "Jailbreak Attempts: " << stats["jailbreak_attempts"].get<size_t>() << std::endl;
  std::cout << "Out-of-Domain Queries: " << stats["out_of_domain_queries"].get<size_t>()
            << std::endl;
  std::cout << "Errors: " << stats["error_count"].get<size_t>() << std::endl;
  std::cout << "Session Start: " << stats["session_start"].get<std::string>() << std::endl;
  std::cout << "=====================================\n" << std::endl;
}

size_t MetricsCollector::query_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return query_count_;
}

size_t MetricsCollector::error_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return error_count_;
}

}  // namespace finbot_core
