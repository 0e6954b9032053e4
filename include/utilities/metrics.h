#pragma once
#ifndef BACKUPFORGE_METRICS_H
#define BACKUPFORGE_METRICS_H
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>

/**
 * @brief Process-wide counters, gauges and histograms with Prometheus text
 *        export.
 */
class MetricsRegistry {
public:
  using Labels = std::map<std::string, std::string>;

  /** Get singleton instance. */
  static MetricsRegistry &instance();

  /** Set gauge value with optional labels. */
  void setGauge(const std::string &name, double value,
                const Labels &labels = {});

  /** Increment counter by value (default 1). */
  void incrementCounter(const std::string &name, double value = 1.0,
                        const Labels &labels = {});

  /** Record observation for a histogram. */
  void observe(const std::string &name, double value,
               const Labels &labels = {});

  /** Current counter value, 0 if never incremented. */
  double counterValue(const std::string &name, const Labels &labels = {}) const;
  double gaugeValue(const std::string &name, const Labels &labels = {}) const;

  /** Serialize all metrics in Prometheus text format, sorted by series. */
  std::string toPrometheus() const;

  /**
   * @brief Clear all stored metrics.
   *
   * Primarily used by unit tests to ensure a clean registry state.
   */
  void reset();

  /** Convert labels map to Prometheus label string. */
  static std::string labelsToString(const Labels &labels);

private:
  MetricsRegistry() = default;
  struct Histogram {
    double sum{0};
    unsigned long count{0};
  };

  mutable std::mutex mtx_;
  std::unordered_map<std::string, double> gauges_;
  std::unordered_map<std::string, double> counters_;
  std::unordered_map<std::string, Histogram> histograms_;
};

/// Metric names emitted by the backup pipeline.
namespace backupforge::metrics {
inline constexpr const char *CHUNKS_TOTAL = "backupforge_chunks_total";
inline constexpr const char *LOGICAL_BYTES = "backupforge_logical_bytes_total";
inline constexpr const char *STORED_BYTES = "backupforge_stored_bytes_total";
inline constexpr const char *STORAGE_RETRIES =
    "backupforge_storage_retries_total";
inline constexpr const char *FILE_FAILURES = "backupforge_file_failures_total";
inline constexpr const char *RESTORE_FAILURES =
    "backupforge_restore_failures_total";
inline constexpr const char *SNAPSHOT_SECONDS =
    "backupforge_snapshot_duration_seconds";
inline constexpr const char *INDEX_ENTRIES = "backupforge_index_entries";
} // namespace backupforge::metrics

#endif // BACKUPFORGE_METRICS_H
