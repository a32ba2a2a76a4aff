#ifndef METRICS_HPP_
#define METRICS_HPP_

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace payments {
namespace observability {

/**
 * Run metrics: counters, gauges and histograms with Prometheus text output.
 * Counters and gauges may carry one label; series are keyed by label value.
 */
class MetricsCollector {
 public:
  MetricsCollector();
  ~MetricsCollector() = default;

  // Counter: monotonically increasing value
  void incrementCounter(const std::string& name, std::uint64_t value = 1);
  void incrementCounter(const std::string& name, const std::string& label,
                        const std::string& label_value, std::uint64_t value = 1);
  std::uint64_t counterValue(const std::string& name,
                             const std::string& label_value = "") const;

  // Gauge: value that can go up and down
  void setGauge(const std::string& name, double value);
  double gaugeValue(const std::string& name) const;

  // Histogram: distribution of values
  void observeHistogram(const std::string& name, double value);
  std::uint64_t histogramCount(const std::string& name) const;

  // Records the elapsed seconds into a histogram when destroyed.
  class Timer {
   public:
    Timer(MetricsCollector& collector, const std::string& name);
    ~Timer();

   private:
    MetricsCollector& collector_;
    std::string name_;
    std::chrono::steady_clock::time_point start_;
  };

  // Export metrics in Prometheus format
  std::string exportMetrics() const;

  // Reset all metrics
  void reset();

 private:
  struct Counter {
    std::string label;
    std::map<std::string, std::uint64_t> series;
  };

  struct HistogramBucket {
    double upper_bound;
    std::uint64_t count{0};
  };

  struct Histogram {
    std::vector<HistogramBucket> buckets;
    std::uint64_t count{0};
    double sum{0.0};
  };

  mutable std::mutex mutex_;
  std::map<std::string, Counter> counters_;
  std::map<std::string, double> gauges_;
  std::map<std::string, Histogram> histograms_;

  // Per-transaction latencies are in the microsecond range.
  static std::vector<double> defaultBuckets();
};

}  // namespace observability
}  // namespace payments

#endif  // METRICS_HPP_
