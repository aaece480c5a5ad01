#pragma once

#include <string>
#include <map>
#include <mutex>
#include <cstdint>

namespace spidercore {

class Metrics {
public:
    static Metrics& instance();

    // Counter metrics
    void increment_counter(const std::string& name, int64_t value = 1);
    int64_t get_counter(const std::string& name) const;

    // Gauge metrics
    void set_gauge(const std::string& name, double value);
    double get_gauge(const std::string& name) const;

    void reset();

    // Get all metrics as Prometheus format
    std::string to_prometheus() const;

    // Get metrics as JSON
    std::string to_json() const;

private:
    Metrics() = default;

    std::map<std::string, int64_t> counters_;
    std::map<std::string, double> gauges_;
    mutable std::mutex mutex_;
};

} // namespace spidercore
