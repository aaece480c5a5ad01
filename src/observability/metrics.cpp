#include "metrics.h"
#include <nlohmann/json.hpp>
#include <sstream>

namespace spidercore {

Metrics& Metrics::instance() {
    static Metrics instance;
    return instance;
}

void Metrics::increment_counter(const std::string& name, int64_t value) {
    std::lock_guard<std::mutex> lock(mutex_);
    counters_[name] += value;
}

int64_t Metrics::get_counter(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = counters_.find(name);
    if (it != counters_.end()) {
        return it->second;
    }
    return 0;
}

void Metrics::set_gauge(const std::string& name, double value) {
    std::lock_guard<std::mutex> lock(mutex_);
    gauges_[name] = value;
}

double Metrics::get_gauge(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = gauges_.find(name);
    if (it != gauges_.end()) {
        return it->second;
    }
    return 0.0;
}

void Metrics::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    counters_.clear();
    gauges_.clear();
}

std::string Metrics::to_prometheus() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream oss;

    for (const auto& [name, value] : counters_) {
        oss << "# TYPE " << name << " counter\n";
        oss << name << " " << value << "\n";
    }

    for (const auto& [name, value] : gauges_) {
        oss << "# TYPE " << name << " gauge\n";
        oss << name << " " << value << "\n";
    }

    return oss.str();
}

std::string Metrics::to_json() const {
    std::lock_guard<std::mutex> lock(mutex_);
    nlohmann::json json;
    json["counters"] = nlohmann::json::object();
    json["gauges"] = nlohmann::json::object();
    for (const auto& [name, value] : counters_) {
        json["counters"][name] = value;
    }
    for (const auto& [name, value] : gauges_) {
        json["gauges"][name] = value;
    }
    return json.dump();
}

} // namespace spidercore
