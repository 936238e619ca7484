#include "apisim/monitor/Histogram.h"
#include "apisim/common/Logger.h"

#include <json/json.h>

#include <algorithm>
#include <cmath>
#include <utility>

namespace apisim {
namespace monitor {

Histogram::Histogram(std::string name, std::string unit, std::string description, std::vector<double> bounds)
    : name_(std::move(name)),
      unit_(std::move(unit)),
      description_(std::move(description)),
      bounds_(std::move(bounds)) {}

std::vector<double> Histogram::SecondsBounds() {
    return {0.005, 0.01, 0.025, 0.05, 0.1, 0.25, 0.5, 1.0, 2.5, 5.0, 10.0, 30.0};
}

std::vector<double> Histogram::TokenBounds() {
    return {10, 50, 100, 250, 500, 1000, 2500, 5000, 10000, 25000, 50000, 100000};
}

bool Histogram::Record(double value, const Attributes& attributes) {
    if (!std::isfinite(value)) {
        LOG_WARN << "Dropping non-finite observation for " << name_;
        return false;
    }

    const size_t bucket = static_cast<size_t>(
        std::lower_bound(bounds_.begin(), bounds_.end(), value) - bounds_.begin());

    std::lock_guard<std::mutex> lock(mutex_);
    Series& s = series_[attributes];
    if (s.bucketCounts.empty()) s.bucketCounts.assign(bounds_.size() + 1, 0);
    if (s.count == 0) {
        s.min = value;
        s.max = value;
    } else {
        s.min = std::min(s.min, value);
        s.max = std::max(s.max, value);
    }
    s.count++;
    s.sum += value;
    s.bucketCounts[bucket]++;
    return true;
}

std::optional<Histogram::Series> Histogram::Find(const Attributes& attributes) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = series_.find(attributes);
    if (it == series_.end()) return std::nullopt;
    return it->second;
}

uint64_t Histogram::TotalCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t total = 0;
    for (const auto& kv : series_) total += kv.second.count;
    return total;
}

Json::Value Histogram::ToJson() const {
    Json::Value out(Json::objectValue);
    out["name"] = name_;
    out["unit"] = unit_;
    out["description"] = description_;

    Json::Value bounds(Json::arrayValue);
    for (double b : bounds_) bounds.append(b);
    out["bounds"] = bounds;

    Json::Value series(Json::arrayValue);
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& kv : series_) {
        Json::Value item(Json::objectValue);
        Json::Value attrs(Json::objectValue);
        for (const auto& a : kv.first) attrs[a.first] = a.second;
        item["attributes"] = attrs;
        item["count"] = Json::UInt64(kv.second.count);
        item["sum"] = kv.second.sum;
        item["min"] = kv.second.min;
        item["max"] = kv.second.max;
        Json::Value buckets(Json::arrayValue);
        for (uint64_t c : kv.second.bucketCounts) buckets.append(Json::UInt64(c));
        item["buckets"] = buckets;
        series.append(item);
    }
    out["series"] = series;
    return out;
}

} // namespace monitor
} // namespace apisim
