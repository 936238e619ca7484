#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace Json {
class Value;
}

namespace apisim {
namespace monitor {

// Accumulating histogram with one series per attribute set. Thread-safe.
class Histogram {
public:
    using Attributes = std::map<std::string, std::string>;

    struct Series {
        uint64_t count{0};
        double sum{0.0};
        double min{0.0};
        double max{0.0};
        // bucketCounts[i] counts values <= bounds[i]; the last slot is overflow.
        std::vector<uint64_t> bucketCounts;
    };

    Histogram(std::string name, std::string unit, std::string description, std::vector<double> bounds);

    // Non-finite values are dropped with a warning and false is returned.
    bool Record(double value, const Attributes& attributes);

    std::optional<Series> Find(const Attributes& attributes) const;
    uint64_t TotalCount() const;

    const std::string& name() const { return name_; }
    const std::string& unit() const { return unit_; }
    const std::vector<double>& bounds() const { return bounds_; }

    Json::Value ToJson() const;

    static std::vector<double> SecondsBounds();
    static std::vector<double> TokenBounds();

private:
    const std::string name_;
    const std::string unit_;
    const std::string description_;
    const std::vector<double> bounds_;

    mutable std::mutex mutex_;
    std::map<Attributes, Series> series_;
};

} // namespace monitor
} // namespace apisim
