#pragma once

#include "metric.h"
#include "metric_extractor.h"
#include <optional>
#include <string>
#include <vector>

namespace metricpub {

enum class Unit {
    NONE,
    MILLISECONDS
};

std::string unit_name(Unit unit);

struct StatisticSet {
    double minimum;
    double maximum;
    double sum;
    double sample_count;

    bool operator==(const StatisticSet& other) const {
        return minimum == other.minimum && maximum == other.maximum &&
               sum == other.sum && sample_count == other.sample_count;
    }
};

// One entry of an upload request. Either statistic_values is set (summary) or
// values/counts are parallel lists of the same length (detailed).
struct MetricDatum {
    std::string metric_name;
    std::vector<Dimension> dimensions;
    Unit unit = Unit::NONE;
    Clock::time_point timestamp;
    std::optional<StatisticSet> statistic_values;
    std::vector<double> values;
    std::vector<double> counts;
};

struct UploadRequest {
    std::string namespace_name;
    std::vector<MetricDatum> metric_data;

    size_t size() const { return metric_data.size(); }
    bool empty() const { return metric_data.empty(); }
};

// Wire form handed to the transports
std::string to_json(const UploadRequest& request);

} // namespace metricpub
