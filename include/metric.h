#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace metricpub {

enum class MetricCategory {
    CORE,
    HTTP_CLIENT,
    CUSTOM,
    ALL  // Wildcard, only meaningful in a set of enabled categories
};

// Ordered from most to least verbose
enum class MetricLevel {
    TRACE,
    INFO,
    ERROR
};

// True when a publisher configured at `configured` reports metrics of `level`
inline bool level_includes(MetricLevel configured, MetricLevel level) {
    return static_cast<int>(configured) <= static_cast<int>(level);
}

enum class ValueType {
    INTEGER,
    DOUBLE,
    DURATION,
    STRING,
    BOOLEAN
};

using Clock = std::chrono::system_clock;

struct MetricDefinition {
    std::string name;
    ValueType value_type;
    std::set<MetricCategory> categories;
    MetricLevel level;

    MetricDefinition(std::string metric_name, ValueType type,
                     std::set<MetricCategory> metric_categories,
                     MetricLevel metric_level = MetricLevel::INFO)
        : name(std::move(metric_name)), value_type(type),
          categories(std::move(metric_categories)), level(metric_level) {}

    bool operator==(const MetricDefinition& other) const {
        return name == other.name && value_type == other.value_type;
    }
    bool operator!=(const MetricDefinition& other) const { return !(*this == other); }
};

using MetricValue = std::variant<int64_t, double, std::chrono::nanoseconds, std::string, bool>;

struct MetricRecord {
    MetricDefinition metric;
    MetricValue value;

    MetricRecord(MetricDefinition def, MetricValue v)
        : metric(std::move(def)), value(std::move(v)) {}
};

// Immutable tree of records produced by one collector and its children
class MetricCollection {
public:
    MetricCollection(std::string name, Clock::time_point creation_time,
                     std::vector<MetricRecord> records,
                     std::vector<MetricCollection> children)
        : name_(std::move(name)), creation_time_(creation_time),
          records_(std::move(records)), children_(std::move(children)) {}

    const std::string& name() const { return name_; }
    Clock::time_point creation_time() const { return creation_time_; }
    const std::vector<MetricRecord>& records() const { return records_; }
    const std::vector<MetricCollection>& children() const { return children_; }

private:
    std::string name_;
    Clock::time_point creation_time_;
    std::vector<MetricRecord> records_;
    std::vector<MetricCollection> children_;
};

// Builder used by instrumented code to report records into a collection tree.
// Not thread-safe: one collector per in-flight call.
class MetricCollector {
public:
    explicit MetricCollector(std::string name);

    const std::string& name() const { return name_; }

    void report_metric(const MetricDefinition& metric, int64_t value);
    void report_metric(const MetricDefinition& metric, int value) { report_metric(metric, int64_t{value}); }
    void report_metric(const MetricDefinition& metric, double value);
    void report_metric(const MetricDefinition& metric, std::chrono::nanoseconds value);
    void report_metric(const MetricDefinition& metric, std::string value);
    void report_metric(const MetricDefinition& metric, const char* value) { report_metric(metric, std::string(value)); }
    void report_metric(const MetricDefinition& metric, bool value);

    // Child collectors are owned by the parent and collected with it
    MetricCollector& create_child(const std::string& name);

    // Snapshot the collector into a collection stamped with the current time
    MetricCollection collect() const;

    // Same as collect(), with an explicit creation time
    MetricCollection collect(Clock::time_point creation_time) const;

private:
    std::string name_;
    std::vector<MetricRecord> records_;
    std::vector<std::unique_ptr<MetricCollector>> children_;
};

} // namespace metricpub
