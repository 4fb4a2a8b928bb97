#include "metric.h"

namespace metricpub {

MetricCollector::MetricCollector(std::string name) : name_(std::move(name)) {
}

void MetricCollector::report_metric(const MetricDefinition& metric, int64_t value) {
    records_.emplace_back(metric, MetricValue(value));
}

void MetricCollector::report_metric(const MetricDefinition& metric, double value) {
    records_.emplace_back(metric, MetricValue(value));
}

void MetricCollector::report_metric(const MetricDefinition& metric, std::chrono::nanoseconds value) {
    records_.emplace_back(metric, MetricValue(value));
}

void MetricCollector::report_metric(const MetricDefinition& metric, std::string value) {
    records_.emplace_back(metric, MetricValue(std::move(value)));
}

void MetricCollector::report_metric(const MetricDefinition& metric, bool value) {
    records_.emplace_back(metric, MetricValue(value));
}

MetricCollector& MetricCollector::create_child(const std::string& name) {
    children_.push_back(std::make_unique<MetricCollector>(name));
    return *children_.back();
}

MetricCollection MetricCollector::collect() const {
    return collect(Clock::now());
}

MetricCollection MetricCollector::collect(Clock::time_point creation_time) const {
    std::vector<MetricCollection> children;
    children.reserve(children_.size());
    for (const auto& child : children_) {
        children.push_back(child->collect(creation_time));
    }
    return MetricCollection(name_, creation_time, records_, std::move(children));
}

} // namespace metricpub
