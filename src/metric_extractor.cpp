#include "metric_extractor.h"
#include <algorithm>

namespace metricpub {

namespace {

void append_records(const MetricCollection& collection,
                    std::vector<const MetricRecord*>& extracted) {
    for (const auto& record : collection.records()) {
        extracted.push_back(&record);
    }
    for (const auto& child : collection.children()) {
        append_records(child, extracted);
    }
}

} // namespace

std::vector<const MetricRecord*> extract_all_records(const MetricCollection& collection) {
    std::vector<const MetricRecord*> result;
    append_records(collection, result);
    return result;
}

std::vector<Dimension> extract_dimensions(const MetricCollection& collection,
                                          const std::set<std::string>& dimension_names) {
    std::vector<Dimension> result;
    for (const auto& record : collection.records()) {
        if (dimension_names.count(record.metric.name) == 0) {
            continue;
        }
        const auto* value = std::get_if<std::string>(&record.value);
        if (value == nullptr) {
            continue;
        }
        result.push_back(Dimension{record.metric.name, *value});
    }

    // Descending, so that ServiceId sorts before OperationName with the default dimensions
    std::stable_sort(result.begin(), result.end(),
                     [](const Dimension& a, const Dimension& b) { return a.name > b.name; });
    return result;
}

} // namespace metricpub
