#pragma once

#include "metric.h"
#include <set>
#include <string>
#include <vector>

namespace metricpub {

struct Dimension {
    std::string name;
    std::string value;

    bool operator==(const Dimension& other) const {
        return name == other.name && value == other.value;
    }
    bool operator!=(const Dimension& other) const { return !(*this == other); }
};

// Flatten a collection tree in pre-order: the node's own records, then each child recursively
std::vector<const MetricRecord*> extract_all_records(const MetricCollection& collection);

// Build the dimension list of a collection from its top-level string records whose names are
// in `dimension_names`. Sorted by name, descending, so report order never affects grouping.
std::vector<Dimension> extract_dimensions(const MetricCollection& collection,
                                          const std::set<std::string>& dimension_names);

} // namespace metricpub
