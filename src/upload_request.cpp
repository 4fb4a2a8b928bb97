#include "upload_request.h"
#include <cmath>
#include <cstdio>
#include <sstream>

namespace metricpub {

namespace {

std::string escape_json(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 2);
    for (char c : s) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    out += buf;
                } else {
                    out += c;
                }
        }
    }
    return out;
}

// Integral values print without a fraction, everything else round-trips
std::string format_number(double value) {
    if (value == std::floor(value) && std::fabs(value) < 1e15) {
        return std::to_string(static_cast<long long>(value));
    }
    std::ostringstream oss;
    oss.precision(17);
    oss << value;
    return oss.str();
}

void append_number_list(std::string& json, const std::vector<double>& list) {
    json += "[";
    for (size_t i = 0; i < list.size(); ++i) {
        if (i > 0) {
            json += ",";
        }
        json += format_number(list[i]);
    }
    json += "]";
}

} // namespace

std::string unit_name(Unit unit) {
    switch (unit) {
        case Unit::MILLISECONDS: return "Milliseconds";
        case Unit::NONE: return "None";
    }
    return "None";
}

std::string to_json(const UploadRequest& request) {
    std::string json = "{\"namespace\":\"" + escape_json(request.namespace_name) + "\",\"metric_data\":[";

    for (size_t i = 0; i < request.metric_data.size(); ++i) {
        const auto& datum = request.metric_data[i];
        if (i > 0) {
            json += ",";
        }

        json += "{\"metric_name\":\"" + escape_json(datum.metric_name) + "\",\"dimensions\":[";
        for (size_t d = 0; d < datum.dimensions.size(); ++d) {
            if (d > 0) {
                json += ",";
            }
            json += "{\"name\":\"" + escape_json(datum.dimensions[d].name) +
                    "\",\"value\":\"" + escape_json(datum.dimensions[d].value) + "\"}";
        }
        json += "],\"unit\":\"" + unit_name(datum.unit) + "\"";
        json += ",\"timestamp\":" + std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(
                    datum.timestamp.time_since_epoch()).count());

        if (datum.statistic_values) {
            const auto& stats = *datum.statistic_values;
            json += ",\"statistic_values\":{\"minimum\":" + format_number(stats.minimum) +
                    ",\"maximum\":" + format_number(stats.maximum) +
                    ",\"sum\":" + format_number(stats.sum) +
                    ",\"sample_count\":" + format_number(stats.sample_count) + "}";
        } else {
            json += ",\"values\":";
            append_number_list(json, datum.values);
            json += ",\"counts\":";
            append_number_list(json, datum.counts);
        }
        json += "}";
    }

    json += "]}";
    return json;
}

} // namespace metricpub
