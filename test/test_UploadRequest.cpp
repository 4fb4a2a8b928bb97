#define BOOST_TEST_MODULE test_UploadRequest
#include <boost/test/unit_test.hpp>

#include "upload_request.h"

using namespace metricpub;

namespace {

Clock::time_point at_millis(int64_t ms) {
    return Clock::time_point(std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(ms)));
}

} // namespace

BOOST_AUTO_TEST_CASE(unit_names) {
    BOOST_CHECK_EQUAL(unit_name(Unit::NONE), "None");
    BOOST_CHECK_EQUAL(unit_name(Unit::MILLISECONDS), "Milliseconds");
}

BOOST_AUTO_TEST_CASE(summary_datum_json) {
    MetricDatum datum;
    datum.metric_name = "ApiCallDuration";
    datum.dimensions = {{"ServiceId", "S3"}};
    datum.unit = Unit::MILLISECONDS;
    datum.timestamp = at_millis(1600000020000);
    datum.statistic_values = StatisticSet{1, 4, 14.5, 5};

    UploadRequest request{"MetricPub/Client", {datum}};

    BOOST_CHECK_EQUAL(to_json(request),
                      "{\"namespace\":\"MetricPub/Client\",\"metric_data\":["
                      "{\"metric_name\":\"ApiCallDuration\","
                      "\"dimensions\":[{\"name\":\"ServiceId\",\"value\":\"S3\"}],"
                      "\"unit\":\"Milliseconds\",\"timestamp\":1600000020000,"
                      "\"statistic_values\":{\"minimum\":1,\"maximum\":4,\"sum\":14.5,\"sample_count\":5}}]}");
}

BOOST_AUTO_TEST_CASE(detailed_datum_json) {
    MetricDatum datum;
    datum.metric_name = "MaxConcurrency";
    datum.timestamp = at_millis(60000);
    datum.values = {-2, 0.5, 3};
    datum.counts = {1, 2, 1};

    UploadRequest request{"ns", {datum}};

    BOOST_CHECK_EQUAL(to_json(request),
                      "{\"namespace\":\"ns\",\"metric_data\":["
                      "{\"metric_name\":\"MaxConcurrency\",\"dimensions\":[],"
                      "\"unit\":\"None\",\"timestamp\":60000,"
                      "\"values\":[-2,0.5,3],\"counts\":[1,2,1]}]}");
}

BOOST_AUTO_TEST_CASE(strings_are_escaped) {
    MetricDatum datum;
    datum.metric_name = "Quote\"Back\\slash";
    datum.dimensions = {{"Tab", "a\tb\n"}};
    datum.timestamp = at_millis(0);
    datum.statistic_values = StatisticSet{0, 0, 0, 1};

    std::string json = to_json(UploadRequest{"n", {datum}});

    BOOST_CHECK(json.find("\"metric_name\":\"Quote\\\"Back\\\\slash\"") != std::string::npos);
    BOOST_CHECK(json.find("\"value\":\"a\\tb\\n\"") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(empty_request) {
    UploadRequest request{"ns", {}};
    BOOST_CHECK(request.empty());
    BOOST_CHECK_EQUAL(to_json(request), "{\"namespace\":\"ns\",\"metric_data\":[]}");
}
