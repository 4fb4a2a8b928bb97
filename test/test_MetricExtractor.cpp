#define BOOST_TEST_MODULE test_MetricExtractor
#include <boost/test/unit_test.hpp>

#include "core_metrics.h"
#include "metric_extractor.h"

using namespace metricpub;

BOOST_AUTO_TEST_CASE(all_records_are_extracted_in_pre_order) {
    MetricCollector call("ApiCall");
    call.report_metric(core_metrics::SERVICE_ID, "S3");
    auto& attempt1 = call.create_child("ApiCallAttempt");
    attempt1.report_metric(core_metrics::HTTP_STATUS_CODE, 503);
    attempt1.create_child("HttpClient").report_metric(core_metrics::MAX_CONCURRENCY, 50);
    auto& attempt2 = call.create_child("ApiCallAttempt");
    attempt2.report_metric(core_metrics::HTTP_STATUS_CODE, 200);
    call.report_metric(core_metrics::RETRY_COUNT, 1);

    auto collection = call.collect();
    auto records = extract_all_records(collection);

    BOOST_REQUIRE_EQUAL(records.size(), 5);
    BOOST_CHECK_EQUAL(records[0]->metric.name, "ServiceId");
    BOOST_CHECK_EQUAL(records[1]->metric.name, "RetryCount");
    BOOST_CHECK_EQUAL(std::get<int64_t>(records[2]->value), 503);
    BOOST_CHECK_EQUAL(records[3]->metric.name, "MaxConcurrency");
    BOOST_CHECK_EQUAL(std::get<int64_t>(records[4]->value), 200);
}

BOOST_AUTO_TEST_CASE(children_share_the_parent_creation_time) {
    MetricCollector call("ApiCall");
    call.create_child("ApiCallAttempt").create_child("HttpClient");

    auto now = Clock::now();
    auto collection = call.collect(now);
    BOOST_CHECK(collection.creation_time() == now);
    BOOST_CHECK(collection.children().at(0).creation_time() == now);
    BOOST_CHECK(collection.children().at(0).children().at(0).creation_time() == now);
}

BOOST_AUTO_TEST_CASE(dimensions_come_from_top_level_strings_only) {
    MetricCollector call("ApiCall");
    call.report_metric(core_metrics::SERVICE_ID, "DynamoDB");
    call.report_metric(core_metrics::RETRY_COUNT, 2);
    call.create_child("ApiCallAttempt").report_metric(core_metrics::OPERATION_NAME, "GetItem");

    auto dimensions = extract_dimensions(call.collect(), {"ServiceId", "OperationName", "RetryCount"});

    BOOST_REQUIRE_EQUAL(dimensions.size(), 1);
    BOOST_CHECK_EQUAL(dimensions[0].name, "ServiceId");
    BOOST_CHECK_EQUAL(dimensions[0].value, "DynamoDB");
}

BOOST_AUTO_TEST_CASE(dimensions_are_sorted_by_name_descending) {
    MetricCollector first("ApiCall");
    first.report_metric(core_metrics::OPERATION_NAME, "GetItem");
    first.report_metric(core_metrics::SERVICE_ID, "DynamoDB");

    MetricCollector second("ApiCall");
    second.report_metric(core_metrics::SERVICE_ID, "DynamoDB");
    second.report_metric(core_metrics::OPERATION_NAME, "GetItem");

    std::set<std::string> names{"ServiceId", "OperationName"};
    auto a = extract_dimensions(first.collect(), names);
    auto b = extract_dimensions(second.collect(), names);

    BOOST_REQUIRE_EQUAL(a.size(), 2);
    BOOST_CHECK_EQUAL(a[0].name, "ServiceId");
    BOOST_CHECK_EQUAL(a[1].name, "OperationName");
    BOOST_CHECK(a == b);
}

BOOST_AUTO_TEST_CASE(unconfigured_dimensions_are_empty) {
    MetricCollector call("ApiCall");
    call.report_metric(core_metrics::SERVICE_ID, "S3");

    BOOST_CHECK(extract_dimensions(call.collect(), {}).empty());
}
