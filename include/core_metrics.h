#pragma once

#include "metric.h"

namespace metricpub {
namespace core_metrics {

// Per-call metrics reported on the top-level collection
inline const MetricDefinition SERVICE_ID{"ServiceId", ValueType::STRING, {MetricCategory::CORE}};
inline const MetricDefinition OPERATION_NAME{"OperationName", ValueType::STRING, {MetricCategory::CORE}};
inline const MetricDefinition API_CALL_DURATION{"ApiCallDuration", ValueType::DURATION, {MetricCategory::CORE}};
inline const MetricDefinition API_CALL_SUCCESSFUL{"ApiCallSuccessful", ValueType::BOOLEAN, {MetricCategory::CORE}};
inline const MetricDefinition RETRY_COUNT{"RetryCount", ValueType::INTEGER, {MetricCategory::CORE}};

// Per-attempt metrics reported on "ApiCallAttempt" children
inline const MetricDefinition SERVICE_CALL_DURATION{"ServiceCallDuration", ValueType::DURATION, {MetricCategory::CORE}};
inline const MetricDefinition HTTP_STATUS_CODE{"HttpStatusCode", ValueType::INTEGER,
                                               {MetricCategory::CORE, MetricCategory::HTTP_CLIENT}};
inline const MetricDefinition AWS_REQUEST_ID{"RequestId", ValueType::STRING, {MetricCategory::CORE},
                                             MetricLevel::TRACE};

// HTTP client pool metrics
inline const MetricDefinition HTTP_CLIENT_NAME{"HttpClientName", ValueType::STRING, {MetricCategory::HTTP_CLIENT}};
inline const MetricDefinition MAX_CONCURRENCY{"MaxConcurrency", ValueType::INTEGER, {MetricCategory::HTTP_CLIENT}};
inline const MetricDefinition AVAILABLE_CONCURRENCY{"AvailableConcurrency", ValueType::INTEGER,
                                                    {MetricCategory::HTTP_CLIENT}};
inline const MetricDefinition LEASED_CONCURRENCY{"LeasedConcurrency", ValueType::INTEGER, {MetricCategory::HTTP_CLIENT}};
inline const MetricDefinition PENDING_CONCURRENCY_ACQUIRES{"PendingConcurrencyAcquires", ValueType::INTEGER,
                                                           {MetricCategory::HTTP_CLIENT}};

} // namespace core_metrics
} // namespace metricpub
