#pragma once

#include "upload_request.h"
#include <future>

namespace metricpub {

// Transport to the remote time-series store
class MetricUploader {
public:
    virtual ~MetricUploader() = default;

    // Start uploading one request. The future completes when the store has
    // accepted the request, or holds the exception that made it fail.
    virtual std::future<void> upload(const UploadRequest& request) = 0;

    // Release the connection. In-flight uploads that cannot complete fail their futures.
    virtual void close() = 0;
};

} // namespace metricpub
