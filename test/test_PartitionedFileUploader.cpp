#define BOOST_TEST_MODULE test_PartitionedFileUploader
#include <boost/test/unit_test.hpp>

#include "partitioned_file_uploader.h"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace metricpub;

namespace {

struct TempQueueDir {
    std::string path;

    explicit TempQueueDir(const std::string& name)
        : path((fs::temp_directory_path() / (name + "-" + std::to_string(::getpid()))).string()) {
        fs::remove_all(path);
    }
    ~TempQueueDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
};

std::string read_file(const std::string& filename) {
    std::ifstream file(filename);
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

UploadRequest sample_request(const std::string& namespace_name) {
    MetricDatum datum;
    datum.metric_name = "RetryCount";
    datum.statistic_values = StatisticSet{0, 2, 3, 4};
    return UploadRequest{namespace_name, {datum}};
}

} // namespace

BOOST_AUTO_TEST_CASE(creates_partition_directories) {
    TempQueueDir dir("metricpub-layout");
    PartitionedFileUploader uploader(dir.path, 3);

    for (int p = 0; p < 3; ++p) {
        BOOST_CHECK(fs::is_directory(dir.path + "/partition-" + std::to_string(p)));
        BOOST_CHECK_EQUAL(uploader.get_offset(p), 0);
    }
}

BOOST_AUTO_TEST_CASE(rejects_non_positive_partition_count) {
    TempQueueDir dir("metricpub-invalid");
    BOOST_CHECK_THROW(PartitionedFileUploader(dir.path, 0), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(produce_writes_zero_padded_files) {
    TempQueueDir dir("metricpub-produce");
    PartitionedFileUploader uploader(dir.path, 4);

    auto [partition, offset] = uploader.produce("key", "first");
    auto second = uploader.produce("key", "second");

    BOOST_CHECK_EQUAL(partition, uploader.get_partition("key"));
    BOOST_CHECK_EQUAL(offset, 1);
    BOOST_CHECK_EQUAL(second.first, partition);
    BOOST_CHECK_EQUAL(second.second, 2);

    std::string partition_dir = dir.path + "/partition-" + std::to_string(partition);
    BOOST_CHECK_EQUAL(read_file(partition_dir + "/00000000000000000001.msg"), "first");
    BOOST_CHECK_EQUAL(read_file(partition_dir + "/00000000000000000002.msg"), "second");
    BOOST_CHECK_EQUAL(read_file(partition_dir + "/offset.txt"), "2");
}

BOOST_AUTO_TEST_CASE(upload_stores_the_request_json) {
    TempQueueDir dir("metricpub-upload");
    PartitionedFileUploader uploader(dir.path, 2);

    auto request = sample_request("MetricPub/Client");
    auto result = uploader.upload(request);
    BOOST_REQUIRE(result.wait_for(std::chrono::seconds(0)) == std::future_status::ready);
    BOOST_CHECK_NO_THROW(result.get());

    int partition = uploader.get_partition("MetricPub/Client");
    BOOST_CHECK_EQUAL(read_file(dir.path + "/partition-" + std::to_string(partition) +
                                "/00000000000000000001.msg"),
                      to_json(request));
}

BOOST_AUTO_TEST_CASE(offsets_resume_after_restart) {
    TempQueueDir dir("metricpub-resume");
    int partition = 0;
    {
        PartitionedFileUploader uploader(dir.path, 4);
        partition = uploader.produce("key", "a").first;
        uploader.produce("key", "b");
        uploader.produce("key", "c");
    }

    PartitionedFileUploader reopened(dir.path, 4);
    BOOST_CHECK_EQUAL(reopened.get_offset(partition), 3);
    BOOST_CHECK_EQUAL(reopened.produce("key", "d").second, 4);
}

BOOST_AUTO_TEST_CASE(failed_write_is_reported_through_the_future) {
    TempQueueDir dir("metricpub-failure");
    PartitionedFileUploader uploader(dir.path, 1);

    // Replace the partition directory with a plain file so the next write fails
    fs::remove_all(dir.path + "/partition-0");
    std::ofstream(dir.path + "/partition-0") << "blocked";

    auto result = uploader.upload(sample_request("ns"));
    BOOST_CHECK_THROW(result.get(), std::runtime_error);
    BOOST_CHECK_EQUAL(uploader.get_offset(0), 0);
}

BOOST_AUTO_TEST_CASE(unwritable_offset_file_does_not_fail_the_upload) {
    TempQueueDir dir("metricpub-offset-blocked");
    PartitionedFileUploader uploader(dir.path, 1);

    // A directory in place of offset.txt makes every offset update fail
    fs::create_directory(dir.path + "/partition-0/offset.txt");

    auto request = sample_request("ns");
    auto result = uploader.upload(request);
    BOOST_CHECK_NO_THROW(result.get());
    BOOST_CHECK_EQUAL(uploader.get_offset(0), 1);
    BOOST_CHECK_EQUAL(read_file(dir.path + "/partition-0/00000000000000000001.msg"), to_json(request));

    BOOST_CHECK_EQUAL(uploader.produce("ns", "next").second, 2);
}

BOOST_AUTO_TEST_CASE(stale_offset_file_is_recovered_from_messages) {
    TempQueueDir dir("metricpub-offset-stale");
    {
        PartitionedFileUploader uploader(dir.path, 1);
        uploader.produce("key", "a");
        uploader.produce("key", "b");
        uploader.produce("key", "c");
    }
    std::ofstream(dir.path + "/partition-0/offset.txt") << "1";

    PartitionedFileUploader reopened(dir.path, 1);
    BOOST_CHECK_EQUAL(reopened.get_offset(0), 3);
    BOOST_CHECK_EQUAL(reopened.produce("key", "d").second, 4);
    BOOST_CHECK_EQUAL(read_file(dir.path + "/partition-0/00000000000000000003.msg"), "c");
}
