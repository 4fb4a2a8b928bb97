#pragma once

#include "metric_uploader.h"
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace metricpub {

// Uploads requests into a partitioned on-disk queue:
//   <base>/partition-<n>/<offset>.msg  one JSON request per file
//   <base>/partition-<n>/offset.txt    last written offset
class PartitionedFileUploader : public MetricUploader {
private:
    std::string base_path_;
    int num_partitions_;
    std::vector<std::unique_ptr<std::mutex>> mutexes_;
    std::vector<uint64_t> offsets_;

public:
    // Initialize queue directory structure, throws std::runtime_error on failure
    PartitionedFileUploader(const std::string& path, int num_partitions);

    // The returned future is already complete
    std::future<void> upload(const UploadRequest& request) override;

    void close() override {}

    // Write message to appropriate partition
    // Returns: partition number and offset where written
    std::pair<int, uint64_t> produce(const std::string& key, const std::string& message);

    // Determine partition for a key
    int get_partition(const std::string& key) const;

    uint64_t get_offset(int partition) const;

    // Load offsets from disk on startup: offset.txt, or the newest message file if that is further ahead
    void load_offsets();

private:
    // Update offset tracking file, false if it could not be written
    bool update_offset_file(int partition, uint64_t offset);

    // Format offset as zero-padded string: 1 → "00000000000000000001"
    std::string format_offset(uint64_t offset) const;
};

} // namespace metricpub
