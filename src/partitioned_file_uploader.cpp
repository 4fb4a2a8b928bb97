#include "partitioned_file_uploader.h"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace metricpub {

PartitionedFileUploader::PartitionedFileUploader(const std::string& path, int num_partitions)
    : base_path_(path), num_partitions_(num_partitions) {

    if (num_partitions_ <= 0) {
        throw std::runtime_error("Partition count must be positive: " + std::to_string(num_partitions_));
    }

    std::error_code ec;
    fs::create_directories(base_path_, ec);
    if (ec) {
        throw std::runtime_error("Failed to create queue directory " + base_path_ + ": " + ec.message());
    }

    for (int i = 0; i < num_partitions_; i++) {
        std::string partition_path = base_path_ + "/partition-" + std::to_string(i);
        fs::create_directories(partition_path, ec);
        if (ec) {
            throw std::runtime_error("Failed to create partition directory " + partition_path + ": " + ec.message());
        }

        mutexes_.push_back(std::make_unique<std::mutex>());
        offsets_.push_back(0);
    }

    // Resume after the last request written by a previous run
    load_offsets();

    std::cout << "Initialized file-based partitioned queue at " << base_path_
              << " with " << num_partitions_ << " partitions\n";
}

std::future<void> PartitionedFileUploader::upload(const UploadRequest& request) {
    std::promise<void> promise;
    try {
        produce(request.namespace_name, to_json(request));
        promise.set_value();
    } catch (const std::exception&) {
        promise.set_exception(std::current_exception());
    }
    return promise.get_future();
}

std::pair<int, uint64_t> PartitionedFileUploader::produce(const std::string& key,
                                                          const std::string& message) {
    int partition = get_partition(key);

    // Lock only this partition (allows parallel writes to other partitions)
    std::lock_guard<std::mutex> lock(*mutexes_[partition]);

    uint64_t offset = offsets_[partition] + 1;

    std::string filename = base_path_ + "/partition-" + std::to_string(partition)
                         + "/" + format_offset(offset) + ".msg";

    std::ofstream file(filename, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file: " + filename);
    }

    file << message;
    file.flush();
    if (!file) {
        throw std::runtime_error("Failed to write file: " + filename);
    }

    // Only advance once the message is on disk, a failed write reuses the offset.
    // The message is enqueued from here on, a stale offset.txt is repaired by load_offsets().
    offsets_[partition] = offset;
    if (!update_offset_file(partition, offset)) {
        std::cerr << "[QUEUE] Failed to record offset " << offset << " for partition " << partition
                  << ", it will be recovered from the message files\n";
    }

    return {partition, offset};
}

int PartitionedFileUploader::get_partition(const std::string& key) const {
    std::hash<std::string> hasher;
    size_t hash_value = hasher(key);
    return static_cast<int>(hash_value % static_cast<size_t>(num_partitions_));
}

uint64_t PartitionedFileUploader::get_offset(int partition) const {
    std::lock_guard<std::mutex> lock(*mutexes_.at(partition));
    return offsets_[partition];
}

void PartitionedFileUploader::load_offsets() {
    for (int i = 0; i < num_partitions_; i++) {
        std::string partition_path = base_path_ + "/partition-" + std::to_string(i);
        std::lock_guard<std::mutex> lock(*mutexes_[i]);

        uint64_t offset = 0;
        std::ifstream file(partition_path + "/offset.txt");
        if (!file.is_open() || !(file >> offset)) {
            offset = 0;  // Start from 0 if no offset file
        }

        // offset.txt may lag behind the last message if its update failed
        std::error_code ec;
        for (const auto& entry : fs::directory_iterator(partition_path, ec)) {
            if (entry.path().extension() != ".msg") {
                continue;
            }
            const std::string stem = entry.path().stem().string();
            if (stem.empty() || stem.find_first_not_of("0123456789") != std::string::npos) {
                continue;
            }
            offset = std::max<uint64_t>(offset, std::stoull(stem));
        }
        if (ec) {
            throw std::runtime_error("Failed to scan partition directory " + partition_path + ": " + ec.message());
        }

        offsets_[i] = offset;
    }
}

bool PartitionedFileUploader::update_offset_file(int partition, uint64_t offset) {
    std::string offset_file = base_path_ + "/partition-" + std::to_string(partition)
                            + "/offset.txt";
    std::ofstream file(offset_file);
    if (!file.is_open()) {
        return false;
    }
    file << offset;
    file.flush();
    return static_cast<bool>(file);
}

std::string PartitionedFileUploader::format_offset(uint64_t offset) const {
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(20) << offset;
    return oss.str();
}

} // namespace metricpub
