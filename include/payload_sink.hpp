#pragma once

#include <cstddef>
#include <fstream>
#include <mutex>
#include <string>
#include <vector>

namespace transfer {

// Destination for received payload bytes. All calls for one transfer come
// from that transfer's task, in order: write*, then commit or abort.
class PayloadSink {
public:
    virtual ~PayloadSink() = default;

    // Returns false when the chunk could not be stored.
    virtual bool write(const char* data, std::size_t size) = 0;
    virtual bool commit() = 0;
    virtual void abort() = 0;
};

// Writes into "<path>.part" and renames it to path on commit. The partial
// file is removed on abort; it is never kept around for resuming.
class FileSink : public PayloadSink {
public:
    // Throws std::runtime_error when the part file cannot be created.
    explicit FileSink(std::string path);
    ~FileSink() override;

    bool write(const char* data, std::size_t size) override;
    bool commit() override;
    void abort() override;

    const std::string& path() const { return path_; }
    const std::string& part_path() const { return part_path_; }

private:
    std::string path_;
    std::string part_path_;
    std::ofstream file_;
    bool finished_ = false;
};

// Collects the payload in memory (clipboard blobs, small shares).
class MemorySink : public PayloadSink {
public:
    bool write(const char* data, std::size_t size) override;
    bool commit() override;
    void abort() override;

    bool committed() const;
    std::vector<char> data() const;

private:
    mutable std::mutex mutex_;
    std::vector<char> data_;
    bool committed_ = false;
};

} // namespace transfer
