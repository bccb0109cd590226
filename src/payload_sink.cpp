#include "payload_sink.hpp"
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace transfer {

// ─── FileSink ───────────────────────────────────────────────────────────────

FileSink::FileSink(std::string path)
    : path_(std::move(path)), part_path_(path_ + ".part") {
    // Ensure parent directories exist for nested file paths
    std::filesystem::path parent = std::filesystem::path(part_path_).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            throw std::runtime_error("Could not create directory " + parent.string() + ": " + ec.message());
        }
    }

    file_.open(part_path_, std::ios::binary | std::ios::trunc);
    if (!file_.is_open()) {
        throw std::runtime_error("Could not open file for writing: " + part_path_);
    }
}

FileSink::~FileSink() {
    if (!finished_) {
        abort();
    }
}

bool FileSink::write(const char* data, std::size_t size) {
    if (finished_ || !file_.is_open()) {
        return false;
    }
    file_.write(data, static_cast<std::streamsize>(size));
    return static_cast<bool>(file_);
}

bool FileSink::commit() {
    if (finished_) {
        return false;
    }
    finished_ = true;
    file_.close();
    if (file_.fail()) {
        std::cerr << "FileSink: failed to flush " << part_path_ << "\n";
        std::remove(part_path_.c_str());
        return false;
    }

    // Rename .part to final filename
    std::error_code ec;
    std::filesystem::rename(part_path_, path_, ec);
    if (ec) {
        std::cerr << "FileSink: failed to rename temp file to " << path_ << ": " << ec.message() << "\n";
        std::remove(part_path_.c_str());
        return false;
    }
    return true;
}

void FileSink::abort() {
    if (finished_) {
        return;
    }
    finished_ = true;
    file_.close();
    std::error_code ec;
    std::filesystem::remove(part_path_, ec);
    if (ec) {
        std::cerr << "FileSink: failed to remove " << part_path_ << ": " << ec.message() << "\n";
    }
}

// ─── MemorySink ─────────────────────────────────────────────────────────────

bool MemorySink::write(const char* data, std::size_t size) {
    std::lock_guard<std::mutex> lock(mutex_);
    data_.insert(data_.end(), data, data + size);
    return true;
}

bool MemorySink::commit() {
    std::lock_guard<std::mutex> lock(mutex_);
    committed_ = true;
    return true;
}

void MemorySink::abort() {
    std::lock_guard<std::mutex> lock(mutex_);
    data_.clear();
    committed_ = false;
}

bool MemorySink::committed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return committed_;
}

std::vector<char> MemorySink::data() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_;
}

} // namespace transfer
