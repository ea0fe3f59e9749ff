#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;

// Scratch directory removed when the test ends
struct TempDir {
    fs::path path;

    TempDir() {
        static std::atomic<int> counter{0};
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path = fs::temp_directory_path() /
               ("pgbranch_test_" + std::to_string(getpid()) + "_" +
                std::to_string(stamp) + "_" + std::to_string(counter++));
        fs::create_directories(path);
        // /tmp may be a symlink; discovery returns canonical paths
        path = fs::canonical(path);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    fs::path write_file(const std::string& rel, const std::string& content) {
        fs::path full = path / rel;
        fs::create_directories(full.parent_path());
        std::ofstream f(full);
        f << content;
        return full;
    }

    std::string read_file(const std::string& rel) const {
        std::ifstream f(path / rel);
        return std::string(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
    }
};
