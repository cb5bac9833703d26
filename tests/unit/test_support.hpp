#pragma once

#include <atomic>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>
#include <string>
#include <unistd.h>

namespace autopilot::test_support {

// Scratch directory under the current path, removed with everything in it.
class TempWorkspace {
public:
    explicit TempWorkspace(const std::string& prefix) {
        static std::atomic<int> counter{0};
        std::random_device rd;
        std::ostringstream name;
        name << ".tmp_" << prefix << "_" << getpid() << "_" << counter++ << "_" << std::hex
             << rd();
        root_ = std::filesystem::current_path() / name.str();
        std::filesystem::create_directories(root_);
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    TempWorkspace(const TempWorkspace&) = delete;
    TempWorkspace& operator=(const TempWorkspace&) = delete;

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

inline void write_file(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path);
    out << content;
}

inline std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

}  // namespace autopilot::test_support
