#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <streambuf>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>
#include "unittest_config.h"

// Path of a checked-in fixture pack
inline std::filesystem::path test_file(const std::string& name) {
    static std::filesystem::path root(UNITTEST_PATH_TO_GENERATED_FILES);
    return root / name;
}

// Utility function to load test files from the generated directory
inline std::unique_ptr<std::istream> load_test(const std::string& name) {
    return std::make_unique<std::ifstream>(test_file(name), std::ios::binary);
}

// Load a whole file as a string
inline std::string read_whole_file(const std::filesystem::path& path) {
    std::ifstream is(path, std::ios::binary);
    if (!is) {
        throw std::runtime_error("Cannot open test file: " + path.string());
    }
    return std::string(std::istreambuf_iterator<char>(is), std::istreambuf_iterator<char>());
}

inline void write_whole_file(const std::filesystem::path& path, std::string_view data) {
    std::ofstream os(path, std::ios::binary | std::ios::trunc);
    os.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!os) {
        throw std::runtime_error("Cannot write test file: " + path.string());
    }
}

inline std::string to_string(const std::vector<std::byte>& data) {
    return std::string(reinterpret_cast<const char*>(data.data()), data.size());
}

// Deterministic, poorly compressible payload
inline std::string make_payload(std::size_t size, std::uint32_t seed = 1) {
    std::string out(size, '\0');
    std::uint32_t state = seed;
    for (auto& c : out) {
        state = state * 1664525u + 1013904223u;
        c = static_cast<char>(state >> 24);
    }
    return out;
}

// Scratch directory removed when the test ends
class temp_dir {
public:
    temp_dir() {
        static std::atomic<int> counter{0};
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        m_path = std::filesystem::temp_directory_path() /
                 ("framepack_test_" + std::to_string(stamp) + "_" + std::to_string(counter++));
        std::filesystem::create_directories(m_path);
    }

    ~temp_dir() {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }

    temp_dir(const temp_dir&) = delete;
    temp_dir& operator = (const temp_dir&) = delete;

    std::filesystem::path operator / (const std::string& name) const { return m_path / name; }
    const std::filesystem::path& path() const { return m_path; }

private:
    std::filesystem::path m_path;
};

// Helper to track warnings
struct warning_tracker {
    struct warning_info {
        std::uint64_t offset;
        std::string category;
        std::string message;
    };

    std::vector<warning_info> warnings;

    void operator()(std::uint64_t offset, std::string_view category, std::string_view message) {
        warnings.push_back({offset, std::string(category), std::string(message)});
    }

    bool has_warning(std::string_view category) const {
        return std::any_of(warnings.begin(), warnings.end(),
            [category](const warning_info& w) { return w.category == category; });
    }
};

// Output buffer that stops accepting bytes after a limit, simulating a closed client
class failing_streambuf : public std::streambuf {
public:
    explicit failing_streambuf(std::size_t fail_after)
        : m_fail_after(fail_after) {
    }

    const std::string& data() const { return m_data; }

protected:
    int_type overflow(int_type ch) override {
        if (traits_type::eq_int_type(ch, traits_type::eof())) {
            return traits_type::not_eof(ch);
        }
        if (m_data.size() >= m_fail_after) {
            return traits_type::eof();
        }
        m_data.push_back(traits_type::to_char_type(ch));
        return ch;
    }

    std::streamsize xsputn(const char_type* s, std::streamsize count) override {
        auto room = static_cast<std::streamsize>(m_fail_after - std::min(m_fail_after, m_data.size()));
        auto accepted = std::min(count, room);
        m_data.append(s, static_cast<std::size_t>(accepted));
        return accepted;
    }

private:
    std::string m_data;
    std::size_t m_fail_after;
};
