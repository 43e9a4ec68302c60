#pragma once

#include <fmt/format.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

#include <unistd.h>

// Fresh, empty directory under the system temp directory.
inline
std::filesystem::path make_test_dir(const std::string& name) {
    auto dir = std::filesystem::temp_directory_path() / fmt::format("jsondb_{}_{}", name, ::getpid());
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

inline
std::string read_file(const std::filesystem::path& path) {
    std::ifstream f_in{path, std::ios::in | std::ios::binary};
    return {std::istreambuf_iterator<char>{f_in}, std::istreambuf_iterator<char>{}};
}

inline
void write_file(const std::filesystem::path& path, const std::string& text) {
    std::ofstream f_out{path, std::ios::out | std::ios::binary | std::ios::trunc};
    f_out << text;
}
