#pragma once

#include <unistd.h>
#include <atomic>
#include <filesystem>
#include <format>
#include <string_view>

namespace polydb::testing {

/**
 * @brief Fresh path in the temp directory, unique per process and call
 *
 * ctest runs every discovered test case in its own process, so the pid
 * keeps parallel runs apart and the counter keeps calls within one run apart.
 */
inline std::filesystem::path unique_temp_path(std::string_view stem, std::string_view extension) {
    static std::atomic<unsigned> counter{0};
    return std::filesystem::temp_directory_path() /
        std::format("{}_{}_{}{}", stem, ::getpid(), counter.fetch_add(1), extension);
}

} // namespace polydb::testing
