// tests/test_framework/shared_test_helpers.h
#pragma once

/**
 * @file shared_test_helpers.h
 * @brief File helpers and a temp-log fixture shared by the statehub test executables.
 */

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "gtest/gtest.h"

namespace fs = std::filesystem;

namespace statehub::tests::helper
{

/**
 * @brief Reads the entire contents of a file into a string.
 * @return True if the file was read successfully, false otherwise.
 */
bool read_file_contents(const std::string &path, std::string &out);

/**
 * @brief Counts the lines of `text`, optionally only those containing `must_include` and not
 *        containing `must_exclude`.
 */
size_t count_lines(std::string_view text, std::optional<std::string_view> must_include = std::nullopt,
                   std::optional<std::string_view> must_exclude = std::nullopt);

/**
 * @brief Polls `path` until `expected` appears in it or `timeout` elapses.
 * @return True if the string was found.
 */
bool wait_for_string_in_file(const fs::path &path, const std::string &expected,
                             std::chrono::milliseconds timeout = std::chrono::seconds(15));

/**
 * @class TempFileTest
 * @brief Fixture handing out unique temporary paths that are removed in TearDown.
 */
class TempFileTest : public ::testing::Test
{
  protected:
    void TearDown() override;

    /// A fresh path under the temp directory; any leftover from a previous run is removed.
    fs::path GetUniquePath(const std::string &test_name, const std::string &extension = ".log");

  private:
    std::vector<fs::path> paths_to_clean_;
};

} // namespace statehub::tests::helper
