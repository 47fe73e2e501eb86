#pragma once

#include <exflow/core/types.h>

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace exflow::analysis {

/**
 * @brief Source files to analyze under a path
 *
 * A regular file is returned as-is. A directory is walked recursively for regular
 * files ending in @p extension; the result is sorted so runs are deterministic.
 * A path that does not exist yields an empty list.
 */
std::vector<std::filesystem::path>
discoverSourceFiles(const std::filesystem::path& root,
                    std::string_view extension = PYTHON_SOURCE_EXTENSION);

/**
 * @brief Read a whole file as bytes
 * @return File contents, or ErrorCode::IOError
 */
Result<std::string> readSourceFile(const std::filesystem::path& file);

} // namespace exflow::analysis
