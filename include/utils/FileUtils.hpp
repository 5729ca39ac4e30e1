#ifndef VITCO_UTILS_FILEUTILS_HPP
#define VITCO_UTILS_FILEUTILS_HPP

/**
 * @file FileUtils.hpp
 * @brief Small filesystem helpers for the JSON stores.
 */

#include <string>

#include "core/Result.hpp"

namespace vitco::utils {

    /**
     * @brief Read a whole file. Missing file yields `ErrorCode::NotFound`.
     */
    [[nodiscard]] Result<std::string> readTextFile(const std::string& path);

    /**
     * @brief Replace `path` with `content` durably.
     *
     * Writes a sibling temp file, fsyncs it, renames it over `path` and
     * fsyncs the directory, so readers see either the old or the new file.
     */
    [[nodiscard]] Status writeTextFileAtomic(const std::string& path, const std::string& content);

    /**
     * @brief Create `path` and its parents if needed.
     */
    [[nodiscard]] Status ensureDirectory(const std::string& path);

}

#endif  // VITCO_UTILS_FILEUTILS_HPP
