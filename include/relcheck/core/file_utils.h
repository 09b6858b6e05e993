#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <relcheck/core/types.h>

namespace relcheck {

/// Read a whole file. FileNotFound when it does not exist.
Result<std::string> readFile(const std::filesystem::path& path);

/**
 * @brief Write @p content to "<path>.tmp" and rename it over @p path.
 *
 * Readers never observe a partially written file. Parent directories are created.
 */
Result<void> writeFileAtomic(const std::filesystem::path& path, std::string_view content);

} // namespace relcheck
