#pragma once
#include <string>

#include <boost/filesystem/path.hpp>

namespace basil {

/**
 * @brief Replace @p target with @p content so that readers see either the
 * old or the new complete file.
 *
 * Writes <target>.tmp.<pid>.<n>, fsyncs it and renames it over the target.
 * A failed attempt is retried once.
 *
 * @throws StorageError if both attempts fail.
 */
void write_file_atomic(const boost::filesystem::path &target,
                       const std::string &content);

/// @throws StorageError if the file cannot be read.
std::string read_file(const boost::filesystem::path &path);

} // namespace basil
