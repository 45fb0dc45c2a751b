#pragma once
/// @file FileOps.hpp
/// @brief Thin wrappers over filesystem primitives used to keep tracked files in sync

#include <string>
#include <system_error>

namespace FileReg::util {

/// @brief Replaces path with the full text, creating it when missing
/// @details Writes a sibling temp file (mkstemp), fsyncs it and renames it over @p path.
///          On failure the temp file is removed and @p path keeps its previous content.
/// @param path Destination file
/// @param content Bytes to write
/// @param ec errno-based code on failure
/// @return true on success
bool writeTextFile(const std::string& path, const std::string& content, std::error_code& ec);

/// @brief Reads the whole file and normalizes CRLF / CR line endings to LF
bool readTextFile(const std::string& path, std::string& out, std::error_code& ec);

/// @brief Reads the whole file without any transformation
bool readWholeFile(const std::string& path, std::string& out, std::error_code& ec);

/// @brief Renames or moves a path
/// @details Fails with Errc::duplicate_file before touching anything if @p to exists.
///          Falls back to copy + unlink when the two paths live on different filesystems.
bool movePath(const std::string& from, const std::string& to, std::error_code& ec);

/// @brief Deletes a file
bool removeFile(const std::string& path, std::error_code& ec);

/// @brief Creates the directory and all missing parents
/// @details Succeeds when the directory already exists; fails with not_a_directory when a
///          non-directory occupies the path.
bool makeDirectories(const std::string& path, std::error_code& ec);

/// @brief lstat-based existence check (a dangling symlink counts as existing)
bool pathExists(const std::string& path);

bool isDirectory(const std::string& path);

/// @brief Joins a directory and a file name with '/'
/// @details An empty directory yields the bare name; a trailing '/' is not doubled.
std::string joinPath(const std::string& dir, const std::string& name);

/// @brief Converts CRLF and lone CR to LF
std::string normalizeLineEndings(const std::string& text);

} // namespace FileReg::util
