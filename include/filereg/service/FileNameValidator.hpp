#pragma once
/// @file FileNameValidator.hpp
/// @brief Input checks run before any file or registry mutation

#include <string>
#include <system_error>

namespace FileReg::service {

/// @brief Characters rejected in file names
constexpr const char* kIllegalFileNameChars = "<>:\"/\\|?*";

/// @brief Checks a file name
/// @details Rejects empty / whitespace-only names (Errc::empty_field), names holding NUL or
///          any of kIllegalFileNameChars and names without an extension separator
///          (Errc::invalid_file_name).
/// @param detail Optional message suitable for the user
bool validateFileName(const std::string& name, std::error_code& ec,
                      std::string* detail = nullptr);

/// @brief Checks a storage directory
/// @details Rejects empty paths (Errc::empty_field) and paths holding '|', LF, CR or NUL,
///          which cannot be represented in a registry line (Errc::invalid_storage_path).
bool validateStoragePath(const std::string& path, std::error_code& ec,
                         std::string* detail = nullptr);

/// @brief Checks a category label
/// @details Blank is accepted (normalized to "General" by FileRecord). '|', LF, CR or NUL
///          fail with Errc::invalid_category.
bool validateCategory(const std::string& category, std::error_code& ec,
                      std::string* detail = nullptr);

} // namespace FileReg::service
