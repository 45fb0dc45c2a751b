#pragma once
/// @file RegistryError.hpp
/// @brief Error codes and error kinds reported through std::error_code

#include <string>
#include <system_error>
#include <type_traits>

namespace FileReg {

/// @brief Concrete failure codes produced by the library
/// @details Values are stable; 0 is reserved for success as required by std::error_code.
enum class Errc {
    empty_field = 1,      ///< Required input (file name, path) is empty
    invalid_file_name,    ///< Illegal character or missing extension
    invalid_storage_path, ///< Path would break the registry line format
    duplicate_file,       ///< Target path already exists
    record_not_found,     ///< No record matches the id, prefix or name
    file_missing,         ///< Registered file is gone from disk
    corrupt_record,       ///< Registry line does not parse
    storage_failure,      ///< Registry rewrite or load I/O failed, nothing applied
    partially_applied,    ///< Disk changed but the registry was not updated
    registry_not_open,    ///< Operation on a registry that was never opened
    invalid_category,     ///< Category would break the registry line format
};

/// @brief Coarse classification used by callers to pick a recovery strategy
enum class ErrorKind {
    validation = 1,
    duplicate,
    not_found,
    storage,
    corruption,
};

/// @brief Category for FileReg::Errc ("filereg")
const std::error_category& registryCategory() noexcept;

/// @brief Category for FileReg::ErrorKind ("filereg.kind")
const std::error_category& errorKindCategory() noexcept;

std::error_code make_error_code(Errc e) noexcept;
std::error_condition make_error_condition(ErrorKind k) noexcept;

/// @brief Returns the kind an error code belongs to
/// @return ErrorKind, or 0-valued kind when ec is clear or foreign to every kind
ErrorKind classify(const std::error_code& ec) noexcept;

/// @brief Short label for a kind ("validation", "storage", ...)
const char* kindName(ErrorKind kind) noexcept;

} // namespace FileReg

namespace std {
template <> struct is_error_code_enum<FileReg::Errc> : true_type {};
template <> struct is_error_condition_enum<FileReg::ErrorKind> : true_type {};
} // namespace std
