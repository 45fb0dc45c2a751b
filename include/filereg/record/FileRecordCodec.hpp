#pragma once
/// @file FileRecordCodec.hpp
/// @brief FileRecord <-> registry line

#include "FileRecord.hpp"

#include <memory>
#include <string>
#include <system_error>

namespace FileReg::codec {

/// @brief Number of '|'-separated fields in a registry line
constexpr size_t kFieldCount = 7;

/// @brief Encodes a record as one registry line (no trailing newline)
/// @details Layout: id|fileName|storagePath|category|createdAt|updatedAt|content.
///          Only the content field is escaped; the other fields are written verbatim and
///          must not contain '|', LF or CR.
std::string toLine(const FileRecord& record);

/// @brief Decodes one registry line
/// @param line Line without its terminating LF (a trailing CR is tolerated)
/// @param ec Errc::corrupt_record on any format violation
/// @param detail Optional human-readable reason on failure
/// @return The record, or nullptr on failure
std::shared_ptr<FileRecord> fromLine(const std::string& line, std::error_code& ec,
                                     std::string* detail = nullptr);

} // namespace FileReg::codec
