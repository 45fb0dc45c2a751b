#include <filereg/error/RegistryError.hpp>
#include <filereg/service/FileNameValidator.hpp>
#include <filereg/service/FileService.hpp>
#include <filereg/util/FileOps.hpp>
#include <filereg/util/textFormatUtil.hpp>

#include <spdlog/spdlog.h>

namespace FileReg::service {

FileService::FileService(FileRegistry& registry, IdGenerator& ids, const Clock& clock)
    : registry_(registry), ids_(ids), clock_(clock) {}

FileService::RecordPtr FileService::createFile(const std::string& fileName,
                                               const std::string& content,
                                               const std::string& storagePath,
                                               const std::string& category,
                                               std::error_code& ec) {
    begin(ec);
    std::string why;
    if (!validateFileName(fileName, ec, &why))
        return failRecord(ec, ec, why);

    const std::string dir = util::trim(storagePath);
    if (!validateStoragePath(dir, ec, &why))
        return failRecord(ec, ec, why);
    if (!validateCategory(category, ec, &why))
        return failRecord(ec, ec, why);

    std::error_code fec;
    if (!util::makeDirectories(dir, fec))
        return failRecord(ec, fec, "Cannot create directory: " + dir + " (" + fec.message() + ")");

    const std::string target = util::joinPath(dir, fileName);
    if (util::pathExists(target)) {
        return failRecord(ec, Errc::duplicate_file,
                          "A file named '" + fileName + "' already exists at: " + dir);
    }

    if (!util::writeTextFile(target, content, fec))
        return failRecord(ec, fec, "Failed to write file: " + target + " (" + fec.message() + ")");

    auto record = std::make_shared<FileRecord>(fileName, content, dir, category, ids_, clock_);
    if (!registry_.save(record, ec)) {
        // 디스크에는 이미 파일이 생성됨 -> 부분 적용 상태로 보고한다.
        spdlog::error("FileService: {} written but not registered: {}", target,
                      registry_.lastError());
        return failRecord(ec, Errc::partially_applied,
                          "File written to disk but registry update failed: " +
                              registry_.lastError());
    }

    spdlog::info("FileService: created {} [{}]", target, record->shortId());
    return record;
}

FileService::RecordPtr FileService::readById(const std::string& id, std::error_code& ec) {
    begin(ec);
    auto rec = registry_.findById(id);
    if (!rec)
        rec = registry_.findByIdPrefix(id);
    if (!rec)
        return failRecord(ec, Errc::record_not_found, "No file found with ID: " + id);
    return rec;
}

FileService::RecordPtr FileService::readByFileName(const std::string& fileName,
                                                   std::error_code& ec) {
    begin(ec);
    auto rec = registry_.findByFileName(fileName);
    if (!rec)
        return failRecord(ec, Errc::record_not_found, "No file found with name: " + fileName);
    return rec;
}

FileService::RecordPtr FileService::resolve(const std::string& input, std::error_code& ec) {
    // 순서 고정: 정확한 id -> id prefix -> 파일명.
    // 파일명이 다른 레코드의 id prefix처럼 보여도 id 쪽이 먼저 선택된다.
    auto rec = readById(input, ec);
    if (rec)
        return rec;
    rec = readByFileName(input, ec);
    if (!rec)
        return failRecord(ec, Errc::record_not_found, "No file found with ID or name: " + input);
    return rec;
}

std::vector<FileService::RecordPtr> FileService::readAll() const { return registry_.findAll(); }

std::vector<FileService::RecordPtr> FileService::readByCategory(const std::string& category) const {
    return registry_.findByCategory(util::trim(category));
}

std::vector<std::string> FileService::categories() const { return registry_.categories(); }

bool FileService::readContentFromDisk(const FileRecord& record, std::string& out,
                                      std::error_code& ec) {
    begin(ec);
    const std::string path = record.fullPath();
    if (!util::pathExists(path))
        return fail(ec, Errc::file_missing, "File does not exist on disk: " + path);

    std::error_code fec;
    if (!util::readTextFile(path, out, fec))
        return fail(ec, fec, "Failed to read file: " + path + " (" + fec.message() + ")");
    return true;
}

bool FileService::refreshContent(const RecordPtr& record, std::error_code& ec) {
    if (!record) {
        begin(ec);
        return fail(ec, Errc::record_not_found, "No file selected.");
    }

    std::string live;
    if (!readContentFromDisk(*record, live, ec))
        return false;
    if (live == record->content())
        return true;

    record->setContent(std::move(live), clock_.now());
    if (!registry_.update(record, ec))
        return fail(ec, ec, "Registry update failed: " + registry_.lastError());
    spdlog::debug("FileService: refreshed content of {}", record->fullPath());
    return true;
}

bool FileService::updateContent(const std::string& id, const std::string& newContent,
                                std::error_code& ec) {
    auto record = readById(id, ec);
    if (!record)
        return false;

    const std::string path = record->fullPath();
    std::error_code fec;
    if (!util::writeTextFile(path, newContent, fec))
        return fail(ec, fec, "Failed to write file: " + path + " (" + fec.message() + ")");

    record->setContent(newContent, clock_.now());
    if (!registry_.update(record, ec)) {
        return fail(ec, Errc::partially_applied,
                    "File updated on disk but registry update failed: " + registry_.lastError());
    }
    spdlog::info("FileService: updated content of {}", path);
    return true;
}

bool FileService::renameFile(const std::string& id, const std::string& newFileName,
                             std::error_code& ec) {
    begin(ec);
    std::string why;
    if (!validateFileName(newFileName, ec, &why))
        return fail(ec, ec, why);

    auto record = readById(id, ec);
    if (!record)
        return false;

    const std::string from = record->fullPath();
    const std::string to = util::joinPath(record->storagePath(), newFileName);

    std::error_code fec;
    if (!util::movePath(from, to, fec)) {
        if (fec == Errc::duplicate_file) {
            return fail(ec, fec,
                        "A file named '" + newFileName +
                            "' already exists at: " + record->storagePath());
        }
        return fail(ec, fec, "Failed to rename file on disk: " + fec.message());
    }

    record->setFileName(newFileName, clock_.now());
    if (!registry_.update(record, ec)) {
        return fail(ec, Errc::partially_applied,
                    "File renamed on disk but registry update failed: " + registry_.lastError());
    }
    spdlog::info("FileService: renamed {} -> {}", from, to);
    return true;
}

bool FileService::moveFile(const std::string& id, const std::string& newStoragePath,
                           std::error_code& ec) {
    auto record = readById(id, ec);
    if (!record)
        return false;

    std::string why;
    const std::string dir = util::trim(newStoragePath);
    if (!validateStoragePath(dir, ec, &why))
        return fail(ec, ec, why);

    std::error_code fec;
    if (!util::makeDirectories(dir, fec)) {
        return fail(ec, fec,
                    "Cannot create target directory: " + dir + " (" + fec.message() + ")");
    }

    const std::string from = record->fullPath();
    const std::string to = util::joinPath(dir, record->fileName());
    if (!util::movePath(from, to, fec)) {
        if (fec == Errc::duplicate_file) {
            return fail(ec, fec,
                        "A file named '" + record->fileName() + "' already exists at: " + dir);
        }
        return fail(ec, fec, "Failed to move file on disk: " + fec.message());
    }

    record->setStoragePath(dir, clock_.now());
    if (!registry_.update(record, ec)) {
        return fail(ec, Errc::partially_applied,
                    "File moved on disk but registry update failed: " + registry_.lastError());
    }
    spdlog::info("FileService: moved {} -> {}", from, to);
    return true;
}

bool FileService::updateCategory(const std::string& id, const std::string& newCategory,
                                 std::error_code& ec) {
    begin(ec);
    std::string why;
    if (!validateCategory(newCategory, ec, &why))
        return fail(ec, ec, why);

    auto record = readById(id, ec);
    if (!record)
        return false;

    record->setCategory(newCategory, clock_.now());
    if (!registry_.update(record, ec))
        return fail(ec, ec, "Registry update failed: " + registry_.lastError());
    spdlog::info("FileService: {} now in category '{}'", record->fileName(),
                 record->category());
    return true;
}

bool FileService::deleteFile(const std::string& id, std::error_code& ec) {
    auto record = readById(id, ec);
    if (!record)
        return false;

    const std::string path = record->fullPath();
    bool removedFromDisk = false;
    if (util::pathExists(path)) {
        std::error_code fec;
        if (!util::removeFile(path, fec)) {
            return fail(ec, fec,
                        "Failed to delete file from disk: " + path + " (" + fec.message() + ")");
        }
        removedFromDisk = true;
    }

    if (!registry_.deleteById(record->id(), ec) && ec) {
        if (removedFromDisk) {
            return fail(ec, Errc::partially_applied,
                        "File deleted from disk but registry update failed: " +
                            registry_.lastError());
        }
        return fail(ec, ec, "Registry update failed: " + registry_.lastError());
    }
    spdlog::info("FileService: deleted {} [{}]", path, record->shortId());
    return true;
}

void FileService::begin(std::error_code& ec) {
    ec.clear();
    lastError_.clear();
}

bool FileService::fail(std::error_code& ec, std::error_code code, std::string message) {
    ec = code;
    lastError_ = std::move(message);
    spdlog::debug("FileService: {} ({})", lastError_, ec.message());
    return false;
}

FileService::RecordPtr FileService::failRecord(std::error_code& ec, std::error_code code,
                                               std::string message) {
    fail(ec, code, std::move(message));
    return nullptr;
}

} // namespace FileReg::service
