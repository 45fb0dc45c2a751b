#include <filereg/record/FileRecord.hpp>
#include <filereg/util/FileOps.hpp>
#include <filereg/util/textFormatUtil.hpp>

#include <algorithm>

namespace FileReg {

FileRecord::FileRecord(std::string fileName, std::string content, std::string storagePath,
                       const std::string& category, IdGenerator& ids, const Clock& clock)
    : id_(ids.next()), fileName_(std::move(fileName)), content_(std::move(content)),
      storagePath_(std::move(storagePath)), category_(normalizeCategory(category)),
      createdAt_(clock.now()), updatedAt_(createdAt_) {}

FileRecord::FileRecord(std::string fileName, std::string content, std::string storagePath,
                       const std::string& category)
    : FileRecord(std::move(fileName), std::move(content), std::move(storagePath), category,
                 defaultIdGenerator(), SystemClock()) {}

FileRecord::FileRecord(std::string id, std::string fileName, std::string content,
                       std::string storagePath, const std::string& category,
                       Timestamp createdAt, Timestamp updatedAt)
    : id_(std::move(id)), fileName_(std::move(fileName)), content_(std::move(content)),
      storagePath_(std::move(storagePath)), category_(normalizeCategory(category)),
      createdAt_(createdAt), updatedAt_(std::max(createdAt, updatedAt)) {}

void FileRecord::setFileName(std::string fileName, Timestamp at) {
    fileName_ = std::move(fileName);
    touch(at);
}

void FileRecord::setFileName(std::string fileName) {
    setFileName(std::move(fileName), SystemClock().now());
}

void FileRecord::setContent(std::string content, Timestamp at) {
    content_ = std::move(content);
    touch(at);
}

void FileRecord::setContent(std::string content) {
    setContent(std::move(content), SystemClock().now());
}

void FileRecord::setStoragePath(std::string storagePath, Timestamp at) {
    storagePath_ = std::move(storagePath);
    touch(at);
}

void FileRecord::setStoragePath(std::string storagePath) {
    setStoragePath(std::move(storagePath), SystemClock().now());
}

void FileRecord::setCategory(const std::string& category, Timestamp at) {
    category_ = normalizeCategory(category);
    touch(at);
}

void FileRecord::setCategory(const std::string& category) {
    setCategory(category, SystemClock().now());
}

std::string FileRecord::shortId() const { return id_.substr(0, kShortIdLength); }

std::string FileRecord::fullPath() const { return util::joinPath(storagePath_, fileName_); }

std::string FileRecord::normalizeCategory(const std::string& category) {
    std::string t = util::trim(category);
    return t.empty() ? std::string(kDefaultCategory) : t;
}

void FileRecord::touch(Timestamp at) {
    // 시계가 뒤로 가더라도 updatedAt >= createdAt 불변식은 유지한다.
    updatedAt_ = std::max(at, createdAt_);
}

} // namespace FileReg
