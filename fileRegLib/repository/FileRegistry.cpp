#include <filereg/error/RegistryError.hpp>
#include <filereg/record/FileRecordCodec.hpp>
#include <filereg/repository/FileRegistry.hpp>
#include <filereg/util/FileOps.hpp>
#include <filereg/util/UniqueFd.hpp>
#include <filereg/util/textFormatUtil.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdio>
#include <set>

namespace FileReg {

FileRegistry::FileRegistry(const std::string& directory, std::error_code& ec) {
    open(directory, ec);
}

bool FileRegistry::open(const std::string& directory, std::error_code& ec) {
    ec.clear();
    lastError_.clear();

    // 재오픈 시 이전 상태를 남기지 않는다. 실패하면 닫힌 빈 저장소가 된다.
    open_ = false;
    records_.clear();
    byId_.clear();

    std::error_code dec;
    if (!util::makeDirectories(directory, dec)) {
        return fail(ec, Errc::storage_failure,
                    "cannot create registry directory '" + directory + "': " + dec.message());
    }

    directory_ = directory;
    registryPath_ = util::joinPath(directory_, kRegistryFileName);

    if (!loadFromDisk(ec)) {
        records_.clear();
        byId_.clear();
        return false;
    }

    open_ = true;
    spdlog::debug("FileRegistry: opened {} ({} records)", registryPath_, records_.size());
    return true;
}

bool FileRegistry::save(Ptr record, std::error_code& ec) {
    if (!requireOpen(ec))
        return false;
    if (!record || record->id().empty())
        return fail(ec, Errc::empty_field, "record without id cannot be stored");

    put(std::move(record));
    return persist(ec);
}

bool FileRegistry::saveAll(const std::vector<Ptr>& records, std::error_code& ec) {
    if (!requireOpen(ec))
        return false;
    // 입력 전체를 먼저 검사해서 일부만 메모리에 반영되는 상황을 피한다.
    for (const auto& r : records) {
        if (!r || r->id().empty())
            return fail(ec, Errc::empty_field, "record without id cannot be stored");
    }
    for (const auto& r : records)
        put(r);
    return persist(ec);
}

bool FileRegistry::deleteById(const std::string& id, std::error_code& ec) {
    if (!requireOpen(ec))
        return false;

    auto it = byId_.find(id);
    if (it == byId_.end())
        return false; // Not found: nothing removed, nothing rewritten

    byId_.erase(it);
    records_.erase(std::find_if(records_.begin(), records_.end(),
                                [&id](const Ptr& r) { return r->id() == id; }));
    return persist(ec);
}

bool FileRegistry::deleteAll(std::error_code& ec) {
    if (!requireOpen(ec))
        return false;
    records_.clear();
    byId_.clear();
    return persist(ec);
}

FileRegistry::Ptr FileRegistry::findById(const std::string& id) const {
    auto it = byId_.find(id);
    return it == byId_.end() ? nullptr : it->second;
}

std::vector<FileRegistry::Ptr> FileRegistry::findAll() const {
    std::vector<Ptr> out(records_.begin(), records_.end());
    sortNewestFirst(out);
    return out;
}

FileRegistry::Ptr FileRegistry::findByIdPrefix(const std::string& prefix) const {
    if (prefix.empty())
        return nullptr;
    for (const auto& r : findAll()) {
        if (util::startsWith(r->id(), prefix))
            return r;
    }
    return nullptr;
}

FileRegistry::Ptr FileRegistry::findByFileName(const std::string& fileName) const {
    for (const auto& r : records_) {
        if (util::iequals(r->fileName(), fileName))
            return r;
    }
    return nullptr;
}

std::vector<FileRegistry::Ptr> FileRegistry::findByCategory(const std::string& category) const {
    std::vector<Ptr> out;
    for (const auto& r : records_) {
        if (util::iequals(r->category(), category))
            out.push_back(r);
    }
    sortNewestFirst(out);
    return out;
}

std::vector<std::string> FileRegistry::categories() const {
    std::set<std::string> unique;
    for (const auto& r : records_)
        unique.insert(r->category());
    return std::vector<std::string>(unique.begin(), unique.end());
}

bool FileRegistry::persist(std::error_code& ec) {
    if (!requireOpen(ec))
        return false;
    ec.clear();
    lastError_.clear();

    const std::string tmp = tempPath();

    std::error_code wec;
    if (!writeTempFile(tmp, wec)) {
        // 임시 파일 단계에서 실패하면 기존 레지스트리 파일은 건드리지 않은 상태다.
        (void)::unlink(tmp.c_str());
        spdlog::warn("FileRegistry: writing {} failed: {}", tmp, wec.message());
        return fail(ec, Errc::storage_failure,
                    "cannot write temporary registry file '" + tmp + "': " + wec.message());
    }

    std::error_code rec;
    if (!replaceBackingFile(tmp, registryPath_, rec)) {
        // 여기서는 임시 파일을 지우지 않는다. 기존 파일이 이미 삭제되었다면
        // 최신 데이터는 임시 파일에만 남아 있다.
        spdlog::error("FileRegistry: replacing {} failed: {}", registryPath_, rec.message());
        return fail(ec, Errc::storage_failure,
                    "cannot replace registry file '" + registryPath_ + "' (latest data kept in '" +
                        tmp + "'): " + rec.message());
    }

    std::error_code sec;
    if (!syncDirectory(sec)) {
        spdlog::warn("FileRegistry: fsync of directory {} failed: {}", directory_,
                     sec.message());
    }

    spdlog::debug("FileRegistry: persisted {} records to {}", records_.size(), registryPath_);
    return true;
}

bool FileRegistry::replaceBackingFile(const std::string& tmpPath, const std::string& finalPath,
                                      std::error_code& ec) {
    ec.clear();
    if (::unlink(finalPath.c_str()) < 0 && errno != ENOENT) {
        ec = std::error_code(errno, std::generic_category());
        return false;
    }
    if (::rename(tmpPath.c_str(), finalPath.c_str()) < 0) {
        ec = std::error_code(errno, std::generic_category());
        return false;
    }
    return true;
}

bool FileRegistry::loadFromDisk(std::error_code& ec) {
    std::string data;
    std::error_code rerr;
    if (!util::readWholeFile(registryPath_, data, rerr)) {
        if (rerr == std::errc::no_such_file_or_directory) {
            // 첫 실행: 파일이 없으면 빈 레지스트리로 시작한다.
            spdlog::debug("FileRegistry: no registry file at {}", registryPath_);
            return true;
        }
        return fail(ec, Errc::storage_failure,
                    "cannot read registry file '" + registryPath_ + "': " + rerr.message());
    }

    size_t lineNo = 0;
    size_t start = 0;
    while (start < data.size()) {
        size_t end = data.find('\n', start);
        if (end == std::string::npos)
            end = data.size();
        std::string line = data.substr(start, end - start);
        start = end + 1;
        ++lineNo;

        if (util::isBlank(line))
            continue;

        std::string why;
        std::error_code cec;
        auto rec = codec::fromLine(line, cec, &why);
        if (!rec) {
            spdlog::error("FileRegistry: {}:{}: {}", registryPath_, lineNo, why);
            return fail(ec, Errc::corrupt_record,
                        registryPath_ + ":" + std::to_string(lineNo) + ": " + why);
        }
        put(std::move(rec));
    }
    return true;
}

bool FileRegistry::writeTempFile(const std::string& tmpPath, std::error_code& ec) {
    auto fd = detail::UniqueFd::open(tmpPath, O_WRONLY | O_CREAT | O_TRUNC, 0644, ec);
    if (ec)
        return false;

    std::string buf;
    for (const auto& r : records_) {
        buf += codec::toLine(*r);
        buf += '\n';
    }

    if (!fd.writeAll(buf.data(), buf.size(), ec))
        return false;
    if (!fd.sync(ec))
        return false;
    return fd.close(ec);
}

bool FileRegistry::syncDirectory(std::error_code& ec) {
    auto dfd = detail::UniqueFd::open(directory_, O_RDONLY | O_DIRECTORY, 0, ec);
    if (ec)
        return false;
    return dfd.sync(ec);
}

void FileRegistry::put(Ptr record) {
    auto it = byId_.find(record->id());
    if (it == byId_.end()) {
        byId_.emplace(record->id(), record);
        records_.push_back(std::move(record));
        return;
    }
    if (it->second == record)
        return;
    // 같은 id의 다른 객체로 교체: 삽입 순서상의 위치는 유지한다.
    for (auto& r : records_) {
        if (r->id() == record->id()) {
            r = record;
            break;
        }
    }
    it->second = std::move(record);
}

bool FileRegistry::requireOpen(std::error_code& ec) {
    ec.clear();
    lastError_.clear();
    if (open_)
        return true;
    return fail(ec, Errc::registry_not_open, "registry is not open");
}

bool FileRegistry::fail(std::error_code& ec, std::error_code code, std::string detail) {
    ec = code;
    lastError_ = std::move(detail);
    return false;
}

} // namespace FileReg
