#include <filereg/error/RegistryError.hpp>
#include <filereg/record/FileRecordCodec.hpp>
#include <filereg/util/textFormatUtil.hpp>

namespace FileReg::codec {

namespace {

enum Field : size_t { kId, kFileName, kStoragePath, kCategory, kCreatedAt, kUpdatedAt, kContent };

std::shared_ptr<FileRecord> fail(std::error_code& ec, std::string* detail, std::string why) {
    ec = make_error_code(Errc::corrupt_record);
    if (detail)
        *detail = std::move(why);
    return nullptr;
}

} // namespace

std::string toLine(const FileRecord& record) {
    const char d = util::kFieldDelimiter;
    std::string out;
    out.reserve(128 + record.content().size());
    out += record.id();
    out += d;
    out += record.fileName();
    out += d;
    out += record.storagePath();
    out += d;
    out += record.category();
    out += d;
    out += util::formatTimestamp(record.createdAt());
    out += d;
    out += util::formatTimestamp(record.updatedAt());
    out += d;
    out += util::escapeContent(record.content());
    return out;
}

std::shared_ptr<FileRecord> fromLine(const std::string& line, std::error_code& ec,
                                     std::string* detail) {
    ec.clear();

    // CRLF로 편집된 파일 대비: 원래 CR은 content 안에서 항상 \r 로 escape 되므로
    // 줄 끝의 날 CR은 레코드 데이터가 아니다.
    std::string body = line;
    if (!body.empty() && body.back() == '\r')
        body.pop_back();

    // content(마지막 필드)에 남은 '|'는 분리하지 않고 그대로 둔다.
    auto parts = util::splitFields(body, util::kFieldDelimiter, kFieldCount);
    if (parts.size() < kFieldCount) {
        return fail(ec, detail,
                    "expected " + std::to_string(kFieldCount) + " fields, found " +
                        std::to_string(parts.size()));
    }

    std::string id = util::trim(parts[kId]);
    if (id.empty())
        return fail(ec, detail, "empty id field");
    if (util::isBlank(parts[kFileName]))
        return fail(ec, detail, "empty fileName field");

    Timestamp createdAt;
    Timestamp updatedAt;
    std::error_code tec;
    if (!util::parseTimestamp(util::trim(parts[kCreatedAt]), createdAt, tec))
        return fail(ec, detail, "cannot parse createdAt '" + parts[kCreatedAt] + "'");
    if (!util::parseTimestamp(util::trim(parts[kUpdatedAt]), updatedAt, tec))
        return fail(ec, detail, "cannot parse updatedAt '" + parts[kUpdatedAt] + "'");

    std::string content;
    if (!util::unescapeContent(parts[kContent], content, tec))
        return fail(ec, detail, "invalid escape sequence in content");

    // fileName / storagePath는 trim하지 않는다 (앞뒤 공백도 저장된 그대로 복원).
    return std::make_shared<FileRecord>(std::move(id), parts[kFileName], std::move(content),
                                        parts[kStoragePath], parts[kCategory], createdAt,
                                        updatedAt);
}

} // namespace FileReg::codec
