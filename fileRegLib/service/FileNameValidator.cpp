#include <filereg/error/RegistryError.hpp>
#include <filereg/service/FileNameValidator.hpp>
#include <filereg/util/textFormatUtil.hpp>

#include <cstring>

namespace FileReg::service {

namespace {

// '|', LF, CR, NUL (find_first_of에 길이 4로 넘긴다)
constexpr char kLineBreakingChars[] = "|\n\r\0";

bool reject(std::error_code& ec, Errc code, std::string* detail, std::string why) {
    ec = make_error_code(code);
    if (detail)
        *detail = std::move(why);
    return false;
}

} // namespace

bool validateFileName(const std::string& name, std::error_code& ec, std::string* detail) {
    ec.clear();
    if (util::isBlank(name))
        return reject(ec, Errc::empty_field, detail, "File name cannot be empty.");

    // strchr는 '\0'도 문자열 끝으로 찾아내므로 NUL은 따로 검사한다.
    if (name.find('\0') != std::string::npos)
        return reject(ec, Errc::invalid_file_name, detail,
                      "File name cannot contain NUL characters.");

    std::string illegal;
    for (char c : name) {
        if (std::strchr(kIllegalFileNameChars, c) != nullptr)
            illegal.push_back(c);
    }
    if (!illegal.empty()) {
        return reject(ec, Errc::invalid_file_name, detail,
                      "File name contains illegal characters: " + illegal);
    }

    if (name.find_first_of("\n\r") != std::string::npos)
        return reject(ec, Errc::invalid_file_name, detail, "File name cannot contain line breaks.");

    if (name.find('.') == std::string::npos) {
        return reject(ec, Errc::invalid_file_name, detail,
                      "File name must include an extension (e.g. notes.txt).");
    }
    return true;
}

bool validateStoragePath(const std::string& path, std::error_code& ec, std::string* detail) {
    ec.clear();
    if (util::isBlank(path))
        return reject(ec, Errc::empty_field, detail, "Storage path cannot be empty.");

    // 레지스트리 한 줄 포맷에서 storagePath는 escape되지 않으므로 구분자/개행을 허용하지 않는다.
    if (path.find_first_of(kLineBreakingChars, 0, 4) != std::string::npos) {
        return reject(ec, Errc::invalid_storage_path, detail,
                      "Storage path cannot contain '|' or line breaks.");
    }
    return true;
}

bool validateCategory(const std::string& category, std::error_code& ec, std::string* detail) {
    ec.clear();
    // category도 escape 없이 기록되므로 한 줄 포맷을 깨는 문자는 거부한다. 빈 값은 "General".
    if (category.find_first_of(kLineBreakingChars, 0, 4) != std::string::npos) {
        return reject(ec, Errc::invalid_category, detail,
                      "Category cannot contain '|' or line breaks.");
    }
    return true;
}

} // namespace FileReg::service
