#pragma once
/// @file textFormatUtil.hpp
/// @brief Text helpers shared by the registry line format

#include <filereg/error/RegistryError.hpp>
#include <filereg/util/Clock.hpp>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <string>
#include <system_error>
#include <vector>

namespace FileReg::util {

/// @brief Field separator of a registry line
constexpr char kFieldDelimiter = '|';

/// @brief Timestamp layout, "YYYY-MM-DDTHH:MM:SS"
constexpr size_t kTimestampLength = 19;

inline bool isSpace(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }

inline std::string trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && isSpace(s[b]))
        ++b;
    while (e > b && isSpace(s[e - 1]))
        --e;
    return s.substr(b, e - b);
}

inline bool isBlank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](char c) { return isSpace(c); });
}

inline std::string toLower(std::string s) {
    for (auto& c : s)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

/// @brief ASCII case-insensitive equality
inline bool iequals(const std::string& a, const std::string& b) {
    if (a.size() != b.size())
        return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i])))
            return false;
    }
    return true;
}

inline bool startsWith(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

/// @brief Escapes the content field of a registry line
/// @details Substitution order is fixed: backslash first, then LF, CR and the delimiter,
///          so an introduced backslash is never escaped twice.
inline std::string escapeContent(const std::string& in) {
    std::string o;
    o.reserve(in.size() + 8);
    for (char c : in) {
        if (c == '\\')
            o += "\\\\";
        else if (c == '\n')
            o += "\\n";
        else if (c == '\r')
            o += "\\r";
        else if (c == kFieldDelimiter)
            o += "\\p";
        else
            o.push_back(c);
    }
    return o;
}

/// @brief Reverses escapeContent
/// @details Single left-to-right scan: each backslash consumes exactly the next character,
///          so "\\p" decodes to backslash + 'p' rather than to a delimiter.
/// @return false with ec = Errc::corrupt_record on an unknown or dangling escape
inline bool unescapeContent(const std::string& in, std::string& out, std::error_code& ec) {
    ec.clear();
    std::string s;
    s.reserve(in.size());
    for (size_t i = 0; i < in.size(); ++i) {
        char c = in[i];
        if (c != '\\') {
            s.push_back(c);
            continue;
        }
        if (i + 1 >= in.size()) {
            ec = make_error_code(Errc::corrupt_record);
            return false;
        }
        char e = in[++i];
        if (e == 'p')
            s.push_back(kFieldDelimiter);
        else if (e == 'n')
            s.push_back('\n');
        else if (e == 'r')
            s.push_back('\r');
        else if (e == '\\')
            s.push_back('\\');
        else {
            ec = make_error_code(Errc::corrupt_record);
            return false;
        }
    }
    out = std::move(s);
    return true;
}

/// @brief Splits at the first (maxFields - 1) delimiters
/// @details The last field keeps any remaining delimiters verbatim.
inline std::vector<std::string> splitFields(const std::string& line, char delim,
                                            size_t maxFields) {
    std::vector<std::string> out;
    if (maxFields == 0)
        return out;
    size_t start = 0;
    while (out.size() + 1 < maxFields) {
        size_t pos = line.find(delim, start);
        if (pos == std::string::npos)
            break;
        out.push_back(line.substr(start, pos - start));
        start = pos + 1;
    }
    out.push_back(line.substr(start));
    return out;
}

/// @brief Formats as "YYYY-MM-DDTHH:MM:SS" in UTC
inline std::string formatTimestamp(Timestamp ts) {
    std::time_t t = std::chrono::system_clock::to_time_t(ts);
    std::tm tm{};
    ::gmtime_r(&t, &tm);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d", tm.tm_year + 1900,
                  tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec);
    return buf;
}

/// @brief Strict inverse of formatTimestamp
/// @return false with ec = Errc::corrupt_record when the text is not an exact, valid instant
inline bool parseTimestamp(const std::string& s, Timestamp& out, std::error_code& ec) {
    ec.clear();
    auto fail = [&ec]() {
        ec = make_error_code(Errc::corrupt_record);
        return false;
    };

    if (s.size() != kTimestampLength)
        return fail();
    // 고정 위치 구분자 검사: YYYY-MM-DDTHH:MM:SS
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        bool sep = (i == 4 || i == 7 || i == 10 || i == 13 || i == 16);
        if (sep) {
            char want = (i == 4 || i == 7) ? '-' : (i == 10 ? 'T' : ':');
            if (c != want)
                return fail();
        } else if (!std::isdigit(static_cast<unsigned char>(c))) {
            return fail();
        }
    }

    auto num = [&s](size_t pos, size_t len) { return std::stoi(s.substr(pos, len)); };
    std::tm tm{};
    tm.tm_year = num(0, 4) - 1900;
    tm.tm_mon = num(5, 2) - 1;
    tm.tm_mday = num(8, 2);
    tm.tm_hour = num(11, 2);
    tm.tm_min = num(14, 2);
    tm.tm_sec = num(17, 2);
    std::tm want = tm;

    std::time_t t = ::timegm(&tm);
    if (t == static_cast<std::time_t>(-1))
        return fail();

    // timegm은 범위를 넘는 값(2월 30일 등)을 조용히 정규화하므로 역변환으로 재확인한다.
    std::tm back{};
    ::gmtime_r(&t, &back);
    if (back.tm_year != want.tm_year || back.tm_mon != want.tm_mon ||
        back.tm_mday != want.tm_mday || back.tm_hour != want.tm_hour ||
        back.tm_min != want.tm_min || back.tm_sec != want.tm_sec)
        return fail();

    out = std::chrono::time_point_cast<std::chrono::seconds>(
        std::chrono::system_clock::from_time_t(t));
    return true;
}

} // namespace FileReg::util
