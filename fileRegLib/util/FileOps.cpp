#include <filereg/error/RegistryError.hpp>
#include <filereg/util/FileOps.hpp>
#include <filereg/util/UniqueFd.hpp>

#include <sys/stat.h>

#include <cstdio>
#include <cstdlib>
#include <filesystem>

namespace FileReg::util {

namespace fs = std::filesystem;

namespace {

std::error_code lastErrno() { return std::error_code(errno, std::generic_category()); }

bool copyThenUnlink(const std::string& from, const std::string& to, std::error_code& ec) {
    struct stat st{};
    if (::stat(from.c_str(), &st) < 0) {
        ec = lastErrno();
        return false;
    }

    auto in = detail::UniqueFd::open(from, O_RDONLY, 0, ec);
    if (ec)
        return false;
    // O_EXCL: 확인 이후 다른 누군가 대상 파일을 만들었다면 덮어쓰지 않고 실패한다.
    auto out = detail::UniqueFd::open(to, O_WRONLY | O_CREAT | O_EXCL, st.st_mode & 07777, ec);
    if (ec) {
        if (ec == std::errc::file_exists)
            ec = make_error_code(Errc::duplicate_file);
        return false;
    }

    char buf[8192];
    while (true) {
        ssize_t n = ::read(in.get(), buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR)
                continue;
            ec = lastErrno();
            break;
        }
        if (n == 0)
            break;
        if (!out.writeAll(buf, static_cast<size_t>(n), ec))
            break;
    }
    if (!ec)
        out.sync(ec);
    if (!ec)
        out.close(ec);
    if (ec) {
        // 복사 실패 시 반쯤 만들어진 대상 파일을 남기지 않는다. 원본은 그대로 둔다.
        out.reset();
        (void)::unlink(to.c_str());
        return false;
    }

    if (::unlink(from.c_str()) < 0) {
        ec = lastErrno();
        return false;
    }
    return true;
}

} // namespace

bool writeTextFile(const std::string& path, const std::string& content, std::error_code& ec) {
    ec.clear();
    // 같은 디렉터리의 임시 파일에 먼저 쓰고 rename 한다. 실패하면 대상 파일은 그대로 남는다.
    std::string tmp = path + ".XXXXXX";
    detail::UniqueFd fd(::mkstemp(&tmp[0]));
    if (!fd) {
        ec = lastErrno();
        return false;
    }

    bool ok = ::fchmod(fd.get(), 0644) == 0;
    if (!ok)
        ec = lastErrno();
    if (ok)
        ok = fd.writeAll(content.data(), content.size(), ec);
    if (ok)
        ok = fd.sync(ec);
    if (ok)
        ok = fd.close(ec);
    if (ok && ::rename(tmp.c_str(), path.c_str()) < 0) {
        ec = lastErrno();
        ok = false;
    }
    if (!ok) {
        fd.reset();
        (void)::unlink(tmp.c_str());
    }
    return ok;
}

bool readWholeFile(const std::string& path, std::string& out, std::error_code& ec) {
    auto fd = detail::UniqueFd::open(path, O_RDONLY, 0, ec);
    if (ec)
        return false;

    std::string data;
    char buf[8192];
    while (true) {
        ssize_t n = ::read(fd.get(), buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR)
                continue;
            ec = lastErrno();
            return false;
        }
        if (n == 0)
            break;
        data.append(buf, static_cast<size_t>(n));
    }
    out = std::move(data);
    return true;
}

bool readTextFile(const std::string& path, std::string& out, std::error_code& ec) {
    std::string raw;
    if (!readWholeFile(path, raw, ec))
        return false;
    out = normalizeLineEndings(raw);
    return true;
}

bool movePath(const std::string& from, const std::string& to, std::error_code& ec) {
    ec.clear();
    if (pathExists(to)) {
        ec = make_error_code(Errc::duplicate_file);
        return false;
    }
    if (::rename(from.c_str(), to.c_str()) == 0)
        return true;
    if (errno != EXDEV) {
        ec = lastErrno();
        return false;
    }
    return copyThenUnlink(from, to, ec);
}

bool removeFile(const std::string& path, std::error_code& ec) {
    ec.clear();
    if (::unlink(path.c_str()) < 0) {
        ec = lastErrno();
        return false;
    }
    return true;
}

bool makeDirectories(const std::string& path, std::error_code& ec) {
    ec.clear();
    if (path.empty()) {
        ec = std::make_error_code(std::errc::invalid_argument);
        return false;
    }
    if (isDirectory(path))
        return true;
    if (pathExists(path)) {
        ec = std::make_error_code(std::errc::not_a_directory);
        return false;
    }
    fs::create_directories(fs::path(path), ec);
    if (ec)
        return false;
    // create_directories는 경합 상황에서 false를 돌려줄 수 있으므로 최종 상태로 판단한다.
    if (!isDirectory(path)) {
        ec = std::make_error_code(std::errc::not_a_directory);
        return false;
    }
    return true;
}

bool pathExists(const std::string& path) {
    struct stat st{};
    return ::lstat(path.c_str(), &st) == 0;
}

bool isDirectory(const std::string& path) {
    struct stat st{};
    return ::stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

std::string joinPath(const std::string& dir, const std::string& name) {
    if (dir.empty())
        return name;
    if (dir.back() == '/')
        return dir + name;
    return dir + "/" + name;
}

std::string normalizeLineEndings(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '\r') {
            out.push_back('\n');
            if (i + 1 < text.size() && text[i + 1] == '\n')
                ++i;
        } else {
            out.push_back(c);
        }
    }
    return out;
}

} // namespace FileReg::util
