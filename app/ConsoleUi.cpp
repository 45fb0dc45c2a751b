#include "ConsoleUi.hpp"

#include <ctime>

namespace FileReg::app {

namespace {

constexpr const char* kReset = "\033[0m";
constexpr const char* kRed = "\033[31m";
constexpr const char* kGreen = "\033[32m";
constexpr const char* kYellow = "\033[33m";
constexpr const char* kCyan = "\033[36m";
constexpr const char* kBold = "\033[1m";
constexpr const char* kDim = "\033[2m";

constexpr int kBannerWidth = 70;

// 표 컬럼 폭 (ID, 파일명, 카테고리, 생성일, 경로)
constexpr size_t kIdW = 10;
constexpr size_t kNameW = 28;
constexpr size_t kCatW = 14;
constexpr size_t kDateW = 19;
constexpr size_t kPathW = 30;

std::string repeat(const std::string& unit, int n) {
    std::string s;
    for (int i = 0; i < n; ++i)
        s += unit;
    return s;
}

std::string pad(const std::string& s, size_t width) {
    std::string cell = "  " + s;
    if (cell.size() >= width)
        return cell.substr(0, width);
    return cell + std::string(width - cell.size(), ' ');
}

} // namespace

ConsoleUi::ConsoleUi(std::ostream& out, bool color) : out_(out), color_(color) {}

std::string ConsoleUi::paint(const char* code, const std::string& text) const {
    if (!color_)
        return text;
    return std::string(code) + text + kReset;
}

void ConsoleUi::banner(const std::string& title) {
    const int inner = kBannerWidth - 2;
    int padL = (inner - static_cast<int>(title.size())) / 2;
    if (padL < 0)
        padL = 0;
    int padR = inner - padL - static_cast<int>(title.size());
    if (padR < 0)
        padR = 0;

    const std::string style = std::string(kCyan) + kBold;
    out_ << "\n";
    out_ << paint(style.c_str(), "╔" + repeat("═", inner) + "╗") << "\n";
    out_ << paint(style.c_str(), "║" + std::string(padL, ' ') + title + std::string(padR, ' ') + "║")
         << "\n";
    out_ << paint(style.c_str(), "╚" + repeat("═", inner) + "╝") << "\n";
}

void ConsoleUi::subHeader(const std::string& text) {
    const std::string style = std::string(kYellow) + kBold;
    out_ << "\n" << paint(style.c_str(), "  ── " + text + " ──") << "\n";
}

void ConsoleUi::separator() { out_ << paint(kDim, "  " + repeat("─", 66)) << "\n"; }

void ConsoleUi::menuItem(const std::string& key, const std::string& label) {
    const std::string style = std::string(kGreen) + kBold;
    out_ << "  " << paint(style.c_str(), "[" + key + "]") << "  " << label << "\n";
}

void ConsoleUi::success(const std::string& msg) {
    const std::string style = std::string(kGreen) + kBold;
    out_ << paint(style.c_str(), "  [OK]  " + msg) << "\n";
}

void ConsoleUi::error(const std::string& msg) {
    const std::string style = std::string(kRed) + kBold;
    out_ << paint(style.c_str(), "  [!!]  " + msg) << "\n";
}

void ConsoleUi::info(const std::string& msg) { out_ << paint(kCyan, "  [i]   " + msg) << "\n"; }

void ConsoleUi::warning(const std::string& msg) {
    out_ << paint(kYellow, "  [!]   " + msg) << "\n";
}

void ConsoleUi::prompt(const std::string& label) {
    out_ << paint(kYellow, "  " + label) << std::flush;
}

void ConsoleUi::printTable(const std::vector<std::shared_ptr<FileRecord>>& records) {
    if (records.empty()) {
        warning("No files found.");
        return;
    }

    const std::string head = std::string(kBold) + kCyan;
    out_ << "\n";
    out_ << paint(head.c_str(), pad("ID", kIdW) + pad("File Name", kNameW) +
                                    pad("Category", kCatW) + pad("Created", kDateW) +
                                    pad("Path", kPathW))
         << "\n";
    out_ << paint(kDim, "  " + repeat("─", static_cast<int>(kIdW + kNameW + kCatW + kDateW +
                                                              kPathW - 2)))
         << "\n";

    for (const auto& r : records) {
        out_ << pad(r->shortId(), kIdW)
             << paint(kGreen, pad(truncate(r->fileName(), kNameW - 4), kNameW))
             << pad(truncate(r->category(), kCatW - 4), kCatW)
             << paint(kDim, pad(displayTime(r->createdAt()), kDateW) +
                                pad(truncate(r->storagePath(), kPathW - 4), kPathW))
             << "\n";
    }
    out_ << "\n";
}

void ConsoleUi::printDetail(const FileRecord& r) {
    auto label = [this](const char* text) { return paint(kBold, text); };

    out_ << "\n";
    subHeader("File Details");
    out_ << label("  ID         : ") << r.id() << "\n";
    out_ << label("  File Name  : ") << paint(kGreen, r.fileName()) << "\n";
    out_ << label("  Category   : ") << r.category() << "\n";
    out_ << label("  Path       : ") << r.storagePath() << "\n";
    out_ << label("  Created    : ") << displayTime(r.createdAt()) << "\n";
    out_ << label("  Updated    : ") << displayTime(r.updatedAt()) << "\n";
    out_ << label("  Content    :") << "\n";
    separator();
    printContent(r.content());
    separator();
}

void ConsoleUi::printContent(const std::string& content) {
    size_t start = 0;
    while (true) {
        size_t nl = content.find('\n', start);
        out_ << "    " << content.substr(start, nl == std::string::npos ? nl : nl - start)
             << "\n";
        if (nl == std::string::npos)
            break;
        start = nl + 1;
    }
}

void ConsoleUi::bullet(const std::string& text) { out_ << "      * " << text << "\n"; }

void ConsoleUi::blankLine() { out_ << "\n"; }

std::string ConsoleUi::displayTime(Timestamp ts) {
    std::time_t t = std::chrono::system_clock::to_time_t(ts);
    std::tm tm{};
    ::localtime_r(&t, &tm);
    char buf[32];
    if (std::strftime(buf, sizeof(buf), "%d-%b-%Y %H:%M", &tm) == 0)
        return std::string();
    return buf;
}

std::string ConsoleUi::truncate(const std::string& s, size_t max) {
    if (s.size() <= max)
        return s;
    if (max <= 3)
        return s.substr(0, max);
    return s.substr(0, max - 3) + "...";
}

} // namespace FileReg::app
