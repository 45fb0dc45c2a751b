#include <filereg/error/RegistryError.hpp>

namespace FileReg {

namespace {

class RegistryCategory final : public std::error_category {
  public:
    const char* name() const noexcept override { return "filereg"; }

    std::string message(int ev) const override {
        switch (static_cast<Errc>(ev)) {
        case Errc::empty_field:
            return "required field is empty";
        case Errc::invalid_file_name:
            return "invalid file name";
        case Errc::invalid_storage_path:
            return "invalid storage path";
        case Errc::duplicate_file:
            return "file already exists";
        case Errc::record_not_found:
            return "record not found";
        case Errc::file_missing:
            return "file does not exist on disk";
        case Errc::corrupt_record:
            return "corrupt registry record";
        case Errc::storage_failure:
            return "registry storage failure";
        case Errc::partially_applied:
            return "operation partially applied";
        case Errc::registry_not_open:
            return "registry is not open";
        case Errc::invalid_category:
            return "invalid category";
        }
        return "unknown filereg error";
    }

    // Errc -> ErrorKind 매핑. 호출자는 ec == ErrorKind::storage 처럼 종류 단위로 분기한다.
    std::error_condition default_error_condition(int ev) const noexcept override {
        switch (static_cast<Errc>(ev)) {
        case Errc::empty_field:
        case Errc::invalid_file_name:
        case Errc::invalid_storage_path:
        case Errc::invalid_category:
            return ErrorKind::validation;
        case Errc::duplicate_file:
            return ErrorKind::duplicate;
        case Errc::record_not_found:
        case Errc::file_missing:
            return ErrorKind::not_found;
        case Errc::storage_failure:
        case Errc::partially_applied:
        case Errc::registry_not_open:
            return ErrorKind::storage;
        case Errc::corrupt_record:
            return ErrorKind::corruption;
        }
        return std::error_condition(ev, *this);
    }
};

class ErrorKindCategory final : public std::error_category {
  public:
    const char* name() const noexcept override { return "filereg.kind"; }

    std::string message(int ev) const override {
        return kindName(static_cast<ErrorKind>(ev));
    }

    bool equivalent(const std::error_code& code, int condition) const noexcept override {
        // OS 레벨 errno(generic/system)는 모두 storage 종류로 취급한다.
        if (code.category() == std::generic_category() ||
            code.category() == std::system_category()) {
            return static_cast<ErrorKind>(condition) == ErrorKind::storage && code.value() != 0;
        }
        if (code.category() == registryCategory()) {
            return registryCategory().default_error_condition(code.value()) ==
                   std::error_condition(condition, *this);
        }
        return false;
    }
};

} // namespace

const std::error_category& registryCategory() noexcept {
    static const RegistryCategory instance;
    return instance;
}

const std::error_category& errorKindCategory() noexcept {
    static const ErrorKindCategory instance;
    return instance;
}

std::error_code make_error_code(Errc e) noexcept {
    return std::error_code(static_cast<int>(e), registryCategory());
}

std::error_condition make_error_condition(ErrorKind k) noexcept {
    return std::error_condition(static_cast<int>(k), errorKindCategory());
}

ErrorKind classify(const std::error_code& ec) noexcept {
    if (!ec)
        return ErrorKind{};
    for (auto k : {ErrorKind::validation, ErrorKind::duplicate, ErrorKind::not_found,
                   ErrorKind::storage, ErrorKind::corruption}) {
        if (ec == k)
            return k;
    }
    return ErrorKind{};
}

const char* kindName(ErrorKind kind) noexcept {
    switch (kind) {
    case ErrorKind::validation:
        return "validation";
    case ErrorKind::duplicate:
        return "duplicate";
    case ErrorKind::not_found:
        return "not found";
    case ErrorKind::storage:
        return "storage";
    case ErrorKind::corruption:
        return "corruption";
    }
    return "none";
}

} // namespace FileReg
