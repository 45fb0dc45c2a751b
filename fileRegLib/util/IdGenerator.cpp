#include <filereg/util/IdGenerator.hpp>

#include <array>
#include <cstdint>

namespace FileReg {

namespace {

std::mt19937_64::result_type seedFromDevice() {
    std::random_device rd;
    // random_device는 32bit 결과를 주므로 두 번 뽑아 64bit seed를 만든다.
    return (static_cast<std::mt19937_64::result_type>(rd()) << 32) ^ rd();
}

} // namespace

RandomUuidGenerator::RandomUuidGenerator() : engine_(seedFromDevice()) {}

RandomUuidGenerator::RandomUuidGenerator(std::mt19937_64::result_type seed) : engine_(seed) {}

std::string RandomUuidGenerator::next() {
    static const char* hex = "0123456789abcdef";

    std::array<std::uint8_t, 16> bytes{};
    for (size_t i = 0; i < bytes.size(); i += 8) {
        auto v = engine_();
        for (size_t j = 0; j < 8; ++j)
            bytes[i + j] = static_cast<std::uint8_t>(v >> (j * 8));
    }
    // RFC 4122: version 4, variant 10xx
    bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3F) | 0x80);

    std::string out;
    out.reserve(36);
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10)
            out.push_back('-');
        out.push_back(hex[bytes[i] >> 4]);
        out.push_back(hex[bytes[i] & 0x0F]);
    }
    return out;
}

IdGenerator& defaultIdGenerator() {
    static RandomUuidGenerator generator;
    return generator;
}

} // namespace FileReg
