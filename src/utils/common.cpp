#include "utils/common.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <random>

namespace osintpipe::utils {

std::string ToIso(std::chrono::system_clock::time_point tp) {
    const auto time = std::chrono::system_clock::to_time_t(tp);
    const auto ms = ToMs(tp) % 1000;
    std::tm utc_time{};
    gmtime_r(&time, &utc_time);
    std::ostringstream oss;
    oss << std::put_time(&utc_time, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << ms << 'Z';
    return oss.str();
}

std::string FoldCase(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (std::size_t i = 0; i < value.size(); ++i) {
        const auto lead = static_cast<unsigned char>(value[i]);
        if (lead < 0x80) {
            out.push_back(static_cast<char>(std::tolower(lead)));
            continue;
        }
        if ((lead != 0xD0 && lead != 0xD2) || i + 1 >= value.size()) {
            out.push_back(value[i]);
            continue;
        }
        const auto next = static_cast<unsigned char>(value[i + 1]);
        if (lead == 0xD0 && next >= 0x90 && next <= 0x9F) {
            // А-П -> а-п
            out.push_back(static_cast<char>(0xD0));
            out.push_back(static_cast<char>(next + 0x20));
        } else if (lead == 0xD0 && next >= 0xA0 && next <= 0xAF) {
            // Р-Я -> р-я
            out.push_back(static_cast<char>(0xD1));
            out.push_back(static_cast<char>(next - 0x20));
        } else if (lead == 0xD0 && next >= 0x80 && next <= 0x8F) {
            // Ѐ-Џ (Ё, Є, І, Ї) -> ѐ-џ
            out.push_back(static_cast<char>(0xD1));
            out.push_back(static_cast<char>(next + 0x10));
        } else if (lead == 0xD2 && next == 0x90) {
            out.push_back(static_cast<char>(0xD2));
            out.push_back(static_cast<char>(0x91));
        } else {
            out.push_back(value[i]);
            out.push_back(value[i + 1]);
        }
        ++i;
    }
    return out;
}

std::string GenerateId(std::size_t length) {
    static const char* kChars = "0123456789abcdef";
    thread_local std::mt19937_64 gen{std::random_device{}()};
    std::uniform_int_distribution<int> dist(0, 15);
    std::string id;
    id.reserve(length);
    for (std::size_t i = 0; i < length; ++i) {
        id.push_back(kChars[dist(gen)]);
    }
    return id;
}

}  // namespace osintpipe::utils
