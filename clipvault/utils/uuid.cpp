/*
 * uuid.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "uuid.hpp"

#include <algorithm>
#include <cctype>
#include <random>
#include <stdexcept>

namespace clipvault::utils {

namespace {
constexpr std::string_view kHexDigits = "0123456789ABCDEF";

auto hexValue(char c) noexcept -> int {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

auto isDashPosition(std::size_t i) noexcept -> bool {
    return i == 8 || i == 13 || i == 18 || i == 23;
}
}  // namespace

UUID::UUID(const std::array<uint8_t, 16>& data) noexcept : data_(data) {}

auto UUID::generateV4() -> UUID {
    try {
        static thread_local std::random_device rd;
        static thread_local std::mt19937_64 gen(rd());
        std::uniform_int_distribution<uint32_t> dist(0, 255);

        std::array<uint8_t, 16> uuid_data;
        std::ranges::generate(uuid_data,
                              [&]() { return static_cast<uint8_t>(dist(gen)); });

        uuid_data[6] = (uuid_data[6] & 0x0F) | 0x40;  // Version 4
        uuid_data[8] = (uuid_data[8] & 0x3F) | 0x80;  // RFC 4122 variant

        return UUID(uuid_data);
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("Failed to generate UUID v4: ") +
                                 e.what());
    }
}

auto UUID::isValidUUID(std::string_view str) noexcept -> bool {
    if (str.size() != 36) {
        return false;
    }
    for (std::size_t i = 0; i < str.size(); ++i) {
        if (isDashPosition(i)) {
            if (str[i] != '-') {
                return false;
            }
        } else if (hexValue(str[i]) < 0) {
            return false;
        }
    }
    return true;
}

auto UUID::fromString(std::string_view str) -> std::optional<UUID> {
    if (!isValidUUID(str)) {
        return std::nullopt;
    }

    std::array<uint8_t, 16> data{};
    std::size_t pos = 0;
    for (auto& byte : data) {
        if (str[pos] == '-') {
            ++pos;
        }
        byte = static_cast<uint8_t>((hexValue(str[pos]) << 4) |
                                    hexValue(str[pos + 1]));
        pos += 2;
    }
    return UUID(data);
}

auto UUID::toString() const -> std::string {
    std::string out;
    out.reserve(36);
    for (std::size_t i = 0; i < data_.size(); ++i) {
        out.push_back(kHexDigits[data_[i] >> 4]);
        out.push_back(kHexDigits[data_[i] & 0x0F]);
        if (i == 3 || i == 5 || i == 7 || i == 9) {
            out.push_back('-');
        }
    }
    return out;
}

auto UUID::isNil() const noexcept -> bool {
    return std::ranges::all_of(data_, [](uint8_t b) { return b == 0; });
}

auto operator<<(std::ostream& os, const UUID& uuid) -> std::ostream& {
    return os << uuid.toString();
}

}  // namespace clipvault::utils
