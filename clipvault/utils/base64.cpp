/*
 * base64.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "base64.hpp"

#include <array>
#include <cctype>
#include <cstdint>

namespace clipvault::utils {

namespace {
constexpr std::string_view BASE64_CHARS =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
    "abcdefghijklmnopqrstuvwxyz"
    "0123456789+/";

constexpr auto makeReverseLookup() {
    std::array<uint8_t, 256> table{};
    table.fill(255);
    for (std::size_t i = 0; i < BASE64_CHARS.size(); ++i) {
        table[static_cast<uint8_t>(BASE64_CHARS[i])] = static_cast<uint8_t>(i);
    }
    return table;
}

constexpr auto REVERSE_LOOKUP = makeReverseLookup();
}  // namespace

auto base64Encode(std::span<const std::byte> input) -> std::string {
    std::string output;
    output.reserve(((input.size() + 2) / 3) * 4);

    std::size_t i = 0;
    for (; i + 2 < input.size(); i += 3) {
        const auto b0 = std::to_integer<uint8_t>(input[i]);
        const auto b1 = std::to_integer<uint8_t>(input[i + 1]);
        const auto b2 = std::to_integer<uint8_t>(input[i + 2]);
        output.push_back(BASE64_CHARS[b0 >> 2]);
        output.push_back(BASE64_CHARS[((b0 & 0x03) << 4) | (b1 >> 4)]);
        output.push_back(BASE64_CHARS[((b1 & 0x0F) << 2) | (b2 >> 6)]);
        output.push_back(BASE64_CHARS[b2 & 0x3F]);
    }

    const std::size_t rest = input.size() - i;
    if (rest == 1) {
        const auto b0 = std::to_integer<uint8_t>(input[i]);
        output.push_back(BASE64_CHARS[b0 >> 2]);
        output.push_back(BASE64_CHARS[(b0 & 0x03) << 4]);
        output.append("==");
    } else if (rest == 2) {
        const auto b0 = std::to_integer<uint8_t>(input[i]);
        const auto b1 = std::to_integer<uint8_t>(input[i + 1]);
        output.push_back(BASE64_CHARS[b0 >> 2]);
        output.push_back(BASE64_CHARS[((b0 & 0x03) << 4) | (b1 >> 4)]);
        output.push_back(BASE64_CHARS[(b1 & 0x0F) << 2]);
        output.push_back('=');
    }
    return output;
}

auto base64Decode(std::string_view input)
    -> std::optional<std::vector<std::byte>> {
    std::vector<std::byte> output;
    output.reserve((input.size() / 4) * 3);

    std::array<uint8_t, 4> block{};
    std::size_t filled = 0;
    bool padded = false;

    for (char ch : input) {
        const auto c = static_cast<uint8_t>(ch);
        if (std::isspace(c)) {
            continue;
        }
        if (ch == '=') {
            padded = true;
            continue;
        }
        if (padded || REVERSE_LOOKUP[c] == 255) {
            return std::nullopt;
        }

        block[filled++] = REVERSE_LOOKUP[c];
        if (filled == 4) {
            output.push_back(std::byte((block[0] << 2) | (block[1] >> 4)));
            output.push_back(
                std::byte(((block[1] & 0x0F) << 4) | (block[2] >> 2)));
            output.push_back(std::byte(((block[2] & 0x03) << 6) | block[3]));
            filled = 0;
        }
    }

    switch (filled) {
        case 0:
            break;
        case 2:
            output.push_back(std::byte((block[0] << 2) | (block[1] >> 4)));
            break;
        case 3:
            output.push_back(std::byte((block[0] << 2) | (block[1] >> 4)));
            output.push_back(
                std::byte(((block[1] & 0x0F) << 4) | (block[2] >> 2)));
            break;
        default:
            return std::nullopt;
    }
    return output;
}

}  // namespace clipvault::utils
