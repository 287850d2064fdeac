/*
 * uuid.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-6-3

Description: Random (version 4) UUIDs used as entry, group and queue ids

**************************************************/

#ifndef CLIPVAULT_UTILS_UUID_HPP
#define CLIPVAULT_UTILS_UUID_HPP

#include <array>
#include <compare>
#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace clipvault::utils {

/**
 * @class UUID
 * @brief 128-bit identifier, rendered in the canonical 8-4-4-4-12 form
 * with upper-case hex digits.
 */
class UUID {
public:
    /**
     * @brief Constructs the nil UUID. Use generateV4() for a fresh id.
     */
    UUID() noexcept = default;

    explicit UUID(const std::array<uint8_t, 16>& data) noexcept;

    [[nodiscard]] static auto generateV4() -> UUID;

    /**
     * @brief Parses the canonical form, case-insensitive.
     * @return std::nullopt if str is not a well-formed UUID.
     */
    [[nodiscard]] static auto fromString(std::string_view str)
        -> std::optional<UUID>;

    [[nodiscard]] static auto isValidUUID(std::string_view str) noexcept
        -> bool;

    [[nodiscard]] auto toString() const -> std::string;

    [[nodiscard]] auto isNil() const noexcept -> bool;

    [[nodiscard]] auto getData() const noexcept
        -> const std::array<uint8_t, 16>& {
        return data_;
    }

    auto operator==(const UUID& other) const -> bool = default;
    auto operator<=>(const UUID& other) const = default;

    friend auto operator<<(std::ostream& os, const UUID& uuid)
        -> std::ostream&;

private:
    std::array<uint8_t, 16> data_{};
};

}  // namespace clipvault::utils

template <>
struct std::hash<clipvault::utils::UUID> {
    auto operator()(const clipvault::utils::UUID& uuid) const noexcept
        -> std::size_t {
        const auto& data = uuid.getData();
        std::size_t seed = 0;
        for (auto byte : data) {
            seed ^= static_cast<std::size_t>(byte) + 0x9e3779b9 + (seed << 6) +
                    (seed >> 2);
        }
        return seed;
    }
};

#endif  // CLIPVAULT_UTILS_UUID_HPP
