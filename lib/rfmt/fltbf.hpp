#pragma once
#include <array>
#include <bit>
#include <cinttypes>
#include <cstddef>
#include <cstring>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include "common.hpp"

// Flatbuffer-style table decoding over an immutable little-endian byte buffer.
//
// A table starts with an i32 soffset; its vtable lives at (table - soffset).
// Field i of a schema stores an u16 offset at (vtable + 2 * i), 0 meaning the
// field is absent. Strings and vectors are reached through an u32 offset that
// is relative to the position it was read from.
namespace rfmt::fltbf {
    static_assert(std::endian::native == std::endian::little, "decoders assume a little-endian host");

    struct Cursor {
        std::span<char const> data = {};

        auto size() const noexcept -> std::size_t { return data.size(); }

        auto contains(std::size_t pos, std::size_t count) const noexcept -> bool {
            return in_range(pos, count, data.size());
        }

        // Throws Truncated unless [pos, pos + count) lies inside the buffer.
        auto check(std::size_t pos, std::size_t count) const -> void;

        template <typename T>
            requires(std::is_arithmetic_v<T> || std::is_enum_v<T>)
        auto read(std::size_t pos) const -> T {
            this->check(pos, sizeof(T));
            T result;
            std::memcpy(&result, data.data() + pos, sizeof(T));
            return result;
        }

        auto read_u8(std::size_t pos) const -> std::uint8_t { return read<std::uint8_t>(pos); }
        auto read_u16(std::size_t pos) const -> std::uint16_t { return read<std::uint16_t>(pos); }
        auto read_u32(std::size_t pos) const -> std::uint32_t { return read<std::uint32_t>(pos); }
        auto read_u64(std::size_t pos) const -> std::uint64_t { return read<std::uint64_t>(pos); }
        auto read_i32(std::size_t pos) const -> std::int32_t { return read<std::int32_t>(pos); }

        // Throws InvalidMagic when the bytes at pos are not tag.
        auto read_tag(std::size_t pos, std::string_view tag) const -> std::string;

        auto slice(std::size_t pos, std::size_t count) const -> std::span<char const>;

        // pos + u32 stored at pos
        auto follow(std::size_t pos) const -> std::size_t;
    };

    template <typename F>
    concept Schema = std::is_enum_v<F> && requires { F::COUNT; };

    extern auto read_string(Cursor const& cur, std::size_t pos) -> std::string;

    template <Schema F>
    struct Table {
        static constexpr std::size_t SIZE = (std::size_t)F::COUNT;

        Cursor cur = {};
        std::size_t pos = {};
        std::size_t vtable = {};
        std::array<std::uint16_t, SIZE> offsets = {};

        static auto read(Cursor const& cur, std::size_t pos) -> Table {
            auto result = Table{.cur = cur, .pos = pos};
            auto const soffset = cur.read<std::int32_t>(pos);
            auto const vtable = (std::int64_t)pos - (std::int64_t)soffset;
            rfmt_assert(Truncated, pos, vtable >= 0 && (std::uint64_t)vtable <= cur.size());
            result.vtable = (std::size_t)vtable;
            for (std::size_t i = 0; i != SIZE; ++i) {
                result.offsets[i] = cur.read<std::uint16_t>(result.vtable + i * 2);
            }
            return result;
        }

        auto has(F field) const noexcept -> bool { return offsets[(std::size_t)field] != 0; }

        auto field(F field) const noexcept -> std::optional<std::size_t> {
            if (auto voffset = offsets[(std::size_t)field]) {
                return pos + voffset;
            }
            return std::nullopt;
        }

        template <typename T>
        auto get(F field) const -> T {
            auto at = this->field(field);
            rfmt_assert(MissingField, vtable + (std::size_t)field * 2, at.has_value());
            return cur.read<T>(*at);
        }

        template <typename T>
        auto get_or(F field, T fallback = {}) const -> T {
            if (auto at = this->field(field)) {
                return cur.read<T>(*at);
            }
            return fallback;
        }

        auto string(F field) const -> std::string {
            auto at = this->field(field);
            rfmt_assert(MissingField, vtable + (std::size_t)field * 2, at.has_value());
            return read_string(cur, *at);
        }

        auto string_or(F field) const -> std::string {
            if (auto at = this->field(field)) {
                return read_string(cur, *at);
            }
            return {};
        }

        // Absent vector fields decode as empty.
        auto vector_start(F field) const -> std::optional<std::size_t> {
            if (auto at = this->field(field)) {
                return cur.follow(*at);
            }
            return std::nullopt;
        }
    };

    // Vector of u32 offsets to tables, each relative to its own slot.
    template <Schema F, typename Func>
    auto read_vector(Cursor const& cur, std::size_t start, Func&& decode)
        -> std::vector<std::invoke_result_t<Func&, Table<F> const&>> {
        auto const count = cur.read<std::uint32_t>(start);
        rfmt_assert(Truncated, start, cur.contains(start + 4, (std::size_t)count * 4));
        auto result = std::vector<std::invoke_result_t<Func&, Table<F> const&>>{};
        result.reserve(count);
        for (std::uint32_t i = 0; i != count; ++i) {
            auto const entry = start + 4 + (std::size_t)i * 4;
            auto const table = Table<F>::read(cur, cur.follow(entry));
            result.push_back(decode(table));
        }
        return result;
    }

    // Vector of inline scalars, no indirection.
    template <typename T>
        requires(std::is_arithmetic_v<T> || std::is_enum_v<T>)
    auto read_long_vector(Cursor const& cur, std::size_t start) -> std::vector<T> {
        auto const count = cur.read<std::uint32_t>(start);
        rfmt_assert(Truncated, start, cur.contains(start + 4, (std::size_t)count * sizeof(T)));
        auto result = std::vector<T>{};
        result.reserve(count);
        for (std::uint32_t i = 0; i != count; ++i) {
            result.push_back(cur.read<T>(start + 4 + (std::size_t)i * sizeof(T)));
        }
        return result;
    }
}
