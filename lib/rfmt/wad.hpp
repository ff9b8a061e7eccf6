#pragma once
#include <cinttypes>
#include <cstddef>
#include <filesystem>
#include <span>
#include <string_view>
#include <variant>
#include <vector>

#include "common.hpp"

namespace rfmt {
    struct WAD {
        static constexpr std::string_view MAGIC = "RW";

        enum class CompressionType : std::uint8_t {
            NONE,
            GZIP,
            REFERENCE,
            ZSTD,
        };

        struct HeaderV1 {
            static constexpr std::size_t DATA_START = 4 + 2 + 2 + 4;
            static constexpr std::size_t ENTRY_SIZE = 24;

            std::uint16_t entry_offset;
            std::uint16_t entry_size;

            bool operator==(HeaderV1 const&) const = default;
        };

        struct HeaderV2 {
            static constexpr std::size_t ECDSA_REGION = 83;
            static constexpr std::size_t DATA_START = 4 + 1 + ECDSA_REGION + 8 + 2 + 2 + 4;
            static constexpr std::size_t ENTRY_SIZE = 32;

            std::vector<std::uint8_t> ecdsa;
            std::uint64_t file_checksum;
            std::uint16_t entry_offset;
            std::uint16_t entry_size;

            bool operator==(HeaderV2 const&) const = default;
        };

        struct HeaderV3 {
            static constexpr std::size_t ECDSA_REGION = 256;
            static constexpr std::size_t DATA_START = 4 + ECDSA_REGION + 8 + 4;
            static constexpr std::size_t ENTRY_SIZE = 32;

            std::vector<std::uint8_t> ecdsa;
            std::uint64_t file_checksum;

            bool operator==(HeaderV3 const&) const = default;
        };

        using HeaderVersion = std::variant<HeaderV1, HeaderV2, HeaderV3>;

        struct Header {
            std::uint8_t major;
            std::uint8_t minor;
            std::uint32_t file_count;
            HeaderVersion version;

            static auto read(std::span<char const> data) -> Header;

            // Content table placement, fixed per major version.
            auto data_start() const noexcept -> std::size_t;
            auto entry_size() const noexcept -> std::size_t;

            bool operator==(Header const&) const = default;
        };

        struct ContentV1 {
            bool operator==(ContentV1 const&) const = default;
        };

        struct ContentV2 {
            bool is_duplicate;
            std::uint64_t sha256;

            bool operator==(ContentV2 const&) const = default;
        };

        using ContentVersion = std::variant<ContentV1, ContentV2>;

        struct Content {
            std::uint64_t hash;
            std::uint32_t data_offset;
            std::uint32_t compressed_size;
            std::uint32_t uncompressed_size;
            CompressionType compression_type;
            ContentVersion version;

            bool operator==(Content const&) const = default;
        };

        Header header;
        std::vector<Content> content;

        static auto read(std::span<char const> data) -> WAD;
        static auto read_file(fs::path const& path) -> WAD;

        bool operator==(WAD const&) const = default;
    };

    extern auto to_string(WAD::CompressionType type) noexcept -> std::string_view;
}

template <>
struct fmt::formatter<rfmt::WAD::CompressionType> : formatter<std::string_view> {
    template <typename FormatContext>
    auto format(rfmt::WAD::CompressionType type, FormatContext& ctx) const {
        return formatter<std::string_view>::format(rfmt::to_string(type), ctx);
    }
};
