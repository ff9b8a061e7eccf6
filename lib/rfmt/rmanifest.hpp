#pragma once
#include <array>
#include <cinttypes>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "common.hpp"

namespace rfmt {
    enum class ManifestID : std::uint64_t { None };

    enum class BundleID : std::uint64_t { None };

    enum class ChunkID : std::uint64_t { None };

    enum class FileID : std::uint64_t { None };

    enum class DirID : std::uint64_t { None };

    enum class LangID : std::uint8_t { None };

    struct RMAN {
        static constexpr std::string_view MAGIC = "RMAN";
        // Upper bound on a decompressed body, the header's own length field is not trusted.
        static constexpr std::size_t MAX_BODY_SIZE = 256 * 1024 * 1024;

        struct Header {
            static constexpr std::size_t SIZE = 28;

            std::string magic;
            std::uint8_t major;
            std::uint8_t minor;
            std::uint8_t unknown;
            std::uint8_t signature_type;
            std::uint32_t offset;
            std::uint32_t length;
            ManifestID manifestId;
            std::uint32_t decompressed_length;

            static auto read(std::span<char const> data) -> Header;

            bool operator==(Header const&) const = default;
        };

        // Absolute section starts inside the decompressed body.
        struct OffsetMap {
            std::size_t bundles;
            std::size_t languages;
            std::size_t files;
            std::size_t directories;

            static auto read(std::span<char const> body) -> OffsetMap;

            bool operator==(OffsetMap const&) const = default;
        };

        struct Chunk {
            ChunkID chunkId;
            std::uint32_t compressed_size;
            std::uint32_t uncompressed_size;

            bool operator==(Chunk const&) const = default;
        };

        struct Bundle {
            BundleID bundleId;
            std::vector<Chunk> chunks;

            bool operator==(Bundle const&) const = default;
        };

        struct Language {
            LangID langId;
            std::string name;

            bool operator==(Language const&) const = default;
        };

        struct Directory {
            DirID dirId;
            DirID parentId;
            std::string name;

            bool operator==(Directory const&) const = default;
        };

        struct FileEntry {
            FileID fileId;
            std::string name;
            std::string symlink;
            DirID dirId;
            std::uint32_t size;
            std::uint32_t langs;
            std::vector<ChunkID> chunkIds;

            bool operator==(FileEntry const&) const = default;
        };

        struct Body {
            std::vector<Bundle> bundles;
            std::vector<Language> languages;
            std::vector<FileEntry> files;
            std::vector<Directory> directories;

            static auto read(std::span<char const> body) -> Body;

            bool operator==(Body const&) const = default;
        };

        // Where a chunk lives inside its bundle.
        struct ChunkSrc : Chunk {
            BundleID bundleId;
            std::uint64_t compressed_offset;
        };

        // Cross-section lookups, built once per manifest.
        struct Resolver {
            explicit Resolver(RMAN const& manifest);

            auto path(FileEntry const& file) const -> std::string;
            auto langs(FileEntry const& file) const -> std::string;
            auto chunk(ChunkID chunkId) const -> std::optional<ChunkSrc>;

        private:
            std::unordered_map<LangID, std::string_view> lang_names_;
            std::unordered_map<DirID, Directory const*> dirs_;
            std::unordered_map<ChunkID, ChunkSrc> chunks_;
        };

        using decompress_cb = function_ref<std::vector<char>(std::span<char const> src)>;

        Header header;
        Body body;

        static auto read(std::span<char const> data) -> RMAN;
        static auto read(std::span<char const> data, decompress_cb decompress) -> RMAN;
        static auto read_file(fs::path const& path) -> RMAN;

        bool operator==(RMAN const&) const = default;
    };
}

template <>
struct fmt::formatter<rfmt::ManifestID> : formatter<std::string> {
    template <typename FormatContext>
    auto format(rfmt::ManifestID id, FormatContext& ctx) const {
        return formatter<std::string>::format(fmt::format("{:016X}", (std::uint64_t)id), ctx);
    }
};

template <>
struct fmt::formatter<rfmt::BundleID> : formatter<std::string> {
    template <typename FormatContext>
    auto format(rfmt::BundleID id, FormatContext& ctx) const {
        return formatter<std::string>::format(fmt::format("{:016X}", (std::uint64_t)id), ctx);
    }
};

template <>
struct fmt::formatter<rfmt::ChunkID> : formatter<std::string> {
    template <typename FormatContext>
    auto format(rfmt::ChunkID id, FormatContext& ctx) const {
        return formatter<std::string>::format(fmt::format("{:016X}", (std::uint64_t)id), ctx);
    }
};

template <>
struct fmt::formatter<rfmt::FileID> : formatter<std::string> {
    template <typename FormatContext>
    auto format(rfmt::FileID id, FormatContext& ctx) const {
        return formatter<std::string>::format(fmt::format("{:016X}", (std::uint64_t)id), ctx);
    }
};

template <>
struct fmt::formatter<rfmt::DirID> : formatter<std::string> {
    template <typename FormatContext>
    auto format(rfmt::DirID id, FormatContext& ctx) const {
        return formatter<std::string>::format(fmt::format("{:016X}", (std::uint64_t)id), ctx);
    }
};

template <>
struct fmt::formatter<rfmt::LangID> : formatter<unsigned> {
    template <typename FormatContext>
    auto format(rfmt::LangID id, FormatContext& ctx) const {
        return formatter<unsigned>::format((unsigned)id, ctx);
    }
};
