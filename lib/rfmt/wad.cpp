#include "wad.hpp"

#include "fltbf.hpp"
#include "iofile.hpp"

using namespace rfmt;
using fltbf::Cursor;

namespace {
    auto to_compression_type(std::uint32_t value, std::size_t pos) -> WAD::CompressionType {
        if (value > (std::uint32_t)WAD::CompressionType::ZSTD) [[unlikely]] {
            throw_error(ErrorKind::UnsupportedVersion,
                        pos,
                        __PRETTY_FUNCTION__,
                        fmt::format("expected compression type 0..3, found {}", value));
        }
        return (WAD::CompressionType)value;
    }

    auto read_ecdsa(Cursor const& cur, std::size_t pos, std::size_t size) -> std::vector<std::uint8_t> {
        auto const src = cur.slice(pos, size);
        return {(std::uint8_t const*)src.data(), (std::uint8_t const*)src.data() + src.size()};
    }
}

auto rfmt::to_string(WAD::CompressionType type) noexcept -> std::string_view {
    switch (type) {
        case WAD::CompressionType::NONE:
            return "NONE";
        case WAD::CompressionType::GZIP:
            return "GZIP";
        case WAD::CompressionType::REFERENCE:
            return "REFERENCE";
        case WAD::CompressionType::ZSTD:
            return "ZSTD";
    }
    return "UNKNOWN";
}

auto WAD::Header::read(std::span<char const> data) -> Header {
    auto const cur = Cursor{data};
    cur.read_tag(0, MAGIC);
    auto header = Header{};
    header.major = cur.read<std::uint8_t>(2);
    header.minor = cur.read<std::uint8_t>(3);
    switch (header.major) {
        case 1: {
            auto v1 = HeaderV1{};
            v1.entry_offset = cur.read<std::uint16_t>(4);
            v1.entry_size = cur.read<std::uint16_t>(6);
            header.file_count = cur.read<std::uint32_t>(8);
            header.version = std::move(v1);
            break;
        }
        // Version 2 added a length prefixed signature padded to a fixed region
        case 2: {
            auto v2 = HeaderV2{};
            auto const ecdsa_length = cur.read<std::uint8_t>(4);
            rfmt_assert(Truncated, 4, ecdsa_length <= HeaderV2::ECDSA_REGION);
            v2.ecdsa = read_ecdsa(cur, 5, ecdsa_length);
            auto const tail = 5 + HeaderV2::ECDSA_REGION;
            v2.file_checksum = cur.read<std::uint64_t>(tail);
            v2.entry_offset = cur.read<std::uint16_t>(tail + 8);
            v2.entry_size = cur.read<std::uint16_t>(tail + 10);
            header.file_count = cur.read<std::uint32_t>(tail + 12);
            header.version = std::move(v2);
            break;
        }
        // Version 3 pinned signature size and dropped the entry table fields
        case 3: {
            auto v3 = HeaderV3{};
            v3.ecdsa = read_ecdsa(cur, 4, HeaderV3::ECDSA_REGION);
            auto const tail = 4 + HeaderV3::ECDSA_REGION;
            v3.file_checksum = cur.read<std::uint64_t>(tail);
            header.file_count = cur.read<std::uint32_t>(tail + 8);
            header.version = std::move(v3);
            break;
        }
        default:
            throw_error(ErrorKind::UnsupportedVersion,
                        2,
                        __PRETTY_FUNCTION__,
                        fmt::format("expected major version 1..3, found {}", header.major));
    }
    return header;
}

auto WAD::Header::data_start() const noexcept -> std::size_t {
    return std::visit([](auto const& v) { return std::decay_t<decltype(v)>::DATA_START; }, version);
}

auto WAD::Header::entry_size() const noexcept -> std::size_t {
    return std::visit([](auto const& v) { return std::decay_t<decltype(v)>::ENTRY_SIZE; }, version);
}

auto WAD::read(std::span<char const> data) -> WAD {
    auto const cur = Cursor{data};
    auto wad = WAD{.header = Header::read(data)};
    auto const data_start = wad.header.data_start();
    auto const entry_size = wad.header.entry_size();
    auto const file_count = wad.header.file_count;
    rfmt_assert(Truncated, data_start, cur.contains(data_start, (std::size_t)file_count * entry_size));
    wad.content.reserve(file_count);
    for (std::uint32_t i = 0; i != file_count; ++i) {
        rfmt_trace("Entry #%u", i);
        auto const entry = data_start + (std::size_t)i * entry_size;
        auto content = Content{};
        content.hash = cur.read<std::uint64_t>(entry);
        content.data_offset = cur.read<std::uint32_t>(entry + 8);
        content.compressed_size = cur.read<std::uint32_t>(entry + 12);
        content.uncompressed_size = cur.read<std::uint32_t>(entry + 16);
        if (wad.header.major == 1) {
            // the type is a full u32 in version 1, every bit of it must be in range
            content.compression_type = to_compression_type(cur.read<std::uint32_t>(entry + 20), entry + 20);
            content.version = ContentV1{};
        } else {
            content.compression_type = to_compression_type(cur.read<std::uint8_t>(entry + 20), entry + 20);
            content.version = ContentV2{
                .is_duplicate = cur.read<std::uint8_t>(entry + 21) > 0,
                .sha256 = cur.read<std::uint64_t>(entry + 24),
            };
        }
        wad.content.push_back(std::move(content));
    }
    return wad;
}

auto WAD::read_file(fs::path const& path) -> WAD {
    rfmt_trace("WAD file: %s", path.generic_string().c_str());
    auto infile = InFile(path);
    return WAD::read(infile);
}
