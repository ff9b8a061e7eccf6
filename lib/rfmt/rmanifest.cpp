#include "rmanifest.hpp"

#include "fltbf.hpp"
#include "iofile.hpp"

using namespace rfmt;
using namespace rfmt::fltbf;

namespace {
    enum class BundleField { BundleId, Chunks, Unknown, HeaderSize, COUNT };

    enum class ChunkField { Unknown1, Unknown2, ChunkId, CompressedSize, UncompressedSize, COUNT };

    enum class LangField { NameOffset, Unknown1, LangId, COUNT };

    enum class DirField { Unknown1, Unknown2, DirId, ParentId, NameOffset, COUNT };

    enum class FileField {
        Unknown1,
        Chunks,
        FileId,
        DirId,
        FileSize,
        NameOffset,
        LangMask,
        Unknown2,
        Unknown3,
        Unknown4,
        Unknown5,
        SymlinkOffset,
        Unknown6,
        Unknown7,
        Unknown8,
        COUNT
    };

    auto read_chunk(Table<ChunkField> const& table) -> RMAN::Chunk {
        return RMAN::Chunk{
            .chunkId = table.get<ChunkID>(ChunkField::ChunkId),
            .compressed_size = table.get<std::uint32_t>(ChunkField::CompressedSize),
            .uncompressed_size = table.get<std::uint32_t>(ChunkField::UncompressedSize),
        };
    }

    auto read_bundle(Table<BundleField> const& table) -> RMAN::Bundle {
        auto bundle = RMAN::Bundle{.bundleId = table.get<BundleID>(BundleField::BundleId)};
        rfmt_trace("BundleID: %016llX", (unsigned long long)bundle.bundleId);
        if (auto start = table.vector_start(BundleField::Chunks)) {
            bundle.chunks = read_vector<ChunkField>(table.cur, *start, read_chunk);
        }
        return bundle;
    }

    auto read_language(Table<LangField> const& table) -> RMAN::Language {
        return RMAN::Language{
            .langId = table.get<LangID>(LangField::LangId),
            .name = table.string(LangField::NameOffset),
        };
    }

    auto read_directory(Table<DirField> const& table) -> RMAN::Directory {
        return RMAN::Directory{
            .dirId = table.get_or<DirID>(DirField::DirId),
            .parentId = table.get_or<DirID>(DirField::ParentId),
            .name = table.string_or(DirField::NameOffset),
        };
    }

    auto read_file_entry(Table<FileField> const& table) -> RMAN::FileEntry {
        auto file = RMAN::FileEntry{.fileId = table.get<FileID>(FileField::FileId)};
        rfmt_trace("FileID: %016llX", (unsigned long long)file.fileId);
        file.name = table.string(FileField::NameOffset);
        file.symlink = table.string_or(FileField::SymlinkOffset);
        file.dirId = table.get_or<DirID>(FileField::DirId);
        file.size = table.get_or<std::uint32_t>(FileField::FileSize);
        file.langs = table.get_or<std::uint32_t>(FileField::LangMask);
        if (auto start = table.vector_start(FileField::Chunks)) {
            file.chunkIds = read_long_vector<ChunkID>(table.cur, *start);
        }
        return file;
    }
}

auto RMAN::Header::read(std::span<char const> data) -> Header {
    auto const cur = Cursor{data};
    auto header = Header{};
    header.magic = cur.read_tag(0, MAGIC);
    header.major = cur.read<std::uint8_t>(4);
    header.minor = cur.read<std::uint8_t>(5);
    header.unknown = cur.read<std::uint8_t>(6);
    header.signature_type = cur.read<std::uint8_t>(7);
    header.offset = cur.read<std::uint32_t>(8);
    header.length = cur.read<std::uint32_t>(12);
    header.manifestId = cur.read<ManifestID>(16);
    header.decompressed_length = cur.read<std::uint32_t>(24);
    return header;
}

auto RMAN::OffsetMap::read(std::span<char const> body) -> OffsetMap {
    auto const cur = Cursor{body};
    auto const root = (std::size_t)cur.read<std::uint32_t>(0);
    // section i is an u32 offset at root + 4 * (i + 1), relative to that slot
    auto const section = [&](std::size_t index) -> std::size_t {
        auto const slot = root + 4 * (index + 1);
        auto const target = slot + cur.read<std::uint32_t>(slot);
        rfmt_assert(Truncated, slot, target <= cur.size());
        return target;
    };
    return OffsetMap{
        .bundles = section(0),
        .languages = section(1),
        .files = section(2),
        .directories = section(3),
    };
}

auto RMAN::Body::read(std::span<char const> data) -> Body {
    auto const cur = Cursor{data};
    auto const offsets = OffsetMap::read(data);
    auto body = Body{};
    {
        rfmt_trace("Section: bundles at 0x%zX", offsets.bundles);
        body.bundles = read_vector<BundleField>(cur, offsets.bundles, read_bundle);
    }
    {
        rfmt_trace("Section: languages at 0x%zX", offsets.languages);
        body.languages = read_vector<LangField>(cur, offsets.languages, read_language);
    }
    {
        rfmt_trace("Section: files at 0x%zX", offsets.files);
        body.files = read_vector<FileField>(cur, offsets.files, read_file_entry);
    }
    {
        rfmt_trace("Section: directories at 0x%zX", offsets.directories);
        body.directories = read_vector<DirField>(cur, offsets.directories, read_directory);
    }
    return body;
}

auto RMAN::read(std::span<char const> data, decompress_cb decompress) -> RMAN {
    auto header = Header::read(data);
    rfmt_trace("Manifest: %016llX", (unsigned long long)header.manifestId);
    rfmt_assert(DecompressionFailed, header.offset, static_cast<bool>(decompress));
    auto const compressed = Cursor{data}.slice(header.offset, header.length);
    auto const decompressed = decompress(compressed);
    return RMAN{
        .header = std::move(header),
        .body = Body::read(decompressed),
    };
}

auto RMAN::read(std::span<char const> data) -> RMAN {
    return RMAN::read(data, [base = data.data()](std::span<char const> src) -> std::vector<char> {
        return zstd_decompress(src, MAX_BODY_SIZE, (std::size_t)(src.data() - base));
    });
}

auto RMAN::read_file(fs::path const& path) -> RMAN {
    rfmt_trace("Manifest file: %s", path.generic_string().c_str());
    auto infile = InFile(path);
    return RMAN::read(infile);
}

RMAN::Resolver::Resolver(RMAN const& manifest) {
    for (auto const& lang : manifest.body.languages) {
        lang_names_[lang.langId] = lang.name;
    }
    for (auto const& dir : manifest.body.directories) {
        dirs_[dir.dirId] = &dir;
    }
    for (auto const& bundle : manifest.body.bundles) {
        for (std::uint64_t compressed_offset = 0; auto const& chunk : bundle.chunks) {
            chunks_[chunk.chunkId] = ChunkSrc{chunk, bundle.bundleId, compressed_offset};
            compressed_offset += chunk.compressed_size;
        }
    }
}

auto RMAN::Resolver::path(FileEntry const& file) const -> std::string {
    rfmt_trace("File: %016llX(%s)", (unsigned long long)file.fileId, file.name.c_str());
    auto path = file.name;
    // a chain longer than the directory count has to contain a cycle
    std::size_t depth = 0;
    for (auto dirId = file.dirId; dirId != DirID::None; ++depth) {
        rfmt_trace("DirID: %016llX", (unsigned long long)dirId);
        if (depth >= dirs_.size()) {
            rfmt_error("Directory chain loops");
        }
        auto const i = dirs_.find(dirId);
        if (i == dirs_.end()) {
            rfmt_error("Unknown directory id");
        }
        if (auto const& name = i->second->name; !name.empty()) {
            path = name.ends_with('/') ? name + path : name + '/' + path;
        }
        dirId = i->second->parentId;
    }
    return path;
}

auto RMAN::Resolver::langs(FileEntry const& file) const -> std::string {
    auto langs = std::string{};
    for (std::uint32_t i = 0; i != 32; i++) {
        if (!(file.langs & (1u << i))) {
            continue;
        }
        rfmt_trace("LangID: %u", i + 1);
        auto const name = lang_names_.find((LangID)(i + 1));
        if (name == lang_names_.end()) {
            rfmt_error("Unknown language id");
        }
        if (!langs.empty()) {
            langs += ";";
        }
        langs += name->second;
    }
    if (langs.empty()) {
        langs = "none";
    }
    return langs;
}

auto RMAN::Resolver::chunk(ChunkID chunkId) const -> std::optional<ChunkSrc> {
    if (auto i = chunks_.find(chunkId); i != chunks_.end()) {
        return i->second;
    }
    return std::nullopt;
}
