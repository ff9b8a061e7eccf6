#include <gtest/gtest.h>
#include <zstd.h>

#include <rfmt/rmanifest.hpp>

#include "builder.hpp"

using namespace rfmt;

namespace {
    auto expect_kind(ErrorKind kind, auto&& func) -> void {
        try {
            func();
            FAIL() << "expected " << to_string(kind);
        } catch (Error const& error) {
            EXPECT_EQ(error.kind(), kind) << error.what();
        }
        error_stack().clear();
    }

    auto header_bytes(std::uint32_t offset, std::uint32_t length, std::uint64_t id, std::uint32_t decompressed)
        -> std::vector<char> {
        auto b = fb::Builder{};
        b.bytes("RMAN");
        b.put<std::uint8_t>(1);
        b.put<std::uint8_t>(0);
        b.put<std::uint8_t>(0);
        b.put<std::uint8_t>(0);
        b.put<std::uint32_t>(offset);
        b.put<std::uint32_t>(length);
        b.put<std::uint64_t>(id);
        b.put<std::uint32_t>(decompressed);
        return std::move(b.buf);
    }

    auto compress(std::vector<char> const& src) -> std::vector<char> {
        auto dst = std::vector<char>(ZSTD_compressBound(src.size()));
        auto size = ZSTD_compress(dst.data(), dst.size(), src.data(), src.size(), 3);
        EXPECT_FALSE(ZSTD_isError(size));
        dst.resize(size);
        return dst;
    }

    auto manifest_bytes(std::vector<char> const& body, std::uint64_t id = 0x1122334455667788ull) -> std::vector<char> {
        auto compressed = compress(body);
        auto data = header_bytes((std::uint32_t)RMAN::Header::SIZE,
                                 (std::uint32_t)compressed.size(),
                                 id,
                                 (std::uint32_t)body.size());
        data.insert(data.end(), compressed.begin(), compressed.end());
        return data;
    }

    auto chunk(std::uint64_t id, std::uint32_t compressed, std::uint32_t uncompressed) -> fb::Writer {
        return fb::table(5,
                         {
                             fb::scalar<std::uint64_t>(2, id),
                             fb::scalar<std::uint32_t>(3, compressed),
                             fb::scalar<std::uint32_t>(4, uncompressed),
                         });
    }

    auto bundle(std::uint64_t id, std::vector<fb::Writer> chunks) -> fb::Writer {
        return fb::table(4, {fb::scalar<std::uint64_t>(0, id), fb::ref(1, fb::table_vector(std::move(chunks)))});
    }

    auto language(std::uint8_t id, std::string name) -> fb::Writer {
        return fb::table(3, {fb::ref(0, fb::string(std::move(name))), fb::scalar<std::uint8_t>(2, id)});
    }

    auto directory(std::uint64_t id, std::uint64_t parent, std::string name) -> fb::Writer {
        auto fields = std::vector<fb::Field>{};
        if (id) {
            fields.push_back(fb::scalar<std::uint64_t>(2, id));
        }
        if (parent) {
            fields.push_back(fb::scalar<std::uint64_t>(3, parent));
        }
        fields.push_back(fb::ref(4, fb::string(std::move(name))));
        return fb::table(5, std::move(fields));
    }

    auto file(std::uint64_t id,
              std::uint64_t dir,
              std::uint32_t size,
              std::string name,
              std::uint32_t langs,
              std::vector<std::uint64_t> chunk_ids,
              std::string symlink = {}) -> fb::Writer {
        return fb::table(15,
                         {
                             fb::ref(1, fb::long_vector(std::move(chunk_ids))),
                             fb::scalar<std::uint64_t>(2, id),
                             fb::scalar<std::uint64_t>(3, dir),
                             fb::scalar<std::uint32_t>(4, size),
                             fb::ref(5, fb::string(std::move(name))),
                             fb::scalar<std::uint32_t>(6, langs),
                             fb::ref(11, fb::string(std::move(symlink))),
                         });
    }

    auto sample_body() -> std::vector<char> {
        return fb::body({
            fb::table_vector({
                bundle(0xB1, {chunk(0xC1, 10, 20), chunk(0xC2, 30, 40)}),
                bundle(0xB2, {chunk(0xC3, 50, 60)}),
            }),
            fb::table_vector({language(1, "en_US"), language(2, "ko_KR")}),
            fb::table_vector({
                file(0xF1, 0xD2, 60, "game.exe", 0, {0xC1, 0xC3}),
                file(0xF2, 0, 40, "readme.txt", 3, {0xC2}, "docs/readme.txt"),
            }),
            fb::table_vector({directory(0, 0, ""), directory(0xD1, 0, "data"), directory(0xD2, 0xD1, "bin")}),
        });
    }
}

TEST(RMANHeader, DecodesFixedLayout) {
    auto data = header_bytes(0x100, 0x200, 0xDEADBEEFCAFEBABEull, 0x300);
    auto header = RMAN::Header::read(data);
    EXPECT_EQ(header.magic, "RMAN");
    EXPECT_EQ(header.major, 1);
    EXPECT_EQ(header.minor, 0);
    EXPECT_EQ(header.unknown, 0);
    EXPECT_EQ(header.signature_type, 0);
    EXPECT_EQ(header.offset, 0x100u);
    EXPECT_EQ(header.length, 0x200u);
    EXPECT_EQ(header.manifestId, (ManifestID)0xDEADBEEFCAFEBABEull);
    EXPECT_EQ(header.decompressed_length, 0x300u);
}

TEST(RMANHeader, RejectsWrongMagic) {
    auto data = header_bytes(0, 0, 0, 0);
    data[0] = 'X';
    expect_kind(ErrorKind::InvalidMagic, [&] { (void)RMAN::Header::read(data); });
    expect_kind(ErrorKind::InvalidMagic, [&] { (void)RMAN::read(data); });
}

TEST(RMANHeader, ShortHeaderIsTruncated) {
    auto data = header_bytes(0, 0, 0, 0);
    data.resize(RMAN::Header::SIZE - 1);
    expect_kind(ErrorKind::Truncated, [&] { (void)RMAN::Header::read(data); });
}

TEST(RMANOffsetMap, SectionsAddSlotPosition) {
    auto body = sample_body();
    auto offsets = RMAN::OffsetMap::read(body);
    auto root = std::uint32_t{};
    std::memcpy(&root, body.data(), 4);
    auto raw = std::array<std::uint32_t, 4>{};
    std::memcpy(raw.data(), body.data() + root + 4, 16);
    EXPECT_EQ(offsets.bundles, root + raw[0] + 4);
    EXPECT_EQ(offsets.languages, root + raw[1] + 8);
    EXPECT_EQ(offsets.files, root + raw[2] + 12);
    EXPECT_EQ(offsets.directories, root + raw[3] + 16);
}

TEST(RMAN, DecodesAllSections) {
    auto manifest = RMAN::read(manifest_bytes(sample_body()));
    EXPECT_EQ(manifest.header.manifestId, (ManifestID)0x1122334455667788ull);

    auto const& bundles = manifest.body.bundles;
    ASSERT_EQ(bundles.size(), 2u);
    EXPECT_EQ(bundles[0].bundleId, (BundleID)0xB1);
    ASSERT_EQ(bundles[0].chunks.size(), 2u);
    EXPECT_EQ(bundles[0].chunks[0], (RMAN::Chunk{(ChunkID)0xC1, 10, 20}));
    EXPECT_EQ(bundles[0].chunks[1], (RMAN::Chunk{(ChunkID)0xC2, 30, 40}));
    EXPECT_EQ(bundles[1].chunks, (std::vector<RMAN::Chunk>{{(ChunkID)0xC3, 50, 60}}));

    auto const& languages = manifest.body.languages;
    ASSERT_EQ(languages.size(), 2u);
    EXPECT_EQ(languages[0], (RMAN::Language{(LangID)1, "en_US"}));
    EXPECT_EQ(languages[1], (RMAN::Language{(LangID)2, "ko_KR"}));

    auto const& files = manifest.body.files;
    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(files[0].fileId, (FileID)0xF1);
    EXPECT_EQ(files[0].name, "game.exe");
    EXPECT_EQ(files[0].symlink, "");
    EXPECT_EQ(files[0].dirId, (DirID)0xD2);
    EXPECT_EQ(files[0].size, 60u);
    EXPECT_EQ(files[0].chunkIds, (std::vector<ChunkID>{(ChunkID)0xC1, (ChunkID)0xC3}));
    EXPECT_EQ(files[1].symlink, "docs/readme.txt");
    EXPECT_EQ(files[1].langs, 3u);

    auto const& dirs = manifest.body.directories;
    ASSERT_EQ(dirs.size(), 3u);
    EXPECT_EQ(dirs[0], (RMAN::Directory{DirID::None, DirID::None, ""}));
    EXPECT_EQ(dirs[1], (RMAN::Directory{(DirID)0xD1, DirID::None, "data"}));
    EXPECT_EQ(dirs[2], (RMAN::Directory{(DirID)0xD2, (DirID)0xD1, "bin"}));
}

TEST(RMAN, EmptySections) {
    auto body = fb::body({fb::empty_vector(), fb::empty_vector(), fb::empty_vector(), fb::empty_vector()});
    auto manifest = RMAN::read(manifest_bytes(body));
    EXPECT_TRUE(manifest.body.bundles.empty());
    EXPECT_TRUE(manifest.body.languages.empty());
    EXPECT_TRUE(manifest.body.files.empty());
    EXPECT_TRUE(manifest.body.directories.empty());
}

TEST(RMAN, InjectedDecompressorReceivesDeclaredRange) {
    auto body = sample_body();
    auto data = header_bytes((std::uint32_t)RMAN::Header::SIZE, (std::uint32_t)body.size(), 1, 0);
    data.insert(data.end(), body.begin(), body.end());
    auto calls = 0;
    auto manifest = RMAN::read(data, [&](std::span<char const> src) -> std::vector<char> {
        ++calls;
        EXPECT_EQ(src.data(), data.data() + RMAN::Header::SIZE);
        EXPECT_EQ(src.size(), body.size());
        return {src.begin(), src.end()};
    });
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(manifest.body, RMAN::Body::read(body));
}

TEST(RMAN, BodyRangePastEndIsTruncated) {
    auto data = header_bytes((std::uint32_t)RMAN::Header::SIZE, 64, 1, 0);
    data.resize(data.size() + 16);
    expect_kind(ErrorKind::Truncated, [&] { (void)RMAN::read(data); });
}

TEST(RMAN, CorruptBodyFailsDecompression) {
    auto data = header_bytes((std::uint32_t)RMAN::Header::SIZE, 16, 1, 0);
    data.resize(data.size() + 16, '\x5A');
    expect_kind(ErrorKind::DecompressionFailed, [&] { (void)RMAN::read(data); });
}

TEST(RMAN, TruncatedZstdFrameFailsDecompression) {
    auto compressed = compress(sample_body());
    compressed.resize(compressed.size() / 2);
    auto data = header_bytes((std::uint32_t)RMAN::Header::SIZE, (std::uint32_t)compressed.size(), 1, 0);
    data.insert(data.end(), compressed.begin(), compressed.end());
    expect_kind(ErrorKind::DecompressionFailed, [&] { (void)RMAN::read(data); });
}

TEST(RMAN, OversizedFrameFailsBeforeAllocating) {
    // zstd frame header: magic, single segment with an 8 byte content size of 2^62
    auto frame = std::vector<char>{'\x28', '\xB5', '\x2F', '\xFD', '\xE0'};
    for (auto byte : {0, 0, 0, 0, 0, 0, 0, 0x40}) {
        frame.push_back((char)byte);
    }
    frame.push_back('\0');
    auto data = header_bytes((std::uint32_t)RMAN::Header::SIZE, (std::uint32_t)frame.size(), 1, 0);
    data.insert(data.end(), frame.begin(), frame.end());
    try {
        (void)RMAN::read(data);
        FAIL() << "expected DecompressionFailed";
    } catch (Error const& error) {
        EXPECT_EQ(error.kind(), ErrorKind::DecompressionFailed) << error.what();
        EXPECT_EQ(error.position(), RMAN::Header::SIZE);
    }
    error_stack().clear();
}

TEST(RMAN, EmptyDecompressorIsRejected) {
    auto const data = manifest_bytes(sample_body());
    expect_kind(ErrorKind::DecompressionFailed, [&] { (void)RMAN::read(data, RMAN::decompress_cb{}); });
}

TEST(RMAN, MissingRequiredFieldFails) {
    auto body = fb::body({
        fb::table_vector({fb::table(4, {fb::ref(1, fb::empty_vector())})}),
        fb::empty_vector(),
        fb::empty_vector(),
        fb::empty_vector(),
    });
    expect_kind(ErrorKind::MissingField, [&] { (void)RMAN::Body::read(body); });
}

TEST(RMAN, CutBodyFailsWhole) {
    auto body = sample_body();
    for (std::size_t size : {std::size_t{3}, body.size() / 2, body.size() - 1}) {
        auto cut = std::vector<char>(body.begin(), body.begin() + (std::ptrdiff_t)size);
        expect_kind(ErrorKind::Truncated, [&] { (void)RMAN::Body::read(cut); });
    }
}

TEST(RMANResolver, BuildsPathsAndLanguages) {
    auto manifest = RMAN{.header = {}, .body = RMAN::Body::read(sample_body())};
    auto resolver = RMAN::Resolver(manifest);
    EXPECT_EQ(resolver.path(manifest.body.files[0]), "data/bin/game.exe");
    EXPECT_EQ(resolver.path(manifest.body.files[1]), "readme.txt");
    EXPECT_EQ(resolver.langs(manifest.body.files[0]), "none");
    EXPECT_EQ(resolver.langs(manifest.body.files[1]), "en_US;ko_KR");
}

TEST(RMANResolver, LocatesChunksInsideBundles) {
    auto manifest = RMAN{.header = {}, .body = RMAN::Body::read(sample_body())};
    auto resolver = RMAN::Resolver(manifest);
    auto src = resolver.chunk((ChunkID)0xC2);
    ASSERT_TRUE(src.has_value());
    EXPECT_EQ(src->bundleId, (BundleID)0xB1);
    EXPECT_EQ(src->compressed_offset, 10u);
    EXPECT_EQ(src->uncompressed_size, 40u);
    EXPECT_FALSE(resolver.chunk((ChunkID)0xFF).has_value());
}

TEST(RMANResolver, DirectoryCycleIsReported) {
    auto manifest = RMAN{};
    manifest.body.directories = {{(DirID)1, (DirID)2, "a"}, {(DirID)2, (DirID)1, "b"}};
    manifest.body.files = {{.fileId = (FileID)1, .name = "f", .dirId = (DirID)1}};
    auto resolver = RMAN::Resolver(manifest);
    EXPECT_THROW((void)resolver.path(manifest.body.files[0]), std::runtime_error);
    error_stack().clear();
}
