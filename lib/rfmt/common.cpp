#include "common.hpp"

#include <zstd.h>

#include <memory>

using namespace rfmt;

auto rfmt::utf8_lossy(std::span<char const> src) -> std::string {
    static constexpr char REPLACEMENT[] = "\xEF\xBF\xBD";
    auto result = std::string{};
    result.reserve(src.size());
    auto const size = src.size();
    auto const at = [&](std::size_t i) -> std::uint8_t { return (std::uint8_t)src[i]; };
    for (std::size_t i = 0; i != size;) {
        auto const lead = at(i);
        if (lead < 0x80) {
            result.push_back((char)lead);
            ++i;
            continue;
        }
        std::size_t length = 0;
        std::uint8_t lo = 0x80;
        std::uint8_t hi = 0xBF;
        if (lead >= 0xC2 && lead <= 0xDF) {
            length = 2;
        } else if (lead == 0xE0) {
            length = 3, lo = 0xA0;
        } else if (lead == 0xED) {
            length = 3, hi = 0x9F;
        } else if (lead >= 0xE1 && lead <= 0xEF) {
            length = 3;
        } else if (lead == 0xF0) {
            length = 4, lo = 0x90;
        } else if (lead == 0xF4) {
            length = 4, hi = 0x8F;
        } else if (lead >= 0xF1 && lead <= 0xF3) {
            length = 4;
        } else {
            result += REPLACEMENT;
            ++i;
            continue;
        }
        // consume the longest valid prefix, one replacement per ill-formed subpart
        std::size_t n = 1;
        for (; n != length && i + n != size; ++n) {
            auto const next = at(i + n);
            auto const first = n == 1;
            if (next < (first ? lo : 0x80) || next > (first ? hi : 0xBF)) {
                break;
            }
        }
        if (n == length) {
            result.append(src.data() + i, length);
        } else {
            result += REPLACEMENT;
        }
        i += n;
    }
    return result;
}

auto rfmt::zstd_decompress(std::span<char const> src, std::size_t limit, std::size_t base) -> std::vector<char> {
    auto out = std::vector<char>{};
    auto const size = ZSTD_getFrameContentSize(src.data(), src.size());
    rfmt_assert(DecompressionFailed, base, size != ZSTD_CONTENTSIZE_ERROR);
    if (size != ZSTD_CONTENTSIZE_UNKNOWN) {
        // declared size comes from the frame header, check it before allocating
        if (size > limit) [[unlikely]] {
            throw_error(ErrorKind::DecompressionFailed,
                        base,
                        __PRETTY_FUNCTION__,
                        fmt::format("frame declares {} bytes, limit is {}", size, limit));
        }
        out.resize((std::size_t)size);
        auto got = rfmt_assert_zstd(base, ZSTD_decompress(out.data(), out.size(), src.data(), src.size()));
        rfmt_assert(DecompressionFailed, base, got == out.size());
        return out;
    }
    // frame without a recorded content size, stream it out
    auto dctx = std::unique_ptr<ZSTD_DCtx, decltype(&ZSTD_freeDCtx)>(ZSTD_createDCtx(), &ZSTD_freeDCtx);
    rfmt_assert(DecompressionFailed, base, dctx != nullptr);
    auto chunk = std::vector<char>(ZSTD_DStreamOutSize());
    auto input = ZSTD_inBuffer{src.data(), src.size(), 0};
    std::size_t last = 0;
    for (;;) {
        auto output = ZSTD_outBuffer{chunk.data(), chunk.size(), 0};
        last = rfmt_assert_zstd(base + input.pos, ZSTD_decompressStream(dctx.get(), &output, &input));
        rfmt_assert(DecompressionFailed, base + input.pos, output.pos <= limit - out.size());
        out.insert(out.end(), chunk.data(), chunk.data() + output.pos);
        if (input.pos == input.size && (last == 0 || output.pos != output.size)) {
            break;
        }
    }
    rfmt_assert(DecompressionFailed, base + input.pos, last == 0);
    return out;
}
