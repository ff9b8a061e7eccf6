#include "json.hpp"

#include <charconv>
#include <json_struct/json_struct.h>
#include <variant>

using namespace rfmt;

namespace JS {
    template <typename T>
    struct TypeHandlerHex {
        static inline Error to(T& to_type, ParseContext& context) {
            auto const beg = context.token.value.data;
            auto const end = beg + context.token.value.size;
            auto value = std::uint64_t{};
            auto const ec_ptr = std::from_chars(beg, end, value, 16);
            if (ec_ptr.ec != std::errc{}) [[unlikely]] {
                return Error::FailedToParseInt;
            }
            to_type = static_cast<T>(value);
            return Error::NoError;
        }

        static void from(T const& from_type, Token& token, Serializer& serializer) {
            std::string buf = fmt::format("{}", from_type);
            token.value_type = Type::String;
            token.value.data = buf.data();
            token.value.size = buf.size();
            serializer.write(token);
        }
    };

    template <typename T, typename U = std::underlying_type_t<T>>
    struct TypeHandlerNumber {
        static inline Error to(T& to_type, ParseContext& context) {
            auto tmp = U{};
            auto error = TypeHandler<U>::to(tmp, context);
            if (error == Error::NoError) {
                to_type = static_cast<T>(tmp);
            }
            return error;
        }

        static void from(T const& from_type, Token& token, Serializer& serializer) {
            TypeHandler<U>::from(static_cast<U>(from_type), token, serializer);
        }
    };

    // Variants render as their active alternative, monostate-like ones as null.
    template <typename... Ts>
    struct TypeHandlerVariant {
        static inline Error to(std::variant<Ts...>&, ParseContext&) { return Error::IllegalDataValue; }

        static void from(std::variant<Ts...> const& from_type, Token& token, Serializer& serializer) {
            std::visit(
                [&](auto const& value) {
                    using V = std::decay_t<decltype(value)>;
                    if constexpr (std::is_empty_v<V>) {
                        token.value_type = Type::Null;
                        token.value.data = "null";
                        token.value.size = 4;
                        serializer.write(token);
                    } else {
                        TypeHandler<V>::from(value, token, serializer);
                    }
                },
                from_type);
        }
    };

    template <>
    struct TypeHandler<WAD::CompressionType> {
        static inline Error to(WAD::CompressionType& to_type, ParseContext& context) {
            auto const name = std::string_view{context.token.value.data, context.token.value.size};
            for (auto type : {WAD::CompressionType::NONE,
                              WAD::CompressionType::GZIP,
                              WAD::CompressionType::REFERENCE,
                              WAD::CompressionType::ZSTD}) {
                if (to_string(type) == name) {
                    to_type = type;
                    return Error::NoError;
                }
            }
            return Error::IllegalDataValue;
        }

        static void from(WAD::CompressionType const& from_type, Token& token, Serializer& serializer) {
            auto const name = to_string(from_type);
            token.value_type = Type::String;
            token.value.data = name.data();
            token.value.size = name.size();
            serializer.write(token);
        }
    };

    template <>
    struct TypeHandler<ManifestID> : TypeHandlerHex<ManifestID> {};

    template <>
    struct TypeHandler<BundleID> : TypeHandlerHex<BundleID> {};

    template <>
    struct TypeHandler<ChunkID> : TypeHandlerHex<ChunkID> {};

    template <>
    struct TypeHandler<FileID> : TypeHandlerHex<FileID> {};

    template <>
    struct TypeHandler<DirID> : TypeHandlerHex<DirID> {};

    template <>
    struct TypeHandler<LangID> : TypeHandlerNumber<LangID> {};

    template <>
    struct TypeHandler<WAD::HeaderVersion> : TypeHandlerVariant<WAD::HeaderV1, WAD::HeaderV2, WAD::HeaderV3> {};

    template <>
    struct TypeHandler<WAD::ContentVersion> : TypeHandlerVariant<WAD::ContentV1, WAD::ContentV2> {};
}

/* clang-format off */
JS_OBJ_EXT(rfmt::RMAN::Header, magic, major, minor, unknown, signature_type, offset, length, manifestId, decompressed_length);
JS_OBJ_EXT(rfmt::RMAN::Chunk, chunkId, compressed_size, uncompressed_size);
JS_OBJ_EXT(rfmt::RMAN::Bundle, bundleId, chunks);
JS_OBJ_EXT(rfmt::RMAN::Language, langId, name);
JS_OBJ_EXT(rfmt::RMAN::Directory, dirId, parentId, name);
JS_OBJ_EXT(rfmt::RMAN::FileEntry, fileId, name, symlink, dirId, size, langs, chunkIds);
JS_OBJ_EXT(rfmt::RMAN::Body, bundles, languages, files, directories);
JS_OBJ_EXT(rfmt::RMAN, header, body);
JS_OBJ_EXT(rfmt::WAD::HeaderV1, entry_offset, entry_size);
JS_OBJ_EXT(rfmt::WAD::HeaderV2, ecdsa, file_checksum, entry_offset, entry_size);
JS_OBJ_EXT(rfmt::WAD::HeaderV3, ecdsa, file_checksum);
JS_OBJ_EXT(rfmt::WAD::Header, major, minor, file_count, version);
JS_OBJ_EXT(rfmt::WAD::ContentV2, is_duplicate, sha256);
JS_OBJ_EXT(rfmt::WAD::Content, hash, data_offset, compressed_size, uncompressed_size, compression_type, version);
JS_OBJ_EXT(rfmt::WAD, header, content);
/* clang-format on */

auto rfmt::to_json(RMAN const& manifest) -> std::string { return JS::serializeStruct(manifest); }

auto rfmt::to_json(WAD const& wad) -> std::string { return JS::serializeStruct(wad); }
