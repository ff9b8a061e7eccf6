#pragma once
#include <fmt/format.h>

#include <cinttypes>
#include <cstddef>
#include <cstring>
#include <filesystem>
#include <functional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include "error.hpp"

#define rfmt_assert_zstd(pos, ...)                                                                     \
    [&, rfmt_zstd_from = __PRETTY_FUNCTION__]() -> std::size_t {                                       \
        if (std::size_t rfmt_zstd_result = __VA_ARGS__; ZSTD_isError(rfmt_zstd_result)) [[unlikely]] { \
            ::rfmt::throw_error(::rfmt::ErrorKind::DecompressionFailed,                                \
                                pos,                                                                   \
                                rfmt_zstd_from,                                                        \
                                ZSTD_getErrorName(rfmt_zstd_result));                                  \
        } else {                                                                                       \
            return rfmt_zstd_result;                                                                   \
        }                                                                                              \
    }()

namespace rfmt {
    namespace fs = std::filesystem;
    using namespace std::literals::string_view_literals;

    template <typename Signature>
    struct function_ref;

    template <typename Ret, typename... Args>
    struct function_ref<Ret(Args...)> {
        constexpr function_ref() noexcept = default;

        template <typename Func>
            requires(std::is_invocable_r_v<Ret, Func, Args...>)
        function_ref(Func* func)
        noexcept
            : ref_((void*)func),
              invoke_(+[](void* ref, Args... args) -> Ret { return std::invoke(*(Func*)ref, args...); }) {}

        template <typename Func>
            requires(std::is_invocable_r_v<Ret, Func, Args...>)
        function_ref(Func&& func)
        noexcept : function_ref(&func) {}

        explicit constexpr operator bool() const noexcept { return ref_; }

        constexpr bool operator!() const noexcept { return !ref_; }

        auto operator()(Args... args) const -> Ret { return invoke_(ref_, args...); }

    private:
        void* ref_ = nullptr;
        Ret (*invoke_)(void* ref, Args...) = nullptr;
    };

    inline auto in_range(std::size_t offset, std::size_t size, std::size_t target) noexcept -> bool {
        return offset <= target && target - offset >= size;
    }

    // Replaces every ill-formed sequence with U+FFFD instead of failing.
    extern auto utf8_lossy(std::span<char const> src) -> std::string;

    // Fails with DecompressionFailed before producing more than limit bytes.
    // base is the position of src inside the enclosing input, used for error reports.
    extern auto zstd_decompress(std::span<char const> src, std::size_t limit, std::size_t base = 0)
        -> std::vector<char>;
}
