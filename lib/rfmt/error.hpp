#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#ifdef _MSC_VER
#    define __PRETTY_FUNCTION__ __FUNCTION__
#endif

#define rfmt_paste_impl(x, y) x##y
#define rfmt_paste(x, y) rfmt_paste_impl(x, y)

#define rfmt_error(msg) ::rfmt::throw_error(__PRETTY_FUNCTION__, msg)

#define rfmt_assert(kind, pos, ...)                                                                   \
    do {                                                                                              \
        if (!(__VA_ARGS__)) [[unlikely]] {                                                            \
            ::rfmt::throw_error(::rfmt::ErrorKind::kind, pos, __PRETTY_FUNCTION__, #__VA_ARGS__); \
        }                                                                                             \
    } while (false)

#define rfmt_trace(...)                                \
    ::rfmt::ErrorTrace rfmt_paste(_trace_, __LINE__) { \
        [&] { ::rfmt::push_error_msg(__VA_ARGS__); }   \
    }

namespace rfmt {
    enum class ErrorKind {
        InvalidMagic,
        Truncated,
        UnsupportedVersion,
        DecompressionFailed,
        MissingField,
    };

    extern auto to_string(ErrorKind kind) noexcept -> std::string_view;

    struct Error : std::runtime_error {
        Error(ErrorKind kind, std::size_t position, std::string const& what);

        auto kind() const noexcept -> ErrorKind { return kind_; }
        auto position() const noexcept -> std::size_t { return position_; }

    private:
        ErrorKind kind_;
        std::size_t position_;
    };

    [[noreturn]] extern void throw_error(std::string_view from, char const* msg);

    [[noreturn]] inline void throw_error(std::string_view from, std::error_code const& ec) {
        throw_error(from, ec.message().c_str());
    }

    [[noreturn]] extern void throw_error(ErrorKind kind, std::size_t position, std::string_view from, std::string_view msg);

    using error_stack_t = std::vector<std::string>;

    extern error_stack_t& error_stack() noexcept;

    extern void push_error_msg(char const* fmt, ...) noexcept;

    template <typename Func>
    struct ErrorTrace : Func {
        inline ErrorTrace(Func&& func) noexcept : Func(std::move(func)) {}
        inline ~ErrorTrace() noexcept {
            if (std::uncaught_exceptions()) {
                Func::operator()();
            }
        }
    };
}
