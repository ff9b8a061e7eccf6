#include "error.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cstdarg>
#include <cstdio>

using namespace rfmt;

auto rfmt::to_string(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::InvalidMagic:
            return "InvalidMagic";
        case ErrorKind::Truncated:
            return "Truncated";
        case ErrorKind::UnsupportedVersion:
            return "UnsupportedVersion";
        case ErrorKind::DecompressionFailed:
            return "DecompressionFailed";
        case ErrorKind::MissingField:
            return "MissingField";
    }
    return "Unknown";
}

Error::Error(ErrorKind kind, std::size_t position, std::string const& what)
    : std::runtime_error(what), kind_(kind), position_(position) {}

void rfmt::throw_error(std::string_view from, char const* msg) {
    // break point goes here
    throw std::runtime_error(fmt::format("{}: {}", from, msg));
}

void rfmt::throw_error(ErrorKind kind, std::size_t position, std::string_view from, std::string_view msg) {
    // break point goes here
    throw Error(kind, position, fmt::format("{}: {} at 0x{:X}: {}", from, to_string(kind), position, msg));
}

error_stack_t& rfmt::error_stack() noexcept {
    thread_local error_stack_t instance = {};
    return instance;
}

void rfmt::push_error_msg(char const* fmt, ...) noexcept {
    va_list args;
    char buffer[4096];
    int result;
    va_start(args, fmt);
    result = vsnprintf(buffer, 4096, fmt, args);
    va_end(args);
    if (result >= 0) {
        error_stack().push_back({buffer, buffer + std::min(result, 4095)});
    }
}
