#include "fltbf.hpp"

using namespace rfmt;
using namespace rfmt::fltbf;

auto Cursor::check(std::size_t pos, std::size_t count) const -> void {
    if (!this->contains(pos, count)) [[unlikely]] {
        throw_error(ErrorKind::Truncated,
                    pos,
                    __PRETTY_FUNCTION__,
                    fmt::format("need {} bytes, buffer holds {}", count, data.size()));
    }
}

auto Cursor::read_tag(std::size_t pos, std::string_view tag) const -> std::string {
    if (!this->contains(pos, tag.size())) [[unlikely]] {
        throw_error(ErrorKind::InvalidMagic,
                    pos,
                    __PRETTY_FUNCTION__,
                    fmt::format("expected '{}', buffer holds {} bytes", tag, data.size()));
    }
    auto found = std::string_view{data.data() + pos, tag.size()};
    if (found != tag) [[unlikely]] {
        throw_error(ErrorKind::InvalidMagic,
                    pos,
                    __PRETTY_FUNCTION__,
                    fmt::format("expected '{}', found '{}'", tag, utf8_lossy({found.data(), found.size()})));
    }
    return std::string{found};
}

auto Cursor::slice(std::size_t pos, std::size_t count) const -> std::span<char const> {
    this->check(pos, count);
    return data.subspan(pos, count);
}

auto Cursor::follow(std::size_t pos) const -> std::size_t {
    auto const target = pos + this->read<std::uint32_t>(pos);
    rfmt_assert(Truncated, pos, target <= data.size());
    return target;
}

auto fltbf::read_string(Cursor const& cur, std::size_t pos) -> std::string {
    auto const start = cur.follow(pos);
    auto const length = cur.read<std::uint32_t>(start);
    return utf8_lossy(cur.slice(start + 4, length));
}
