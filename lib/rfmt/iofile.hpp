#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <vector>

namespace rfmt {
    namespace fs = std::filesystem;

    // Whole-file read-only input.
    // Regular files are memory mapped, anything else (pipes, character devices) is read into memory.
    struct InFile {
        InFile() noexcept = default;

        explicit InFile(fs::path const& path);

        InFile(InFile&& other) noexcept;

        InFile& operator=(InFile&& other) noexcept;

        InFile(InFile const&) = delete;

        InFile& operator=(InFile const&) = delete;

        ~InFile() noexcept;

        auto mapped() const noexcept -> bool { return view_ != nullptr; }

        auto size() const noexcept -> std::size_t { return size_; }

        auto data() const noexcept -> char const* { return view_ ? (char const*)view_ : buffer_.data(); }

        operator std::span<char const>() const noexcept { return {this->data(), size_}; }

    private:
        void* view_ = nullptr;
        std::size_t size_ = {};
        std::vector<char> buffer_ = {};

        auto unmap() noexcept -> void;
    };
}
