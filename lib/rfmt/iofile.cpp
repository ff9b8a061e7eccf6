#include "iofile.hpp"

#include <cerrno>
#include <utility>

#include "common.hpp"

using namespace rfmt;

#ifdef _WIN32
#    ifndef NOMINMAX
#        define NOMINMAX
#    endif
#    ifndef WIN32_LEAN_AND_MEAN
#        define WIN32_LEAN_AND_MEAN
#    endif
#    include <windows.h>

namespace {
    struct Handle {
        HANDLE value = INVALID_HANDLE_VALUE;
        ~Handle() noexcept {
            if (value && value != INVALID_HANDLE_VALUE) {
                ::CloseHandle(value);
            }
        }
    };

    [[noreturn]] void throw_last_error(std::string_view from) {
        throw_error(from, std::error_code((int)::GetLastError(), std::system_category()));
    }
}

InFile::InFile(fs::path const& path) {
    rfmt_trace("path: %s", path.generic_string().c_str());
    auto file = Handle{::CreateFileW(path.c_str(),
                                     GENERIC_READ,
                                     FILE_SHARE_READ,
                                     nullptr,
                                     OPEN_EXISTING,
                                     FILE_FLAG_SEQUENTIAL_SCAN,
                                     nullptr)};
    if (file.value == INVALID_HANDLE_VALUE) [[unlikely]] {
        throw_last_error("CreateFile: ");
    }
    if (::GetFileType(file.value) != FILE_TYPE_DISK) {
        char chunk[0x10000];
        DWORD got = {};
        while (::ReadFile(file.value, chunk, sizeof(chunk), &got, nullptr) && got) {
            buffer_.insert(buffer_.end(), chunk, chunk + got);
        }
        size_ = buffer_.size();
        return;
    }
    LARGE_INTEGER size = {};
    if (!::GetFileSizeEx(file.value, &size)) [[unlikely]] {
        throw_last_error("GetFileSizeEx: ");
    }
    if (!size.QuadPart) {
        return;
    }
    auto mapping = Handle{::CreateFileMappingW(file.value, nullptr, PAGE_READONLY, 0, 0, nullptr)};
    if (!mapping.value) [[unlikely]] {
        throw_last_error("CreateFileMapping: ");
    }
    view_ = ::MapViewOfFile(mapping.value, FILE_MAP_READ, 0, 0, 0);
    if (!view_) [[unlikely]] {
        throw_last_error("MapViewOfFile: ");
    }
    size_ = (std::size_t)size.QuadPart;
}

auto InFile::unmap() noexcept -> void {
    if (auto view = std::exchange(view_, nullptr)) {
        ::UnmapViewOfFile(view);
    }
}

#else
#    include <fcntl.h>
#    include <sys/mman.h>
#    include <sys/stat.h>
#    include <unistd.h>

namespace {
    struct Descriptor {
        int value = -1;
        ~Descriptor() noexcept {
            if (value != -1) {
                ::close(value);
            }
        }
    };

    [[noreturn]] void throw_errno(std::string_view from) {
        throw_error(from, std::error_code((int)errno, std::system_category()));
    }
}

InFile::InFile(fs::path const& path) {
    rfmt_trace("path: %s", path.generic_string().c_str());
    auto fd = Descriptor{::open(path.c_str(), O_RDONLY)};
    if (fd.value == -1) [[unlikely]] {
        throw_errno("::open: ");
    }
    struct ::stat info = {};
    if (::fstat(fd.value, &info) == -1) [[unlikely]] {
        throw_errno("::fstat: ");
    }
    if (!S_ISREG(info.st_mode)) {
        char chunk[0x10000];
        for (;;) {
            auto got = ::read(fd.value, chunk, sizeof(chunk));
            if (got == -1 && errno == EINTR) {
                continue;
            }
            if (got == -1) [[unlikely]] {
                throw_errno("::read: ");
            }
            if (got == 0) {
                break;
            }
            buffer_.insert(buffer_.end(), chunk, chunk + got);
        }
        size_ = buffer_.size();
        return;
    }
    if (!info.st_size) {
        return;
    }
    auto view = ::mmap(nullptr, (std::size_t)info.st_size, PROT_READ, MAP_PRIVATE, fd.value, 0);
    if (view == MAP_FAILED) [[unlikely]] {
        throw_errno("::mmap: ");
    }
    view_ = view;
    size_ = (std::size_t)info.st_size;
}

auto InFile::unmap() noexcept -> void {
    if (auto view = std::exchange(view_, nullptr)) {
        ::munmap(view, size_);
    }
}

#endif

InFile::InFile(InFile&& other) noexcept
    : view_(std::exchange(other.view_, nullptr)),
      size_(std::exchange(other.size_, 0)),
      buffer_(std::move(other.buffer_)) {}

InFile& InFile::operator=(InFile&& other) noexcept {
    if (this != &other) {
        this->unmap();
        view_ = std::exchange(other.view_, nullptr);
        size_ = std::exchange(other.size_, 0);
        buffer_ = std::move(other.buffer_);
    }
    return *this;
}

InFile::~InFile() noexcept { this->unmap(); }
