#include "iofile.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include "common.hpp"

using namespace elib;

IO::File::File(fs::path const& path, Flags flags) {
    elib_trace("path: %s", path.generic_string().c_str());
    if ((flags & WRITE) && path.has_parent_path()) {
        fs::create_directories(path.parent_path());
    }
    int fd = -1;
    if (flags & WRITE) {
        fd = ::open(path.string().c_str(), O_RDWR | O_CREAT | ((flags & TRUNCATE) ? O_TRUNC : 0), 0644);
    } else {
        fd = ::open(path.string().c_str(), O_RDONLY);
    }
    if (fd == -1) [[unlikely]] {
        auto ec = std::error_code((int)errno, std::system_category());
        throw_error("::open: ", ec);
    }
    struct ::stat size = {};
    if (::fstat(fd, &size) == -1) [[unlikely]] {
        auto ec = std::error_code((int)errno, std::system_category());
        ::close(fd);
        throw_error("::fstat: ", ec);
    }
    impl_ = {.fd = (std::intptr_t)fd, .size = (std::size_t)size.st_size, .flags = flags};
}

IO::File::~File() noexcept {
    if (auto impl = std::exchange(impl_, {}); impl.fd != -1) {
        ::close((int)impl.fd);
    }
}

auto IO::File::read(std::size_t offset, std::span<char> dst) const noexcept -> bool {
    if (impl_.fd == -1) {
        return false;
    }
    while (!dst.empty()) {
        auto got = ::pread((int)impl_.fd, dst.data(), dst.size(), (off_t)offset);
        if (got <= 0 || (std::size_t)got > dst.size()) {
            return false;
        }
        dst = dst.subspan(got);
        offset += got;
    }
    return true;
}

auto IO::File::write(std::size_t offset, std::span<char const> src) noexcept -> bool {
    if (impl_.fd == -1 || !(impl_.flags & WRITE)) {
        return false;
    }
    std::size_t const write_end = offset + src.size();
    if (write_end < offset || write_end < src.size()) {
        return false;
    }
    while (!src.empty()) {
        auto got = ::pwrite((int)impl_.fd, src.data(), src.size(), (off_t)offset);
        if (got <= 0 || (std::size_t)got > src.size()) {
            return false;
        }
        src = src.subspan(got);
        offset += got;
    }
    if (write_end > impl_.size) {
        impl_.size = write_end;
    }
    return true;
}

auto IO::File::copy(std::size_t offset, std::size_t count) const -> std::span<char const> {
    thread_local auto result = std::vector<char>();
    if (result.size() < count) {
        result.clear();
        result.resize(count);
    }
    elib_assert(this->read(offset, {result.data(), count}));
    return {result.data(), count};
}

IO::Reader::Reader(IO const& io, std::size_t pos, std::size_t size)
    : io_(&io), start_(std::min(pos, io_->size())), pos_(start_), end_(pos_ + std::min(size, io_->size() - pos_)) {}

auto IO::Reader::read_raw(void* dst, std::size_t size) noexcept -> bool {
    if (!size) return true;
    if (remains() < size || !io_->read(pos_, {(char*)dst, size})) [[unlikely]]
        return false;
    pos_ += size;
    return true;
}
