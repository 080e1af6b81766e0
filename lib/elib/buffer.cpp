#include "buffer.hpp"

#include <bit>
#include <cstdlib>

#include "common.hpp"

using namespace elib;

Buffer::~Buffer() noexcept {
    if (impl_.data) {
        free(impl_.data);
    }
}

auto Buffer::reserve_keep(std::size_t size) noexcept -> bool {
    if (size > impl_.capacity) {
        auto capacity = std::max(size, std::bit_ceil(size));
        auto data = (char*)realloc(impl_.data, capacity);
        if (data == nullptr) [[unlikely]] {
            return false;
        }
        impl_.data = data;
        impl_.capacity = capacity;
    }
    return true;
}

auto Buffer::resize_keep(std::size_t size) noexcept -> bool {
    if (!reserve_keep(size)) [[unlikely]] {
        return false;
    }
    impl_.size = size;
    return true;
}

auto Buffer::append(std::span<char const> src) noexcept -> bool {
    if (src.empty()) {
        return true;
    }
    auto const offset = this->size();
    if (!this->resize_keep(offset + src.size())) {
        return false;
    }
    std::memcpy(impl_.data + offset, src.data(), src.size());
    return true;
}

auto IO::Buffer::read(std::size_t offset, std::span<char> dst) const noexcept -> bool {
    if (!in_range(offset, dst.size(), size())) {
        return false;
    }
    std::memcpy(dst.data(), impl_.data + offset, dst.size());
    return true;
}

auto IO::Buffer::write(std::size_t offset, std::span<char const> src) noexcept -> bool {
    auto const total = offset + src.size();
    if (total < offset || total < src.size()) [[unlikely]] {
        return false;
    }
    if (total > impl_.size && !this->resize_keep(total)) [[unlikely]] {
        return false;
    }
    std::memcpy(impl_.data + offset, src.data(), src.size());
    return true;
}

auto IO::Buffer::copy(std::size_t offset, std::size_t count) const -> std::span<char const> {
    elib_assert(in_range(offset, count, impl_.size));
    return {impl_.data + offset, count};
}
