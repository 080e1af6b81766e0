#pragma once
#include <cstdint>
#include <filesystem>
#include <span>
#include <system_error>
#include <type_traits>
#include <utility>
#include <vector>

namespace elib {
    namespace fs = std::filesystem;

    struct IO {
        struct File;

        struct Buffer;

        struct Reader;

        enum Flags : unsigned;

        virtual ~IO() noexcept = default;

        virtual auto size() const noexcept -> std::size_t = 0;

        virtual auto read(std::size_t offset, std::span<char> dst) const noexcept -> bool = 0;

        virtual auto write(std::size_t offset, std::span<char const> src) noexcept -> bool = 0;

        virtual auto copy(std::size_t offset, std::size_t count) const -> std::span<char const> = 0;

    private:
        constexpr IO() noexcept = default;
        constexpr IO(IO&& other) noexcept = default;
        constexpr IO(IO const& other) noexcept = delete;
        constexpr IO& operator=(IO const& other) noexcept = delete;
        constexpr IO& operator=(IO&& other) noexcept = default;
    };

    enum IO::Flags : unsigned {
        READ = 0,
        WRITE = 1 << 0,
        TRUNCATE = 1 << 1,
    };

    constexpr auto operator|(IO::Flags lhs, IO::Flags rhs) noexcept -> IO::Flags {
        return (IO::Flags)((unsigned)lhs | (unsigned)rhs);
    }

    constexpr auto operator&(IO::Flags lhs, IO::Flags rhs) noexcept -> IO::Flags {
        return (IO::Flags)((unsigned)lhs & (unsigned)rhs);
    }

    struct IO::File final : IO {
        constexpr File() noexcept = default;

        constexpr File(File&& other) noexcept : impl_(std::exchange(other.impl_, {})) {}

        constexpr File& operator=(File&& other) noexcept {
            std::swap(impl_, other.impl_);
            return *this;
        }

        File(fs::path const& path, Flags flags);

        ~File() noexcept;

        auto size() const noexcept -> std::size_t override { return impl_.size; }

        auto read(std::size_t offset, std::span<char> dst) const noexcept -> bool override;

        auto write(std::size_t offset, std::span<char const> src) noexcept -> bool override;

        auto copy(std::size_t offset, std::size_t count) const -> std::span<char const> override;

        // Writes at the current end of file.
        auto append(std::span<char const> src) noexcept -> bool { return this->write(impl_.size, src); }

    private:
        struct Impl {
            std::intptr_t fd = -1;
            std::size_t size = {};
            Flags flags = {};
        } impl_ = {};
    };

    struct IO::Reader final {
        constexpr Reader() noexcept = default;

        Reader(IO const& io, std::size_t pos = 0, std::size_t size = (std::size_t)-1);

        auto size() const noexcept -> std::size_t { return end_ - start_; }

        auto remains() const noexcept -> std::size_t { return end_ - pos_; }

        auto read_raw(void*, std::size_t size) noexcept -> bool;

        template <typename T>
            requires(std::is_trivially_copyable_v<T>)
        auto read(T& val) noexcept -> bool { return read_raw(&val, sizeof(T)); }

        template <typename T>
            requires(std::is_trivially_copyable_v<T>)
        auto read(std::span<T> dst) noexcept -> bool { return read_raw(dst.data(), dst.size_bytes()); }

        constexpr operator bool() const noexcept { return io_ != nullptr; }

    private:
        IO const* io_ = {};
        std::size_t start_ = {};
        std::size_t pos_ = {};
        std::size_t end_ = {};
    };
};
