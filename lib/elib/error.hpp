#pragma once
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#define elib_paste_impl(x, y) x##y
#define elib_paste(x, y) elib_paste_impl(x, y)

#define elib_error(msg) ::elib::throw_error(__func__, ": " msg)

#define elib_raise(kind, msg) ::elib::throw_error(kind, __func__, msg)

#define elib_assert(...)                                      \
    do {                                                      \
        if (!(__VA_ARGS__)) [[unlikely]] {                    \
            ::elib::throw_error(__func__, ": " #__VA_ARGS__); \
        }                                                     \
    } while (false)

#define elib_check(kind, ...)                                       \
    do {                                                            \
        if (!(__VA_ARGS__)) [[unlikely]] {                          \
            ::elib::throw_error(kind, __func__, ": " #__VA_ARGS__); \
        }                                                           \
    } while (false)

#define elib_trace(...)                                \
    ::elib::ErrorTrace elib_paste(_trace_, __LINE__) { \
        [&] { ::elib::push_error_msg(__VA_ARGS__); }   \
    }

namespace elib {
    enum class ErrorKind {
        Generic,
        ManifestCorrupt,
        ChunkHeaderTruncated,
        UnknownChunkEncoding,
        ChunkCorrupt,
        Transport,
        HashMismatch,
        Cancelled,
    };

    struct Error : std::runtime_error {
        Error(ErrorKind kind, std::string const& what) : std::runtime_error(what), kind_(kind) {}

        auto kind() const noexcept -> ErrorKind { return kind_; }

    private:
        ErrorKind kind_;
    };

    extern auto error_kind_name(ErrorKind kind) noexcept -> char const*;

    [[noreturn]] extern void throw_error(ErrorKind kind, char const* from, char const* msg);

    [[noreturn]] inline void throw_error(char const* from, char const* msg) {
        throw_error(ErrorKind::Generic, from, msg);
    }

    [[noreturn]] inline void throw_error(char const* from, std::error_code const& ec) {
        throw_error(from, ec.message().c_str());
    }

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
