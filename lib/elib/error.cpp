#include "error.hpp"

#include <algorithm>
#include <cstdarg>
#include <cstdio>

using namespace elib;

auto elib::error_kind_name(ErrorKind kind) noexcept -> char const* {
    switch (kind) {
        case ErrorKind::Generic:
            return "Error";
        case ErrorKind::ManifestCorrupt:
            return "ManifestCorrupt";
        case ErrorKind::ChunkHeaderTruncated:
            return "ChunkHeaderTruncated";
        case ErrorKind::UnknownChunkEncoding:
            return "UnknownChunkEncoding";
        case ErrorKind::ChunkCorrupt:
            return "ChunkCorrupt";
        case ErrorKind::Transport:
            return "Transport";
        case ErrorKind::HashMismatch:
            return "HashMismatch";
        case ErrorKind::Cancelled:
            return "Cancelled";
    }
    return "Error";
}

void elib::throw_error(ErrorKind kind, char const* from, char const* msg) {
    // break point goes here
    throw Error(kind, std::string(from) + msg);
}

error_stack_t& elib::error_stack() noexcept {
    thread_local error_stack_t instance = {};
    return instance;
}

void elib::push_error_msg(char const* fmt, ...) noexcept {
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
