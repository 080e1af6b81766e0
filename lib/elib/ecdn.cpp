#include "ecdn.hpp"

#include <curl/curl.h>

#include <iostream>
#include <thread>

using namespace elib;

struct CurlInit {
    CurlInit() noexcept { curl_global_init(CURL_GLOBAL_ALL); }
    ~CurlInit() noexcept { curl_global_cleanup(); }
};

static auto recv_data(char const* data, size_t size, size_t ncount, Buffer* buffer) noexcept -> size_t {
    if (buffer->append({data, size * ncount})) {
        return size * ncount;
    }
    return 0;
}

ECDN::ECDN(Options const& options) : options_(options), handle_(nullptr) {
    static auto init = CurlInit{};
    if (options_.urls.empty()) {
        options_.urls.push_back(DEFAULT_URL);
    }
    for (auto& url : options_.urls) {
        while (url.ends_with('/')) {
            url.pop_back();
        }
    }
    handle_ = curl_easy_init();
    elib_assert(handle_);
    elib_assert_easy_curl(curl_easy_setopt(handle_, CURLOPT_VERBOSE, (options_.verbose ? 1L : 0L)));
    elib_assert_easy_curl(curl_easy_setopt(handle_, CURLOPT_NOPROGRESS, 1L));
    elib_assert_easy_curl(curl_easy_setopt(handle_, CURLOPT_FOLLOWLOCATION, 1L));
    elib_assert_easy_curl(curl_easy_setopt(handle_, CURLOPT_WRITEFUNCTION, &recv_data));
    if (options_.buffer) {
        elib_assert_easy_curl(curl_easy_setopt(handle_, CURLOPT_BUFFERSIZE, options_.buffer));
    }
    if (options_.connect_timeout) {
        elib_assert_easy_curl(curl_easy_setopt(handle_, CURLOPT_CONNECTTIMEOUT, options_.connect_timeout));
    }
    if (options_.low_speed_time) {
        elib_assert_easy_curl(curl_easy_setopt(handle_, CURLOPT_LOW_SPEED_LIMIT, (long)options_.low_speed_limit));
        elib_assert_easy_curl(curl_easy_setopt(handle_, CURLOPT_LOW_SPEED_TIME, (long)options_.low_speed_time));
    }
    if (!options_.proxy.empty()) {
        elib_assert_easy_curl(curl_easy_setopt(handle_, CURLOPT_PROXY, options_.proxy.c_str()));
    }
    if (!options_.useragent.empty()) {
        elib_assert_easy_curl(curl_easy_setopt(handle_, CURLOPT_USERAGENT, options_.useragent.c_str()));
    }
}

ECDN::~ECDN() noexcept {
    if (handle_) {
        curl_easy_cleanup(handle_);
    }
}

auto ECDN::next_url() noexcept -> std::string const& {
    auto const& url = options_.urls[next_ % options_.urls.size()];
    ++next_;
    return url;
}

auto ECDN::get(std::string const& url) -> Buffer {
    elib_trace("url: %s", url.c_str());
    auto buffer = Buffer{};
    elib_assert_easy_curl(curl_easy_setopt(handle_, CURLOPT_URL, url.c_str()));
    elib_assert_easy_curl(curl_easy_setopt(handle_, CURLOPT_WRITEDATA, &buffer));
    auto const performed = curl_easy_perform(handle_);
    elib_assert_easy_curl(curl_easy_setopt(handle_, CURLOPT_WRITEDATA, nullptr));
    elib_assert_easy_curl(performed);
    long status = 0;
    elib_assert_easy_curl(curl_easy_getinfo(handle_, CURLINFO_RESPONSE_CODE, &status));
    if (status && (status < 200 || status >= 300)) [[unlikely]] {
        elib_raise(ErrorKind::Transport, fmt::format(": http status {}", status).c_str());
    }
    return buffer;
}

auto ECDN::fetch(EChunk const& chunk) -> Buffer {
    auto const url = fmt::format("{}/{}", next_url(), chunk.path());
    auto blob = get(url);
    return chunk.extract(blob);
}

auto Retry::is_transient(ErrorKind kind) noexcept -> bool {
    return kind == ErrorKind::Transport || kind == ErrorKind::ChunkCorrupt;
}

auto Retry::fetch(EChunk const& chunk) -> Buffer {
    auto const depth = error_stack().size();
    for (std::uint32_t attempt = 0;; ++attempt) {
        try {
            return inner_.fetch(chunk);
        } catch (Error const& error) {
            if (!is_transient(error.kind()) || attempt >= retries_) {
                throw;
            }
            std::cerr << fmt::format("RETRY({}/{}): {}: {}", attempt + 1, retries_, chunk.guid, error.what())
                      << std::endl;
            error_stack().resize(depth);
            if (backoff_.count()) {
                std::this_thread::sleep_for(backoff_ * (attempt + 1));
            }
        }
    }
}
