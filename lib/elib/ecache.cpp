#include "ecache.hpp"

using namespace elib;

auto ECache::seed(std::span<EFile const> files) -> void {
    for (auto const& file : files) {
        for (auto const& part : file.parts) {
            ++uses_[part.guid];
        }
    }
}

auto ECache::remaining(ChunkGUID const& guid) const noexcept -> std::int64_t {
    if (auto i = uses_.find(guid); i != uses_.end()) {
        return i->second;
    }
    return 0;
}

auto ECache::get(ChunkGUID const& guid) const noexcept -> Payload {
    if (auto i = cache_.find(guid); i != cache_.end()) {
        return i->second;
    }
    return nullptr;
}

auto ECache::put(ChunkGUID const& guid, Payload payload) -> bool {
    elib_assert(payload);
    if (this->remaining(guid) <= 1) {
        return false;
    }
    auto [i, inserted] = cache_.try_emplace(guid, std::move(payload));
    if (inserted) {
        memory_ += i->second->size();
    }
    return inserted;
}

auto ECache::consume(ChunkGUID const& guid) noexcept -> void {
    auto i = uses_.find(guid);
    if (i == uses_.end()) {
        return;
    }
    if (--i->second < 1) {
        uses_.erase(i);
        if (auto c = cache_.find(guid); c != cache_.end()) {
            memory_ -= c->second->size();
            cache_.erase(c);
        }
    }
}
