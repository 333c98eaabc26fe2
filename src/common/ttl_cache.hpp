#pragma once

// ---------------------------------------------------------------------------
// ttl_cache.hpp
//
// 만료 시간이 있는 동시성 안전 맵. 헤더 전용 템플릿.
//
// [스레드 안전성]
// - get(): shared_lock (다수 요청이 동시에 읽는 경로)
// - put()/invalidate()/clear(): unique_lock
// - 만료된 엔트리는 get() 에서 nullopt 로 취급하고, 다음 put()/purge_expired()
//   에서 제거한다. 읽기 경로에서 쓰기 잠금을 잡지 않기 위함이다.
//
// [시계]
// std::chrono::steady_clock (단조 시계). 시스템 시각 변경에 영향받지 않는다.
// 테스트에서 만료를 검증할 수 있도록 Clock 을 템플릿 파라미터로 받는다.
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <utility>

template <typename Key, typename Value, typename Clock = std::chrono::steady_clock>
class TtlCache {
public:
    using Duration = typename Clock::duration;

    explicit TtlCache(Duration ttl) : ttl_(ttl) {}

    ~TtlCache() = default;

    // 복사/이동 금지 (mutex 소유)
    TtlCache(const TtlCache&)            = delete;
    TtlCache& operator=(const TtlCache&) = delete;
    TtlCache(TtlCache&&)                 = delete;
    TtlCache& operator=(TtlCache&&)      = delete;

    // get
    //   만료되지 않은 값의 복사본을 반환한다. 없거나 만료됐으면 nullopt.
    [[nodiscard]] std::optional<Value> get(const Key& key) const {
        std::shared_lock lock(mutex_);
        const auto it = entries_.find(key);
        if (it == entries_.end() || Clock::now() >= it->second.expires_at) {
            return std::nullopt;
        }
        return it->second.value;
    }

    void put(const Key& key, Value value) {
        const auto now = Clock::now();
        std::unique_lock lock(mutex_);
        purge_expired_locked(now);
        entries_.insert_or_assign(key, Entry{std::move(value), now + ttl_});
    }

    // invalidate
    //   반환: 엔트리가 존재했으면 true
    bool invalidate(const Key& key) {
        std::unique_lock lock(mutex_);
        return entries_.erase(key) > 0;
    }

    void clear() {
        std::unique_lock lock(mutex_);
        entries_.clear();
    }

    void purge_expired() {
        std::unique_lock lock(mutex_);
        purge_expired_locked(Clock::now());
    }

    // 만료 여부와 무관한 현재 엔트리 수 (진단용)
    [[nodiscard]] std::size_t size() const {
        std::shared_lock lock(mutex_);
        return entries_.size();
    }

    [[nodiscard]] Duration ttl() const noexcept { return ttl_; }

private:
    struct Entry {
        Value                          value;
        typename Clock::time_point     expires_at;
    };

    void purge_expired_locked(typename Clock::time_point now) {
        for (auto it = entries_.begin(); it != entries_.end();) {
            if (now >= it->second.expires_at) {
                it = entries_.erase(it);
            } else {
                ++it;
            }
        }
    }

    Duration                          ttl_;
    mutable std::shared_mutex         mutex_;
    std::unordered_map<Key, Entry>    entries_;
};
