#pragma once

#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>

namespace arbiter {

/**
 * @brief 只读对象的缓存，保证每个键同时至多只有一个加载过程
 * 多个线程同时第一次访问同一个键时，只有一个线程调用 loader，其他线程
 * 等待这个加载结果。加载失败时异常会传递给所有等待者，并且失败结果不会
 * 被缓存，下一次访问会重新加载。
 * @param <K> 键类型
 * @param <V> 缓存的值类型，缓存保存 shared_ptr<const V>，调用方只读共享
 */
template <typename K, typename V>
struct single_flight_cache {
    typedef std::shared_ptr<const V> value_ptr;
    typedef std::function<value_ptr(const K &)> loader_type;

    explicit single_flight_cache(loader_type loader) : loader(std::move(loader)) {}

    /**
     * @brief 获取键对应的值，如果还没有缓存则加载
     * 如果键在加载过程中被标记失效，等待这次加载结束后重新加载
     * @throw loader 抛出的任何异常
     */
    value_ptr get(const K &key) {
        while (true) {
            std::promise<value_ptr> promise;
            std::shared_future<value_ptr> future;
            uint64_t generation = 0;
            bool owner = false, stale = false;
            {
                std::scoped_lock lock(mut);
                auto it = items.find(key);
                if (it != items.end()) {
                    future = it->second.future;
                    stale = it->second.stale;
                } else {
                    future = promise.get_future().share();
                    generation = ++next_generation;
                    items.emplace(key, entry{future, generation, false});
                    owner = true;
                }
            }

            if (owner) {
                load(key, generation, promise);
                return future.get();
            }
            if (!stale) return future.get();
            future.wait();
        }
    }

    /**
     * @brief 使某个键的缓存失效
     * 正在进行的加载不会被打断，但是它的结果不会被缓存
     */
    void invalidate(const K &key) {
        std::scoped_lock lock(mut);
        auto it = items.find(key);
        if (it == items.end()) return;
        if (is_ready(it->second.future))
            items.erase(it);
        else
            it->second.stale = true;
    }

    void clear() {
        std::scoped_lock lock(mut);
        for (auto it = items.begin(); it != items.end();) {
            if (is_ready(it->second.future)) {
                it = items.erase(it);
            } else {
                it->second.stale = true;
                ++it;
            }
        }
    }

private:
    struct entry {
        std::shared_future<value_ptr> future;

        /**
         * @brief 区分同一个键先后的加载过程
         */
        uint64_t generation;

        /**
         * @brief 加载过程中被标记失效，加载结束后不缓存
         */
        bool stale;
    };

    loader_type loader;
    std::mutex mut;
    std::map<K, entry> items;
    uint64_t next_generation = 0;

    static bool is_ready(const std::shared_future<value_ptr> &future) {
        return future.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    }

    /**
     * @brief 调用 loader 并设置加载结果
     * 在设置结果之前更新缓存，等待者被唤醒时缓存已经是最新的状态
     */
    void load(const K &key, uint64_t generation, std::promise<value_ptr> &promise) {
        value_ptr value;
        std::exception_ptr error;
        try {
            value = loader(key);
        } catch (...) {
            error = std::current_exception();
        }

        {
            std::scoped_lock lock(mut);
            auto it = items.find(key);
            // 只清理自己的加载过程，不影响之后开始的加载
            if (it != items.end() && it->second.generation == generation && (error || it->second.stale))
                items.erase(it);
        }

        if (error)
            promise.set_exception(error);
        else
            promise.set_value(std::move(value));
    }
};

}  // namespace arbiter
