// Harmonia - Discord API library for C++11 using boost libraries.
// Copyright © 2017 Maks Mazurov (fox.cpp) <foxcpp@yandex.ru>
// 
// Permission is hereby granted, free of charge, to any person obtaining
// a copy of this software and associated documentation files (the "Software"),
// to deal in the Software without restriction, including without limitation
// the rights to use, copy, modify, merge, publish, distribute, sublicense,
// and/or sell copies of the Software, and to permit persons to whom the
// Software is furnished to do so, subject to the following conditions:
// 
// The above copyright notice and this permission notice shall be included
// in all copies or substantial portions of the Software.
// 
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND,
// EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES
// OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT.
// IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM,
// DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT,
// TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE
// OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.

#include <harmonia/ratelimit_lock.hpp>
#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <thread>

#if defined(HARMONIA_DEBUG_LOG) && defined(HARMONIA_DEBUG_RATELIMITLOCK)
    #include <iostream>
    #define DEBUG_MSG(msg) do { std::cerr << "ratelimit_lock.cpp:" << __LINE__ << "\t" << (msg) << '\n'; } while (false)
#else
    #define DEBUG_MSG(msg)
#endif

namespace Harmonia {
    namespace {
        RatelimitLock::Clock::duration secondsToDuration(double seconds) {
            return std::chrono::duration_cast<RatelimitLock::Clock::duration>(std::chrono::duration<double>(seconds));
        }
    }

    RatelimitLock::RatelimitLock(std::size_t cacheSize)
        : RatelimitLock([]() { return Clock::now(); },
                        [](Clock::duration duration) { std::this_thread::sleep_for(duration); },
                        cacheSize) {}

    RatelimitLock::RatelimitLock(NowFunction now, SleepFunction sleep, std::size_t cacheSize)
        : now(std::move(now))
        , sleep(std::move(sleep))
        , cacheSize(cacheSize == 0 ? 1 : cacheSize) {

        globalResetAt = this->now();
    }

    std::string RatelimitLock::bucketId(const Route& route) const {
        auto hashIt = routeHashes.find(route.templateKey());
        if (hashIt == routeHashes.end()) return route.bucketKey();

        return hashIt->second + ":" + route.majorParameters();
    }

    RatelimitLock::BucketList::iterator RatelimitLock::findBucket(const Route& route) {
        auto it = buckets.find(bucketId(route));
        return it != buckets.end() ? it->second : queue.end();
    }

    RatelimitLock::BucketList::iterator RatelimitLock::findOrCreateBucket(const Route& route) {
        std::string id = bucketId(route);

        auto it = buckets.find(id);
        if (it != buckets.end()) {
            // Move to the end, most recently used.
            queue.splice(queue.end(), queue, it->second);
            return it->second;
        }

        if (queue.size() >= cacheSize) {
            DEBUG_MSG("Ratelimit cache hit size limit, erasing information about oldest bucket...");
            DEBUG_MSG(std::string("Bucket removed: ") + queue.front().id);

            buckets.erase(queue.front().id);
            queue.pop_front();
        }

        queue.push_back({ id, 0, 0, now() });
        auto inserted = std::prev(queue.end());
        buckets.emplace(id, inserted);
        return inserted;
    }

    int RatelimitLock::remaining(const Route& route) {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = findBucket(route);
        return it != queue.end() ? static_cast<int>(it->remaining) : -1;
    }

    int RatelimitLock::limit(const Route& route) {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = findBucket(route);
        return it != queue.end() ? static_cast<int>(it->limit) : -1;
    }

    double RatelimitLock::resetAfter(const Route& route) {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = findBucket(route);
        if (it == queue.end()) return -1;

        auto left = it->resetAt - now();
        if (left <= Clock::duration::zero()) return 0;
        return std::chrono::duration_cast<std::chrono::duration<double> >(left).count();
    }

    std::string RatelimitLock::bucketFor(const Route& route) {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = routeHashes.find(route.templateKey());
        return it != routeHashes.end() ? it->second : std::string();
    }

    bool RatelimitLock::globallyBlocked() {
        std::lock_guard<std::mutex> lock(mutex);
        return globalResetAt > now();
    }

    void RatelimitLock::down(const Route& route) {
        while (true) {
            Clock::duration wait;
            {
                std::lock_guard<std::mutex> lock(mutex);
                TimePoint currentTime = now();

                if (globalResetAt > currentTime) {
                    wait = globalResetAt - currentTime;
                    DEBUG_MSG(std::string("Global ratelimit active, delaying ") + route.bucketKey());
                } else {
                    auto it = findBucket(route);

                    // We can't predict limit hit in this case, so assume we don't hit it.
                    if (it == queue.end()) {
                        DEBUG_MSG(std::string("Can't predict hit for route (no information) ") + route.bucketKey());
                        return;
                    }

                    BucketInfo& bucket = *it;
                    if (bucket.resetAt <= currentTime && bucket.remaining < bucket.limit) {
                        DEBUG_MSG(std::string("Bucket ") + bucket.id + " is reset.");
                        bucket.remaining = bucket.limit;
                    }

                    // Limit unknown (bucket created by 429 without headers) and reset passed.
                    if (bucket.limit == 0 && bucket.resetAt <= currentTime) return;

                    if (bucket.remaining > 0) {
                        --bucket.remaining;
                        DEBUG_MSG(std::string("Ratelimit semaphore acquire for bucket ") + bucket.id +
                                  " limit=" + std::to_string(bucket.limit) +
                                  ", remaining=" + std::to_string(bucket.remaining));
                        return;
                    }

                    wait = bucket.resetAt - currentTime;
                    DEBUG_MSG(std::string("Ratelimit hit for bucket ") + bucket.id + ", blocking for " +
                              std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(wait).count()) + " ms");
                }
            }

            sleep(wait);
        }
    }

    void RatelimitLock::refreshInfo(const Route& route, const REST::HeadersMap& headers) {
        auto bucketIt     = headers.find("X-RateLimit-Bucket");
        auto limitIt      = headers.find("X-RateLimit-Limit");
        auto remainingIt  = headers.find("X-RateLimit-Remaining");
        auto resetAfterIt = headers.find("X-RateLimit-Reset-After");

        std::lock_guard<std::mutex> lock(mutex);

        if (bucketIt != headers.end()) {
            std::string& knownHash = routeHashes[route.templateKey()];
            if (knownHash != bucketIt->second) {
                DEBUG_MSG(std::string("Route ") + route.templateKey() + " uses bucket " + bucketIt->second);
                knownHash = bucketIt->second;
            }
        }

        if (limitIt == headers.end() || remainingIt == headers.end() || resetAfterIt == headers.end()) return;

        unsigned limit, remaining;
        double resetAfter;
        try {
            limit      = static_cast<unsigned>(std::stoul(limitIt->second));
            remaining  = static_cast<unsigned>(std::stoul(remainingIt->second));
            resetAfter = std::stod(resetAfterIt->second);
        } catch (const std::logic_error& excp) {
            DEBUG_MSG(std::string("Malformed X-RateLimit headers: ") + excp.what());
            return;
        }

        BucketInfo& bucket = *findOrCreateBucket(route);
        bucket.limit     = limit;
        bucket.remaining = std::min(remaining, limit);
        bucket.resetAt   = now() + secondsToDuration(resetAfter);

        DEBUG_MSG(std::string("Bucket ") + bucket.id +
                  ": remaining=" + std::to_string(bucket.remaining) +
                  ", limit=" + std::to_string(bucket.limit) +
                  ", resetAfter=" + std::to_string(resetAfter));
    }

    void RatelimitLock::hit(const Route& route, double retryAfterSecs, bool global) {
        std::lock_guard<std::mutex> lock(mutex);

        TimePoint until = now() + secondsToDuration(retryAfterSecs);
        if (global) {
            DEBUG_MSG(std::string("Global ratelimit hit, retry after ") + std::to_string(retryAfterSecs) + " s");
            globalResetAt = std::max(globalResetAt, until);
            return;
        }

        BucketInfo& bucket = *findOrCreateBucket(route);
        DEBUG_MSG(std::string("Ratelimit hit for bucket ") + bucket.id + ", retry after " +
                  std::to_string(retryAfterSecs) + " s");

        bucket.remaining = 0;
        bucket.resetAt   = std::max(bucket.resetAt, until);
    }
} // namespace Harmonia
