#ifndef HARMONIA_RATELIMIT_LOCK_HPP
#define HARMONIA_RATELIMIT_LOCK_HPP

#include <chrono>
#include <cstddef>
#include <functional>
#include <list>
#include <mutex>
#include <string>
#include <unordered_map>
#include <harmonia/config.hpp>
#include <harmonia/route.hpp>
#include <harmonia/internal/rest.hpp>

namespace Harmonia
{
    /**
     * Class that implements semaphore-like locking based on Discord's
     * per-route rate limits.
     *
     * Bucket of a request is identified by Discord-provided hash
     * (X-RateLimit-Bucket header) and values of major route parameters.
     * Until hash for route is known, \ref Route::bucketKey is used.
     *
     * All methods are thread-safe. Blocking happens outside of internal mutex,
     * so requests to other buckets are not delayed.
     */
    class RatelimitLock {
    public:
        using Clock         = std::chrono::steady_clock;
        using TimePoint     = Clock::time_point;
        using NowFunction   = std::function<TimePoint()>;
        using SleepFunction = std::function<void(Clock::duration)>;

        /**
         * Construct lock that uses real steady clock and std::this_thread::sleep_for.
         */
        explicit RatelimitLock(std::size_t cacheSize = HARMONIA_RATELIMIT_CACHE_SIZE);

        /**
         * Construct lock with custom time source, mainly for testing.
         */
        RatelimitLock(NowFunction now, SleepFunction sleep,
                      std::size_t cacheSize = HARMONIA_RATELIMIT_CACHE_SIZE);

        RatelimitLock(const RatelimitLock&) = delete;
        RatelimitLock& operator=(const RatelimitLock&) = delete;

        /**
         * Requests count that can be made using this
         * route until reset.
         *
         * If not known - returns -1.
         */
        int remaining(const Route& route);

        /**
         * Latest known maximum count of requests for specified route
         * in current interval.
         *
         * If not known - returns -1.
         */
        int limit(const Route& route);

        /**
         * Seconds until bucket of this route is reset, 0 if it's already reset.
         *
         * If not known - returns -1.
         */
        double resetAfter(const Route& route);

        /**
         * Discord bucket hash for route, empty if not known yet.
         */
        std::string bucketFor(const Route& route);

        /**
         * Whether global rate limit is hit and all requests are delayed.
         */
        bool globallyBlocked();

        /**
         * Called before perfoming request, block until reset time if rate limit hit.
         *
         * **Should not be called by user code directly.**
         */
        void down(const Route& route);

        /**
         * Called after request in order to update information about ratelimits
         * using X-RateLimit-* headers. Absent headers are ignored.
         *
         * **Should not be called by user code directly.**
         */
        void refreshInfo(const Route& route, const REST::HeadersMap& headers);

        /**
         * Called on 429 response. Global hit blocks all routes.
         *
         * **Should not be called by user code directly.**
         */
        void hit(const Route& route, double retryAfterSecs, bool global);

    private:
        struct BucketInfo {
            std::string id;

            unsigned  limit;
            unsigned  remaining;
            TimePoint resetAt;
        };

        using BucketList = std::list<BucketInfo>;

        // Must be called with mutex locked.
        std::string bucketId(const Route& route) const;
        BucketList::iterator findBucket(const Route& route);
        BucketList::iterator findOrCreateBucket(const Route& route);

        NowFunction   now;
        SleepFunction sleep;
        const std::size_t cacheSize;

        std::mutex mutex;

        // I need a queue to remove oldest information and
        // hashmap to provide fast key-indexing.
        BucketList queue;
        std::unordered_map<std::string, BucketList::iterator> buckets;

        // Route::templateKey() -> X-RateLimit-Bucket
        std::unordered_map<std::string, std::string> routeHashes;

        TimePoint globalResetAt;
    };
} // namespace Harmonia

#endif // HARMONIA_RATELIMIT_LOCK_HPP
