#include <harmonia/gateway_payloads.hpp>
#include <harmonia/exceptions.hpp>

// All we need is C++11 compatibile compiler and boost libraries so we can probably run on a lot of platforms.
#if defined(__linux__) || defined(__linux) || defined(linux) || defined(__GNU__)
    #define OS_STR "linux"
#elif defined(__FreeBSD__) || defined(__NetBSD__) || defined(__OpenBSD__) || defined(__DragonFly__)
    #define OS_STR "bsd"
#elif defined(_WIN32) || defined(__WIN32__) || defined(WIN32)
    #define OS_STR "win32"
#elif defined(macintosh) || defined(__APPLE__) || defined(__APPLE_CC__)
    #define OS_STR "macos"
#elif defined(__unix__) || defined (__unix) || defined(_XOPEN_SOURCE) || defined(_POSIX_SOURCE)
    #define OS_STR "unix"
#else
    #define OS_STR "unknown"
#endif

namespace Harmonia { namespace GatewayPayloads {
    nlohmann::json identify(const std::string& token, Intents intents,
                            int shardId, int shardCount,
                            const Presence& presence,
                            unsigned largeThreshold, bool compress) {
        if (largeThreshold < 50 || largeThreshold > 250) {
            throw InvalidParameter("largeThreshold", "largeThreshold out of range (should be 50-250).");
        }

        bool sharded = shardId != NoSharding || shardCount != NoSharding;
        if (sharded && (shardId < 0 || shardCount <= 0 || shardId >= shardCount)) {
            throw InvalidParameter("shardId", "should be 0 <= shardId < shardCount.");
        }

        nlohmann::json payload = {
            { "token",   token                  },
            { "intents", uint32_t(intents)      },
            { "properties", {
                { "os",      OS_STR     },
                { "browser", "harmonia" },
                { "device",  "harmonia" }
            }},
            { "compress",        compress         },
            { "large_threshold", largeThreshold   },
            { "presence",        presence.toJson() }
        };

        if (sharded) {
            payload["shard"] = { shardId, shardCount };
        }
        return payload;
    }

    nlohmann::json resume(const std::string& token, const std::string& sessionId, int lastSequenceNumber) {
        if (sessionId.empty()) {
            throw InvalidParameter("sessionId", "session id is required to resume.");
        }

        return {
            { "token",      token              },
            { "session_id", sessionId          },
            { "seq",        lastSequenceNumber }
        };
    }

    nlohmann::json updatePresence(const Presence& presence) {
        return presence.toJson();
    }

    nlohmann::json updateVoiceState(Snowflake guildId, boost::optional<Snowflake> channelId,
                                    bool selfMute, bool selfDeaf) {
        return {
            { "guild_id",   guildId                                      },
            { "channel_id", channelId ? nlohmann::json(*channelId) : nullptr },
            { "self_mute",  selfMute                                     },
            { "self_deaf",  selfDeaf                                     }
        };
    }

    nlohmann::json requestGuildMembers(Snowflake guildId,
                                       const boost::optional<std::string>& query,
                                       const std::vector<Snowflake>& userIds,
                                       int limit, bool presences,
                                       const std::string& nonce) {
        if (query && !userIds.empty()) {
            throw InvalidParameter("query", "query and userIds are mutually exclusive.");
        }
        if (!query && (userIds.empty() || userIds.size() > 100)) {
            throw InvalidParameter("userIds", "either query or 1-100 user ids is required.");
        }
        if (limit < 0) {
            throw InvalidParameter("limit", "limit should be non-negative.");
        }
        if (nonce.size() > 32) {
            throw InvalidParameter("nonce", "nonce size out of range (should be 0-32).");
        }

        nlohmann::json payload = {
            { "guild_id",  guildId   },
            { "limit",     limit     },
            { "presences", presences }
        };
        if (query) {
            payload["query"] = *query;
        } else {
            payload["user_ids"] = userIds;
        }
        if (!nonce.empty()) payload["nonce"] = nonce;
        return payload;
    }
}} // namespace Harmonia::GatewayPayloads
