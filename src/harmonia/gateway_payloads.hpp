#ifndef HARMONIA_GATEWAY_PAYLOADS_HPP
#define HARMONIA_GATEWAY_PAYLOADS_HPP

#include <string>
#include <vector>
#include <boost/optional.hpp>
#include <nlohmann/json.hpp>
#include <harmonia/intents.hpp>
#include <harmonia/types/presence.hpp>
#include <harmonia/types/snowflake.hpp>

/**
 * \file gateway_payloads.hpp
 *
 * Builders for "d" field of gateway commands sent by client.
 * All builders validate arguments and throw \ref InvalidParameter.
 */

namespace Harmonia { namespace GatewayPayloads {
    constexpr int NoSharding = -1;

    /**
     * Identify (op 2).
     *
     * \param shardId, shardCount Either both \ref NoSharding or 0 <= shardId < shardCount.
     * \param largeThreshold Members count after which offline members are not sent
     *                       in GUILD_CREATE, 50-250.
     */
    nlohmann::json identify(const std::string& token, Intents intents,
                            int shardId = NoSharding, int shardCount = NoSharding,
                            const Presence& presence = Presence(),
                            unsigned largeThreshold = 250, bool compress = false);

    /// Resume (op 6).
    nlohmann::json resume(const std::string& token, const std::string& sessionId, int lastSequenceNumber);

    /// Presence Update (op 3).
    nlohmann::json updatePresence(const Presence& presence);

    /**
     * Voice State Update (op 4). Pass boost::none as channel to leave voice channel.
     */
    nlohmann::json updateVoiceState(Snowflake guildId, boost::optional<Snowflake> channelId,
                                    bool selfMute = false, bool selfDeaf = false);

    /**
     * Request Guild Members (op 8).
     *
     * Either query (empty string = all members) or 1-100 user ids should be passed.
     * Members are received in GUILD_MEMBERS_CHUNK events.
     *
     * \param limit Max members to send, 0 = no limit (requires GUILD_MEMBERS intent).
     */
    nlohmann::json requestGuildMembers(Snowflake guildId,
                                       const boost::optional<std::string>& query,
                                       const std::vector<Snowflake>& userIds = {},
                                       int limit = 0, bool presences = false,
                                       const std::string& nonce = "");
}} // namespace Harmonia::GatewayPayloads

#endif // HARMONIA_GATEWAY_PAYLOADS_HPP
