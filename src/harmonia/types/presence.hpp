#ifndef HARMONIA_TYPES_PRESENCE_HPP
#define HARMONIA_TYPES_PRESENCE_HPP

#include <cstdint>
#include <string>
#include <vector>
#include <boost/optional.hpp>
#include <nlohmann/json.hpp>
#include <harmonia/types/enums.hpp>

namespace Harmonia {
    namespace PresenceStatus {
        constexpr const char* Online    = "online";
        constexpr const char* DoNotDisturb = "dnd";
        constexpr const char* Idle      = "idle";
        constexpr const char* Invisible = "invisible";
        constexpr const char* Offline   = "offline";
    }

    /**
     * Activity shown in user profile. Bots can't use Custom type
     * with anything except state.
     */
    struct Activity {
        Activity() = default;
        Activity(const std::string& name, ActivityType type = ActivityType::Game,
                 const boost::optional<std::string>& url = boost::none)
            : name(name), type(type), url(url) {}

        std::string name;
        ActivityType type = ActivityType::Game;

        /// Stream URL, only for Streaming type.
        boost::optional<std::string> url;

        /// Custom status text.
        boost::optional<std::string> state;

        nlohmann::json toJson() const;
    };

    /**
     * Presence sent in Identify and Presence Update gateway messages.
     */
    struct Presence {
        std::string status = PresenceStatus::Online;
        std::vector<Activity> activities;
        bool afk = false;

        /// Unix time (ms) since client went idle.
        boost::optional<uint64_t> since;

        /**
         * \throws InvalidParameter if status is not one of \ref PresenceStatus
         *         values or Streaming activity have no URL.
         */
        void validate() const;

        nlohmann::json toJson() const;
    };
} // namespace Harmonia

#endif // HARMONIA_TYPES_PRESENCE_HPP
