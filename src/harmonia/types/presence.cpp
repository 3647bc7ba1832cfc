#include <harmonia/types/presence.hpp>
#include <harmonia/exceptions.hpp>

namespace Harmonia {
    nlohmann::json Activity::toJson() const {
        nlohmann::json result = {
            { "name", name },
            { "type", static_cast<int>(type) }
        };
        if (url)   result["url"]   = *url;
        if (state) result["state"] = *state;
        return result;
    }

    void Presence::validate() const {
        if (status != PresenceStatus::Online &&
            status != PresenceStatus::DoNotDisturb &&
            status != PresenceStatus::Idle &&
            status != PresenceStatus::Invisible &&
            status != PresenceStatus::Offline) {

            throw InvalidParameter("status", std::string("unknown status: ") + status);
        }

        for (const Activity& activity : activities) {
            if (activity.type == ActivityType::Streaming && !activity.url) {
                throw InvalidParameter("activities", "streaming activity requires url.");
            }
        }
    }

    nlohmann::json Presence::toJson() const {
        validate();

        nlohmann::json jsonActivities = nlohmann::json::array();
        for (const Activity& activity : activities) {
            jsonActivities.push_back(activity.toJson());
        }

        return {
            { "status",     status                                 },
            { "activities", jsonActivities                         },
            { "afk",        afk                                    },
            { "since",      since ? nlohmann::json(*since) : nullptr }
        };
    }
} // namespace Harmonia
