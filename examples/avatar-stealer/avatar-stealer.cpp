#include <cstdlib>
#include <iostream>
#include <harmonia/gateway_client.hpp>
#include <harmonia/rest_client.hpp>
#include <harmonia/types/image.hpp>

boost::asio::io_context ioContext;

void stealUserAvatar(const nlohmann::json& userObject) {
    Harmonia::Snowflake userId = userObject["id"].get<Harmonia::Snowflake>();

    if (userObject["avatar"].is_null()) {
        Harmonia::ImageReference<Harmonia::DefaultUserAvatar>::forUser(userId)
            .download<Harmonia::Png>(ioContext, 1024)
            .file.write(std::string("user_") + userId.toString() + "_default.png");
    } else {
        Harmonia::ImageReference<Harmonia::UserAvatar> avatar(userId, userObject["avatar"].get<std::string>());
        if (avatar.isAnimated()) {
            avatar.download<Harmonia::Gif>(ioContext, 1024)
                .file.write(std::string("user_") + userId.toString() + "_" + avatar.hash + ".gif");
        } else {
            avatar.download<Harmonia::Png>(ioContext, 1024)
                .file.write(std::string("user_") + userId.toString() + "_" + avatar.hash + ".png");
        }
    }
}

void stealGuildIcon(const nlohmann::json& guildObject) {
    if (guildObject["icon"].is_null()) return;

    Harmonia::ImageReference<Harmonia::GuildIcon> icon(guildObject["id"].get<Harmonia::Snowflake>(),
                                                       guildObject["icon"].get<std::string>());
    icon.download<Harmonia::Png>(ioContext, 1024)
        .file.write(std::string("guild_") + icon.id.toString() + "_" + icon.hash + ".png");
}

int main(int argc, char** argv) {
    const char* botToken = std::getenv("BOT_TOKEN");
    if (!botToken) {
        std::cerr << "Set bot token using BOT_TOKEN environment variable.\n"
                  << "E.g. env BOT_TOKEN=token_here " << argv[0] << '\n';
        return 1;
    }

    Harmonia::GatewayClient gclient(ioContext, botToken);
    Harmonia::RestClient    rclient(ioContext, botToken);

    gclient.eventDispatcher.addHandler(Harmonia::Event::GuildCreate, [&gclient](const nlohmann::json& payload) {
        stealGuildIcon(payload);

        // GUILD_CREATE carries only part of members for large guilds, ask for the rest.
        gclient.requestGuildMembers(payload["id"].get<Harmonia::Snowflake>(), std::string(""));
    });

    gclient.eventDispatcher.addHandler(Harmonia::Event::GuildMembersChunk, [](const nlohmann::json& payload) {
        for (const nlohmann::json& member : payload["members"]) {
            stealUserAvatar(member["user"]);
        }
    });

    gclient.eventDispatcher.addHandler(Harmonia::Event::GuildMemberAdd, [](const nlohmann::json& payload) {
        stealUserAvatar(payload["user"]);
    });

    gclient.connect(rclient.getGatewayUrlBot().first,
                    Harmonia::GatewayClient::NoSharding, Harmonia::GatewayClient::NoSharding,
                    Harmonia::Presence(),
                    Harmonia::GuildsIntent | Harmonia::GuildMembersIntent);
    ioContext.run();
}
