#include <cstdlib>
#include <iostream>
#include <unordered_set>
#include <harmonia/exceptions.hpp>
#include <harmonia/gateway_client.hpp>
#include <harmonia/rest_client.hpp>
#include <harmonia/types/components.hpp>

int main(int argc, char** argv) {
    const char* botToken = std::getenv("BOT_TOKEN");
    if (!botToken) {
        std::cerr << "Set bot token using BOT_TOKEN environment variable.\n"
                  << "E.g. env BOT_TOKEN=token_here " << argv[0] << '\n';
        return 1;
    }

    const char* ownerIdStr = std::getenv("OWNER_ID");
    if (!ownerIdStr) {
        std::cerr << "OWNER_ID is not set, echo-bot shutdown can't be used.\n";
    }
    Harmonia::Snowflake ownerId = ownerIdStr ? Harmonia::Snowflake(std::string(ownerIdStr)) : Harmonia::Snowflake();

    boost::asio::io_context ioContext;
    Harmonia::GatewayClient gclient(ioContext, botToken);
    Harmonia::RestClient    rclient(ioContext, botToken);

    std::unordered_set<Harmonia::Snowflake> enabledChannels;
    Harmonia::Snowflake me;

    gclient.eventDispatcher.addHandler(Harmonia::Event::Ready, [&](const nlohmann::json& json) {
        me = json["user"]["id"].get<Harmonia::Snowflake>();
        std::cerr << "Logged in as " << json["user"]["username"].get<std::string>() << '\n';
    });

    gclient.eventDispatcher.addHandler(Harmonia::Event::MessageCreate, [&](const nlohmann::json& json) {
        Harmonia::Snowflake messageId = json["id"].get<Harmonia::Snowflake>();
        Harmonia::Snowflake channelId = json["channel_id"].get<Harmonia::Snowflake>();

        // Sender can be webhook, these have "webhook_id" instead of author id.
        Harmonia::Snowflake senderId = json.count("webhook_id") ? json["webhook_id"].get<Harmonia::Snowflake>()
                                                                : json["author"]["id"].get<Harmonia::Snowflake>();

        // Avoid responding to own messages.
        if (senderId == me) return;

        std::string text = json["content"];

        std::string messageInfo =
            std::string("Message ID: `") + messageId.toString() +
                      "`\nChannel ID: `"  + channelId.toString() +
                      "`\nSender ID: `"   + senderId.toString()  + "`\n" +
                      "\n" + text + "\n\n";

        std::cout << messageInfo;

        bool enabled = enabledChannels.count(channelId) != 0;

        try {
            if (text == "echo-bot turn-on") {
                if (enabled) {
                    rclient.sendTextMessage(channelId, "Already turned on.");
                    return;
                }

                std::cerr << "Turning on for channel " << channelId.toString() << '\n';
                enabledChannels.insert(channelId);

                Harmonia::OutgoingMessage reply("Turned on. Use `echo-bot turn-off` or the button to turn off.");
                reply.components.push_back(Harmonia::actionRow({
                    Harmonia::button(Harmonia::ButtonStyle::Danger, "Turn off", "echo-bot:turn-off")
                }));
                rclient.createMessage(channelId, reply);
                return;
            }

            if (text == "echo-bot turn-off") {
                if (!enabled) {
                    rclient.sendTextMessage(channelId, "Already turned off.");
                    return;
                }
                std::cerr << "Turning off for channel " << channelId.toString() << '\n';
                enabledChannels.erase(channelId);
                rclient.sendTextMessage(channelId, "Turned off. Use `echo-bot turn-on` to turn on.");
                return;
            }

            if (text == "echo-bot shutdown") {
                if (senderId == ownerId) {
                    rclient.sendTextMessage(channelId, "Goodbye!");
                    gclient.disconnect();
                    ioContext.stop();
                } else {
                    rclient.sendTextMessage(channelId, "Only my owner can use this command.");
                }
                return;
            }

            if (enabled) {
                // Echo as reply, without pinging anybody mentioned in original message.
                Harmonia::OutgoingMessage echo(messageInfo);
                echo.replyTo = messageId;
                echo.failIfReplyMissing = false;
                echo.allowedMentions = Harmonia::AllowedMentions();
                rclient.createMessage(channelId, echo);
            }
        } catch (Harmonia::RESTError& e) {
            std::cerr << "Failed to respond in channel " << channelId.toString() << ": " << e.what() << '\n';
        }
    });

    gclient.eventDispatcher.addHandler(Harmonia::Event::InteractionCreate, [&](const nlohmann::json& json) {
        if (json["type"] != static_cast<int>(Harmonia::InteractionType::MessageComponent)) return;
        if (json["data"]["custom_id"] != "echo-bot:turn-off") return;

        enabledChannels.erase(json["channel_id"].get<Harmonia::Snowflake>());

        Harmonia::OutgoingMessage response("Turned off.");
        response.flags = Harmonia::Ephemeral;
        rclient.createInteractionResponse(json["id"].get<Harmonia::Snowflake>(), json["token"].get<std::string>(),
                                          Harmonia::InteractionResponseType::ChannelMessageWithSource, response);
    });

    // Connect to gateway (getGatewayUrlBot returns pair, where first is gateway URL).
    // We also set status to "Playing echo-bot turn-on".
    Harmonia::Presence presence;
    presence.activities.push_back(Harmonia::Activity("echo-bot turn-on"));

    gclient.connect(rclient.getGatewayUrlBot().first,
                    Harmonia::GatewayClient::NoSharding, Harmonia::GatewayClient::NoSharding,
                    presence,
                    Harmonia::GuildMessagesIntent | Harmonia::MessageContentIntent);

    /// Run for undetermined amount of time.
    ioContext.run();
}
