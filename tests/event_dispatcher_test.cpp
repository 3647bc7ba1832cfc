#include <gtest/gtest.h>
#include <harmonia/event_dispatcher.hpp>

using namespace Harmonia;

TEST(EventDispatcherTest, NameMapping) {
    EXPECT_TRUE(EventDispatcher::eventFromString("MESSAGE_CREATE") == Event::MessageCreate);
    EXPECT_TRUE(EventDispatcher::eventFromString("GUILD_SCHEDULED_EVENT_USER_ADD") == Event::GuildScheduledEventUserAdd);
    EXPECT_FALSE(EventDispatcher::eventFromString("message_create"));

    EXPECT_EQ(EventDispatcher::eventToString(Event::InteractionCreate), "INTERACTION_CREATE");
    EXPECT_EQ(EventDispatcher::eventToString(Event::Ready), "READY");
}

TEST(EventDispatcherTest, HandlersCalledInOrder) {
    EventDispatcher dispatcher;
    std::vector<std::string> calls;

    dispatcher.addHandler(Event::MessageCreate, [&calls](const nlohmann::json& payload) {
        calls.push_back("first " + payload["content"].get<std::string>());
    });
    dispatcher.addHandler(Event::MessageCreate, [&calls](const nlohmann::json&) {
        calls.push_back("second");
    });
    dispatcher.addHandler(Event::MessageDelete, [&calls](const nlohmann::json&) {
        calls.push_back("delete");
    });

    dispatcher.dispatchEvent("MESSAGE_CREATE", {{ "content", "hi" }});

    EXPECT_EQ(calls, std::vector<std::string>({ "first hi", "second" }));
}

TEST(EventDispatcherTest, UnknownEvent) {
    EventDispatcher dispatcher;
    std::string seen;

    dispatcher.addUnknownEventHandler([&seen](const std::string& name, const nlohmann::json&) {
        seen = name;
    });

    dispatcher.dispatchEvent("SOMETHING_NEW", nlohmann::json::object());

    EXPECT_EQ(seen, "SOMETHING_NEW");
}

TEST(EventDispatcherTest, KnownEventSkipsUnknownHandlers) {
    EventDispatcher dispatcher;
    bool unknownCalled = false;

    dispatcher.addUnknownEventHandler([&unknownCalled](const std::string&, const nlohmann::json&) {
        unknownCalled = true;
    });

    dispatcher.dispatchEvent("TYPING_START", nlohmann::json::object());

    EXPECT_FALSE(unknownCalled);
}

TEST(EventDispatcherTest, RemoveHandlers) {
    EventDispatcher dispatcher;
    int count = 0;

    dispatcher.addHandler(Event::Ready, [&count](const nlohmann::json&) { ++count; });
    dispatcher.dispatchEvent(Event::Ready, nullptr);
    dispatcher.removeHandlers(Event::Ready);
    dispatcher.dispatchEvent(Event::Ready, nullptr);

    EXPECT_EQ(count, 1);
}
