#include <gtest/gtest.h>
#include <trayhost/error_types.h>
#include <trayhost/window_registry.h>
#include "fake_window_system.h"

using namespace trayhost;
using trayhost::testing::FakeWindowSystem;

namespace {

class RecordingHandler : public MessageHandler {
public:
    MessageResult handle_message(WindowHandle, MessageId msg, MessageWParam, MessageLParam) override {
        messages.push_back(msg);
        return 1;
    }

    std::vector<MessageId> messages;
};

TEST(WindowRegistryTest, FindsInsertedHandler) {
    WindowRegistry registry;
    auto handler = std::make_shared<RecordingHandler>();

    RegistryKey key = registry.insert(handler);

    EXPECT_EQ(registry.find(key), handler);
    EXPECT_EQ(registry.size(), 1u);
}

TEST(WindowRegistryTest, RemovedKeyResolvesToNothing) {
    WindowRegistry registry;
    RegistryKey key = registry.insert(std::make_shared<RecordingHandler>());

    EXPECT_TRUE(registry.remove(key));
    EXPECT_EQ(registry.find(key), nullptr);
    EXPECT_FALSE(registry.remove(key));
    EXPECT_EQ(registry.size(), 0u);
}

TEST(WindowRegistryTest, ReusedSlotRejectsStaleKey) {
    WindowRegistry registry;
    RegistryKey stale = registry.insert(std::make_shared<RecordingHandler>());
    registry.remove(stale);

    auto handler = std::make_shared<RecordingHandler>();
    RegistryKey fresh = registry.insert(handler);

    EXPECT_EQ(fresh.index, stale.index);
    EXPECT_NE(fresh.generation, stale.generation);
    EXPECT_EQ(registry.find(stale), nullptr);
    EXPECT_FALSE(registry.remove(stale));
    EXPECT_EQ(registry.find(fresh), handler);
}

TEST(WindowRegistryTest, ZeroKeyNeverMatches) {
    WindowRegistry registry;
    registry.insert(std::make_shared<RecordingHandler>());

    EXPECT_EQ(registry.find(RegistryKey{}), nullptr);
    EXPECT_EQ(registry.find(RegistryKey{ 5, 1 }), nullptr);
}

TEST(WindowRegistryTest, RemoveReleasesHandler) {
    WindowRegistry registry;
    auto handler = std::make_shared<RecordingHandler>();
    std::weak_ptr<RecordingHandler> observer = handler;

    RegistryKey key = registry.insert(std::move(handler));
    registry.remove(key);

    EXPECT_TRUE(observer.expired());
}

TEST(RegistryKeyTest, SurvivesPointerSizedRoundTrip) {
    RegistryKey key{ 3, 7 };

    RegistryKey copy = RegistryKey::from_bits(key.to_bits());

    EXPECT_EQ(copy, key);
    EXPECT_NE(key.to_bits(), RegistryKey{}.to_bits());
    EXPECT_NE(RegistryKey::from_bits(RegistryKey{ 3, 8 }.to_bits()), key);
}

TEST(WindowDispatchTest, RoutesToRegisteredHandler) {
    FakeWindowSystem system;
    auto handler = std::make_shared<RecordingHandler>();
    RegistryKey key = system.registry().insert(handler);

    MessageResult result = system.dispatch(0x10, Msg::USER, 0, 0, key);

    EXPECT_EQ(result, 1);
    EXPECT_EQ(handler->messages, std::vector<MessageId>{ Msg::USER });
    EXPECT_EQ(system.default_proc_calls, 0);
}

TEST(WindowDispatchTest, StaleKeyFallsBackToDefaultProcedure) {
    FakeWindowSystem system;
    auto handler = std::make_shared<RecordingHandler>();
    RegistryKey key = system.registry().insert(handler);
    system.registry().remove(key);

    system.dispatch(0x10, Msg::USER, 0, 0, key);

    EXPECT_TRUE(handler->messages.empty());
    EXPECT_EQ(system.default_proc_calls, 1);
}

TEST(WindowDispatchTest, CreateIsRepostedForTheSubclass) {
    FakeWindowSystem system;
    ASSERT_TRUE(system.ensure_window_class("Test"));

    WindowHandle hwnd = system.create_window("Test", "", 0);

    ASSERT_NE(hwnd, 0u);
    ASSERT_EQ(system.queue.size(), 1u);
    EXPECT_EQ(system.queue.front().msg, Msg::APP_CREATE);
    EXPECT_EQ(system.queue.front().lparam, 0);
    EXPECT_EQ(system.default_proc_calls, 0);
}

TEST(WindowDispatchTest, UnregisteredClassCannotCreateWindows) {
    FakeWindowSystem system;

    EXPECT_EQ(system.create_window("Missing", "", 0), 0u);
    EXPECT_EQ(system.last_error(), 1407u);
}

#ifndef _WIN32
TEST(WindowSystemFactoryTest, NoNotificationAreaOutsideWindows) {
    EXPECT_THROW(create_native_window_system(), UnsupportedOperationException);
}
#endif

} // namespace
