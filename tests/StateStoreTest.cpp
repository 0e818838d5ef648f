#include "Service/StateStore.hpp"
#include "Core/Errors.hpp"
#include "TempDir.hpp"

#include <gtest/gtest.h>

#include <unistd.h>

TEST(Timestamps, FormatIsUtcWithMilliseconds)
{
    const TimePoint tp = TimePoint(std::chrono::seconds(1714558830) + std::chrono::milliseconds(123));
    EXPECT_EQ(Timestamps::Format(tp), "2024-05-01T10:20:30.123Z");
    EXPECT_EQ(Timestamps::Format(TimePoint{}), "1970-01-01T00:00:00.000Z");
}

TEST(Timestamps, ParseAcceptsOffsetsAndMissingFraction)
{
    auto z = Timestamps::Parse("2024-05-01T10:20:30.123Z");
    ASSERT_TRUE(z);
    EXPECT_EQ(Timestamps::Format(*z), "2024-05-01T10:20:30.123Z");

    auto plus = Timestamps::Parse("2024-05-01T12:20:30.123+02:00");
    ASSERT_TRUE(plus);
    EXPECT_EQ(*plus, *z);

    auto whole = Timestamps::Parse("2024-05-01T10:20:30Z");
    ASSERT_TRUE(whole);
    EXPECT_EQ(Timestamps::Format(*whole), "2024-05-01T10:20:30.000Z");

    // extra precision is truncated to milliseconds
    auto micro = Timestamps::Parse("2024-05-01T10:20:30.123456Z");
    ASSERT_TRUE(micro);
    EXPECT_EQ(*micro, *z);
}

TEST(Timestamps, ParseRejectsGarbage)
{
    EXPECT_FALSE(Timestamps::Parse(""));
    EXPECT_FALSE(Timestamps::Parse("yesterday"));
    EXPECT_FALSE(Timestamps::Parse("2024-05-01T10:20:30"));
    EXPECT_FALSE(Timestamps::Parse("2024-05-01T10:20:30.Z"));
    EXPECT_FALSE(Timestamps::Parse("2024-05-01T10:20:30Zjunk"));
}

TEST(StateStore, MissingFileGivesDefaults)
{
    TempDir    dir;
    StateStore store(dir / "state");

    const PersistedState st = store.Load();
    EXPECT_EQ(st, PersistedState{});
    EXPECT_FALSE(st.vpn_connected);
    EXPECT_EQ(st.version, "1.0.0");
}

TEST(StateStore, SaveLoadPreservesEveryField)
{
    TempDir    dir;
    StateStore store(dir / "state");

    PersistedState st;
    st.vpn_connected   = true;
    st.routes_active   = true;
    st.active_services = { { "telegram", true }, { "youtube", false } };
    st.last_gateway    = "192.168.1.1";
    st.last_check      = Timestamps::NowMs();
    st.start_time      = st.last_check - std::chrono::minutes(42);

    store.Save(st);
    EXPECT_EQ(store.Load(), st);
    EXPECT_FALSE(std::filesystem::exists(store.StatePath() + ".tmp"));
}

TEST(StateStore, FileUsesDocumentedKeys)
{
    TempDir    dir;
    StateStore store(dir.Path().string());

    PersistedState st;
    st.last_gateway = "192.168.1.1";
    store.Save(st);

    const std::string text = dir.ReadFile("state.json");
    for (const char *key : { "\"vpn_connected\"", "\"routes_active\"", "\"active_services\"",
                             "\"last_check\"", "\"start_time\"", "\"last_gateway\"", "\"version\"" })
    {
        EXPECT_NE(text.find(key), std::string::npos) << key;
    }
}

TEST(StateStore, MalformedFileThrows)
{
    TempDir    dir;
    StateStore store(dir.Path().string());

    dir.WriteFile("state.json", "{ not json");
    EXPECT_THROW(store.Load(), PersistenceError);

    dir.WriteFile("state.json", "{\"vpn_connected\": \"yes\"}");
    EXPECT_THROW(store.Load(), PersistenceError);

    dir.WriteFile("state.json", "{\"last_check\": \"tuesday\"}");
    EXPECT_THROW(store.Load(), PersistenceError);
}

TEST(StateStore, PartialFileKeepsDefaults)
{
    TempDir    dir;
    StateStore store(dir.Path().string());

    dir.WriteFile("state.json", "{\"vpn_connected\": true}");
    const PersistedState st = store.Load();
    EXPECT_TRUE(st.vpn_connected);
    EXPECT_FALSE(st.routes_active);
    EXPECT_TRUE(st.active_services.empty());
}

TEST(StateStore, PidFileLifecycle)
{
    TempDir    dir;
    StateStore store(dir / "state");

    EXPECT_FALSE(store.ReadPid());
    EXPECT_FALSE(store.IsDaemonRunning());

    store.WritePid(::getpid());
    ASSERT_TRUE(store.ReadPid());
    EXPECT_EQ(*store.ReadPid(), ::getpid());
    EXPECT_TRUE(store.IsDaemonRunning());

    store.RemovePid();
    EXPECT_FALSE(store.ReadPid());
    EXPECT_FALSE(store.IsDaemonRunning());
    EXPECT_NO_THROW(store.RemovePid());
}

TEST(StateStore, GarbagePidFileIsIgnored)
{
    TempDir    dir;
    StateStore store(dir.Path().string());

    dir.WriteFile("daemon.pid", "not-a-pid");
    EXPECT_FALSE(store.ReadPid());
    EXPECT_FALSE(store.IsDaemonRunning());
}
