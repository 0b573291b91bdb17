//
// Created by Malik T on 10/10/2025.
//

#include <gtest/gtest.h>
#include <filesystem>
#include <format>
#include <fstream>
#include <string>
#include <vector>

#include "../core/BeliefState.hpp"
#include "../core/Exception.hpp"
#include "../persist/BeliefStore.hpp"

using namespace bomb::core;
namespace fs = std::filesystem;

namespace
{
    auto MakeConfig() -> Config
    {
        Config cfg{};
        cfg.distribution = {{1, 3}, {2, 3}, {2.5, 1}, {3, 3}, {4, 2}};
        cfg.n_players = 3;
        cfg.use_global_solver = false;
        return cfg;
    }

    // a state with every kind of tracker entry and both constraint kinds
    auto MakeState(Config const& cfg) -> BeliefState
    {
        std::vector<WireValue> const hand{1, 2, 2.5, 4};
        BeliefState b(cfg, 1, hand);
        EXPECT_TRUE(b.ProcessCall({.caller = 1, .target = 0, .position = 1, .value = 2, .success = true,
                                   .caller_position = 1}));
        EXPECT_TRUE(b.ProcessCall({.caller = 2, .target = 0, .position = 3, .value = 3, .success = false}));
        EXPECT_TRUE(b.ProcessCopyCountSignal({.player = 2, .position = 0, .copy_count = 1}));
        EXPECT_TRUE(b.ProcessAdjacentSignal({.player = 0, .position1 = 2, .position2 = 3, .is_equal = false}));
        return b;
    }

    auto Scratch(std::string const& name) -> fs::path
    {
        fs::path const dir = fs::path("_artifacts") / name;
        fs::remove_all(dir);
        fs::create_directories(dir);
        return dir;
    }

    auto ExpectSameState(BeliefState const& a, BeliefState const& b) -> void
    {
        EXPECT_EQ(a.Owner(), b.Owner());
        EXPECT_EQ(a.Grid(), b.Grid());
        EXPECT_EQ(a.Constraints().copy_counts, b.Constraints().copy_counts);
        EXPECT_EQ(a.Constraints().adjacent, b.Constraints().adjacent);
        ASSERT_EQ(a.Trackers().size(), b.Trackers().size());
        for (size_t v{}; v < a.Trackers().size(); ++v)
        {
            ValueTracker const& x = a.Trackers()[v];
            ValueTracker const& y = b.Trackers()[v];
            EXPECT_EQ(x.Revealed(), y.Revealed()) << "value rank " << v;
            EXPECT_EQ(x.Certain(), y.Certain()) << "value rank " << v;
            EXPECT_EQ(x.Called(), y.Called()) << "value rank " << v;
            EXPECT_EQ(x.Uncertain(), y.Uncertain()) << "value rank " << v;
        }
    }
} // anonymous namespace

TEST(Persistence, Json_Keeps_Fractional_Values)
{
    Config const cfg = MakeConfig();
    BeliefState const b = MakeState(cfg);
    persist::StoredFiles const files = persist::ToJson(b);

    EXPECT_EQ(files.belief.at("my_player_id").get<int>(), 1);
    EXPECT_TRUE(files.belief.contains("constraints"));
    EXPECT_FALSE(files.belief.contains("player_names"));
    ASSERT_TRUE(files.trackers.contains("2.5"));
    EXPECT_EQ(files.trackers.at("2.5").at("uncertain").get<std::string>(), "0/1");

    ExpectSameState(b, persist::FromJson(files, cfg));
}

TEST(Persistence, Folder_Round_Trip_With_Names)
{
    Config const cfg = MakeConfig();
    BeliefState const b = MakeState(cfg);
    persist::NameTable const names{{0, "Alice"}, {1, "Bob"}, {2, "Cleo"}};

    fs::path const base = Scratch("persist_names");
    fs::path const dir = persist::SaveToFolder(b, base, names);
    EXPECT_EQ(dir, base / "player_1");
    EXPECT_TRUE(fs::exists(dir / "belief.json"));
    EXPECT_TRUE(fs::exists(dir / "value_tracker.json"));

    EXPECT_EQ(persist::LoadNames(base, 1), names);

    // names from the file
    ExpectSameState(b, persist::LoadFromFolder(base, 1, cfg));
    // names from the caller
    ExpectSameState(b, persist::LoadFromFolder(base, 1, cfg, names));
}

TEST(Persistence, Restored_State_Keeps_Deducing)
{
    Config const cfg = MakeConfig();
    BeliefState live = MakeState(cfg);
    fs::path const base = Scratch("persist_resume");
    (void)persist::SaveToFolder(live, base);
    BeliefState loaded = persist::LoadFromFolder(base, 1, cfg);
    EXPECT_TRUE(persist::LoadNames(base, 1).empty());

    SignalRecord const sig{.player = 2, .value = 3, .position = 3};
    ASSERT_TRUE(live.ProcessSignal(sig));
    ASSERT_TRUE(loaded.ProcessSignal(sig));
    ExpectSameState(live, loaded);
    EXPECT_EQ(live.IsConsistent(), loaded.IsConsistent());
}

TEST(Persistence, Informal_Swap_Leaves_Own_Slot_Open)
{
    Config cfg = MakeConfig();
    cfg.playing_irl = true;
    std::vector<WireValue> const hand{1, 2, 2.5, 4};
    BeliefState live(cfg, 1, hand);

    // the owner hands its 2 to P0 without naming the wire it took back
    ASSERT_TRUE(live.ProcessSwap({.player1 = 1, .player2 = 0, .init_pos1 = 1, .init_pos2 = 0,
                                  .final_pos1 = 1, .final_pos2 = 0}));
    ASSERT_TRUE(live.IsConsistent());
    ASSERT_FALSE(live.OwnWire(1).has_value());
    ASSERT_FALSE(live.Candidates(1, 1).IsSingle());

    fs::path const base = Scratch("persist_informal");
    (void)persist::SaveToFolder(live, base);
    BeliefState loaded = persist::LoadFromFolder(base, 1, cfg);
    ExpectSameState(live, loaded);
    EXPECT_TRUE(loaded.IsConsistent());
    for (SlotIdxT s{}; s < live.HandSize(); ++s)
        EXPECT_EQ(live.OwnWire(s), loaded.OwnWire(s)) << "slot " << static_cast<int>(s);

    // a later signal settles the open slot the same way on both
    SignalRecord const sig{.player = 1, .value = 2, .position = 1};
    ASSERT_TRUE(live.ProcessSignal(sig));
    ASSERT_TRUE(loaded.ProcessSignal(sig));
    ExpectSameState(live, loaded);
    EXPECT_EQ(loaded.OwnWire(1), live.Domain().IndexOf(2));
    EXPECT_EQ(live.OwnWire(1), loaded.OwnWire(1));
}

TEST(Persistence, Contradiction_Survives_Reload)
{
    Config const cfg = MakeConfig();
    BeliefState b = MakeState(cfg);
    ASSERT_TRUE(b.ProcessCopyCountSignal({.player = 2, .position = 0, .copy_count = 2}));
    ASSERT_FALSE(b.IsConsistent());

    persist::StoredFiles const files = persist::ToJson(b);
    EXPECT_FALSE(files.belief.at("consistent").get<bool>());

    fs::path const base = Scratch("persist_contradiction");
    (void)persist::SaveToFolder(b, base);
    BeliefState const loaded = persist::LoadFromFolder(base, 1, cfg);
    ExpectSameState(b, loaded);
    EXPECT_FALSE(loaded.IsConsistent());

    // files written before the flag existed load as consistent
    persist::StoredFiles older = persist::ToJson(MakeState(cfg));
    older.belief.erase("consistent");
    EXPECT_TRUE(persist::FromJson(older, cfg).IsConsistent());
}

TEST(Persistence, Missing_Folder_Throws)
{
    fs::path const base = Scratch("persist_missing");
    EXPECT_THROW((void)persist::LoadFromFolder(base, 0, MakeConfig()), error::PersistenceError);
    EXPECT_THROW((void)persist::LoadNames(base, 0), error::PersistenceError);

    try
    {
        (void)persist::LoadFromFolder(base, 0, MakeConfig());
        FAIL() << "loading an empty folder succeeded";
    }
    catch (error::PersistenceError const& e)
    {
        EXPECT_TRUE(e.headline().starts_with("belief store I/O error: ")) << e.headline();
        std::string const report = std::format("{}", static_cast<OmegaException<error::Code> const&>(e));
        EXPECT_TRUE(report.starts_with("[bombbuster] belief store I/O error: ")) << report;
        EXPECT_NE(report.find("thrown in"), std::string::npos) << report;
    }
}

TEST(Persistence, Malformed_Content_Throws)
{
    Config const cfg = MakeConfig();
    fs::path const base = Scratch("persist_bad");
    fs::path const dir = persist::SaveToFolder(MakeState(cfg), base);

    {
        std::ofstream out(dir / "value_tracker.json", std::ios::trunc);
        out << "{ \"1\": [ not json";
    }
    EXPECT_THROW((void)persist::LoadFromFolder(base, 1, cfg), error::SerializationError);

    persist::StoredFiles files = persist::ToJson(MakeState(cfg));
    files.belief["beliefs"]["0"]["0"] = nlohmann::json::array({7});
    EXPECT_THROW((void)persist::FromJson(files, cfg), error::SerializationError);

    files = persist::ToJson(MakeState(cfg));
    files.belief.erase("my_player_id");
    EXPECT_THROW((void)persist::FromJson(files, cfg), error::SerializationError);

    // nothing was saved for P0
    EXPECT_THROW((void)persist::LoadFromFolder(base, 0, cfg), error::PersistenceError);
}
