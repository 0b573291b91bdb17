//
// Created by Malik T on 06/10/2025.
//

//
// BombBusterMain.cpp - offline deduction assistant
//

#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <format>
#include <fstream>
#include <memory>
#include <optional>
#include <print>
#include <string>
#include <string_view>
#include <vector>

#include "core/BeliefState.hpp"
#include "core/EntropySuggester.hpp"
#include "core/Exception.hpp"
#include "core/GlobalSolver.hpp"
#include "core/Statistics.hpp"
#include "core/TaskPool.hpp"
#include "debug/AuditLogger.hpp"
#include "net/codec.hpp"
#include "persist/BeliefStore.hpp"

using namespace bomb::core;

namespace
{
    struct CmdLine
    {
        std::string command;
        Config cfg{};
        std::filesystem::path state_dir{"bombbuster_state"};
        std::optional<std::uint32_t> me;
        std::vector<WireValue> hand;
        persist::NameTable names;
        std::filesystem::path actions;
        std::string audit;
        bool sequential{false};
        std::uint32_t top{10};
    };

    auto Usage() -> void
    {
        std::print(stderr,
                   "usage: bombbuster_cli <init|apply|advise> [options]\n"
                   "  --state DIR          state folder (default bombbuster_state)\n"
                   "  --me N               owning player\n"
                   "  --hand v,v,...       own sorted hand (init)\n"
                   "  --actions FILE       length-prefixed ActionMsg frames (apply)\n"
                   "  --players N          player count\n"
                   "  --distribution v:c,...\n"
                   "  --names a,b,...      player names by id\n"
                   "  --irl                informal play, own possession unchecked\n"
                   "  --no-global          local filters only\n"
                   "  --timeout-ms N       global solver budget\n"
                   "  --threads N          worker threads (0 = hardware)\n"
                   "  --max-uncertainty N  entropy search cutoff\n"
                   "  --sequential         evaluate suggestions on this thread\n"
                   "  --top N              double-chance rows to print\n"
                   "  --audit FILE         write an audit transcript\n"
                   "  --verbose\n");
    }

    template <typename T>
    auto ParseNumber(std::string_view s, std::string_view what) -> T
    {
        T out{};
        auto const res = std::from_chars(s.data(), s.data() + s.size(), out);
        if (res.ec != std::errc{} || res.ptr != s.data() + s.size())
            BMB_THROW(error::Code::Config, std::format("bad {} '{}'", what, s));
        return out;
    }

    auto Split(std::string_view s, char sep) -> std::vector<std::string_view>
    {
        std::vector<std::string_view> out;
        while (!s.empty())
        {
            auto const cut = s.find(sep);
            out.push_back(s.substr(0, cut));
            if (cut == std::string_view::npos) break;
            s.remove_prefix(cut + 1);
        }
        return out;
    }

    auto ParseArgs(int argc, char** argv) -> CmdLine
    {
        CmdLine c{};
        if (argc < 2)
            BMB_THROW(error::Code::Config, "missing command");
        c.command = argv[1];

        for (int i = 2; i < argc; ++i)
        {
            std::string_view const arg = argv[i];

            auto next = [&]() -> std::string_view
            {
                if (i + 1 >= argc)
                    BMB_THROW(error::Code::Config, std::format("{} needs a value", arg));
                return argv[++i];
            };

            if (arg == "--state") c.state_dir = next();
            else if (arg == "--me") c.me = ParseNumber<std::uint32_t>(next(), "player");
            else if (arg == "--hand")
            {
                for (std::string_view v : Split(next(), ','))
                    c.hand.push_back(ParseNumber<WireValue>(v, "wire value"));
            }
            else if (arg == "--actions") c.actions = next();
            else if (arg == "--players") c.cfg.n_players = ParseNumber<std::uint32_t>(next(), "player count");
            else if (arg == "--distribution")
            {
                c.cfg.distribution.clear();
                for (std::string_view item : Split(next(), ','))
                {
                    std::vector<std::string_view> const kv = Split(item, ':');
                    if (kv.size() != 2)
                        BMB_THROW(error::Code::Config, std::format("bad distribution entry '{}'", item));
                    c.cfg.distribution.push_back({ParseNumber<WireValue>(kv[0], "wire value"),
                                                  ParseNumber<std::uint8_t>(kv[1], "copy count")});
                }
            }
            else if (arg == "--names")
            {
                PlyrIdxT id{};
                for (std::string_view n : Split(next(), ','))
                    c.names.emplace(id++, std::string(n));
            }
            else if (arg == "--irl") c.cfg.playing_irl = true;
            else if (arg == "--no-global") c.cfg.use_global_solver = false;
            else if (arg == "--timeout-ms")
                c.cfg.solver_timeout = std::chrono::milliseconds(ParseNumber<std::uint64_t>(next(), "timeout"));
            else if (arg == "--threads") c.cfg.worker_threads = ParseNumber<std::uint32_t>(next(), "thread count");
            else if (arg == "--max-uncertainty")
                c.cfg.max_uncertainty = ParseNumber<std::uint8_t>(next(), "uncertainty cutoff");
            else if (arg == "--sequential") c.sequential = true;
            else if (arg == "--top") c.top = ParseNumber<std::uint32_t>(next(), "row count");
            else if (arg == "--audit") c.audit = next();
            else if (arg == "--verbose") c.cfg.verbose = true;
            else
                BMB_THROW(error::Code::Config, std::format("unknown option '{}'", arg));
        }
        if (!c.me)
            BMB_THROW(error::Code::Config, "--me is required");
        if (*c.me > 255)
            BMB_THROW(error::Code::Config, "--me out of range");
        return c;
    }

    auto Owner(CmdLine const& c) -> PlyrIdxT { return static_cast<PlyrIdxT>(*c.me); }

    auto Names(CmdLine const& c) -> persist::NameTable
    {
        return c.names.empty() ? persist::LoadNames(c.state_dir, Owner(c)) : c.names;
    }

    auto Label(persist::NameTable const& names, PlyrIdxT p) -> std::string
    {
        auto const it = names.find(p);
        return it == names.end() ? std::format("P{}", p) : std::format("{}(P{})", it->second, p);
    }

    auto PrintGrid(BeliefState const& b, persist::NameTable const& names) -> void
    {
        for (PlyrIdxT p{}; p < b.PlayerCount(); ++p)
        {
            std::string row;
            for (SlotIdxT s{}; s < b.HandSize(); ++s)
                row += std::format("{}{}", (s ? " " : ""), b.Domain().Format(b.Candidates(p, s)));
            std::print("{:>12}: {}\n", Label(names, p), row);
        }
    }

    auto RunInit(CmdLine const& c, std::shared_ptr<GlobalSolver> const& solver) -> int
    {
        BeliefState b(c.cfg, Owner(c), c.hand, solver);
        std::filesystem::path const dir = persist::SaveToFolder(b, c.state_dir, c.names);
        std::print("[bombbuster] initialised P{} in {}\n", Owner(c), dir.string());
        PrintGrid(b, c.names);
        return 0;
    }

    auto RunApply(CmdLine const& c, std::shared_ptr<GlobalSolver> const& solver) -> int
    {
        persist::NameTable const names = Names(c);
        BeliefState b = persist::LoadFromFolder(c.state_dir, Owner(c), c.cfg, names, solver);

        std::ifstream in(c.actions, std::ios::binary);
        if (!in)
            BMB_THROW(error::Code::Persistence, std::format("cannot open {}", c.actions.string()));
        auto frames = net::ReadFrames(in);
        if (!frames)
            BMB_THROW(error::Code::Serialization, frames.error().message);

        std::optional<debug::AuditLogger> audit;
        if (!c.audit.empty())
        {
            audit.emplace(c.audit);
            audit->start(b, 0);
        }

        int rejected = 0;
        for (net::Frame const& f : *frames)
        {
            auto decoded = net::DecodeAction(f);
            if (!decoded)
            {
                std::print("[bombbuster] skipping undecodable frame: {}\n", decoded.error().message);
                ++rejected;
                continue;
            }
            error::ValidateResult const res = b.Process(decoded->record);
            if (audit) audit->action(decoded->record, res);
            if (res)
                std::print("[turn {}] applied  {}\n", decoded->turn, debug::DescribeRecord(decoded->record));
            else
            {
                std::print("[turn {}] rejected {}: {}\n", decoded->turn, debug::DescribeRecord(decoded->record),
                           error::describe(res.error()));
                ++rejected;
            }
        }
        if (audit)
        {
            audit->grid(b);
            audit->trackers(b);
            audit->end(b);
        }

        persist::SaveToFolder(b, c.state_dir, names);
        std::print("[bombbuster] {} frame(s), {} rejected, consistent={}\n",
                   frames->size(), rejected, b.IsConsistent());
        return b.IsConsistent() ? 0 : 2;
    }

    auto RunAdvise(CmdLine const& c, std::shared_ptr<GlobalSolver> const& solver,
                   std::shared_ptr<TaskPool> const& pool) -> int
    {
        persist::NameTable const names = Names(c);
        BeliefState const b = persist::LoadFromFolder(c.state_dir, Owner(c), c.cfg, names, solver);
        ValueDomain const& dom = b.Domain();

        std::print("== beliefs ({}) ==\n", b.IsConsistent() ? "consistent" : "CONTRADICTION");
        PrintGrid(b, names);

        stats::SystemStats const st = stats::SystemStatistics(b);
        std::print("\n== statistics ==\nentropy {:.2f} bits | {}/{} certain ({:.1f}%) | {} fully deduced\n",
                   st.total_entropy, st.certain_positions, st.total_positions, st.progress_percent,
                   st.fully_deduced_players);
        for (PlyrIdxT p{}; p < st.players.size(); ++p)
        {
            stats::PlayerStats const& ps = st.players[p];
            std::print("{:>12}: entropy {:.2f} ({:.0f}%) avg {:.2f} progress {:.0f}%\n", Label(names, p),
                       ps.entropy, 100.0 * ps.entropy_normalized, ps.avg_possibilities, ps.progress_percent);
        }

        stats::CallSuggestions const calls = stats::AllCallSuggestions(b);
        std::print("\n== certain calls ==\n");
        for (stats::CallOption const& o : calls.certain)
            std::print("  {}[{}] = {}\n", Label(names, o.target), o.slot, dom.Format(o.value));
        std::print("== uncertain calls ==\n");
        for (stats::CallOption const& o : calls.uncertain)
            std::print("  {}[{}] = {}  p={:.2f}\n", Label(names, o.target), o.slot, dom.Format(o.value), o.probability);

        EntropySuggester const suggester(pool);
        Suggestion const sug = suggester.SuggestBestCall(b, SuggestOptions{
            .max_uncertainty = c.cfg.max_uncertainty,
            .parallel = !c.sequential,
            .progress = {},
        });
        std::print("\n== entropy suggestion ({} candidates, {} ms) ==\n", sug.analyzed, sug.elapsed.count());
        if (sug.best)
            std::print("  call {}[{}] = {}  gain {:.3f} bits (H {:.2f} -> {:.2f})\n", Label(names, sug.best->target),
                       sug.best->slot, dom.Format(sug.best->value), sug.information_gain, sug.current_entropy,
                       sug.expected_entropy);
        else
            std::print("  none\n");

        std::vector<stats::DoubleChanceOption> const dc = stats::DoubleChanceSuggestions(b, c.cfg.double_chance_max_hands);
        std::print("\n== double chance ==\n");
        for (size_t i{}; i < dc.size() && i < c.top; ++i)
        {
            stats::DoubleChanceOption const& o = dc[i];
            std::print("  {}[{},{}] = {}  p={:.3f}{}{}\n", Label(names, o.target), o.slot1, o.slot2,
                       dom.Format(o.value), o.probability, o.is_certain ? " certain" : "",
                       o.approximate ? " (approx)" : "");
        }
        return 0;
    }
} // anon

int main(int argc, char** argv)
{
    try
    {
        CmdLine const cmd = ParseArgs(argc, argv);

        std::shared_ptr<TaskPool> const pool = std::make_shared<TaskPool>(cmd.cfg.worker_threads);
        std::shared_ptr<GlobalSolver> const solver = std::make_shared<GlobalSolver>(pool);

        if (cmd.command == "init") return RunInit(cmd, solver);
        if (cmd.command == "apply") return RunApply(cmd, solver);
        if (cmd.command == "advise") return RunAdvise(cmd, solver, pool);

        std::print(stderr, "unknown command '{}'\n", cmd.command);
        Usage();
        return 1;
    }
    catch (OmegaException<error::Code> const& e)
    {
        std::print(stderr, "{}", e);
        if (e.data() == error::Code::Config) Usage();
        return 1;
    }
    catch (std::exception const& e)
    {
        std::print(stderr, "[bombbuster] fatal: {}\n", e.what());
        return 1;
    }
}
