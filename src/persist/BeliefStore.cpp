//
// Created by Malik T on 05/10/2025.
//
#include "BeliefStore.hpp"

#include <charconv>
#include <cmath>
#include <format>
#include <fstream>
#include <string_view>
#include <system_error>
#include "../core/Exception.hpp"

namespace bomb::core::persist
{
    using nlohmann::json;

    namespace
    {
        auto Malformed(std::string msg) -> void
        {
            BMB_THROW(error::Code::Serialization, std::move(msg));
        }

        template <typename T>
        auto ParseNumber(std::string_view s) -> std::optional<T>
        {
            T out{};
            auto const [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
            if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
            return out;
        }

        auto ValueToJson(WireValue v) -> json
        {
            if (std::floor(v) == v && std::abs(v) < 1e15)
                return json(static_cast<int64_t>(v));
            return json(v);
        }

        auto PlayerKey(PlyrIdxT p, NameTable const& names) -> std::string
        {
            auto const it = names.find(p);
            return it == names.end() ? std::format("{}", p) : std::format("{}_{}", p, it->second);
        }

        auto PlayerRef(PlyrIdxT p, NameTable const& names) -> json
        {
            auto const it = names.find(p);
            return it == names.end() ? json(static_cast<int>(p)) : json(it->second);
        }

        auto CheckPlayer(long long id, PlyrIdxT n, std::string_view what) -> PlyrIdxT
        {
            if (id < 0 || id >= n)
                Malformed(std::format("{}: player {} out of range", what, id));
            return static_cast<PlyrIdxT>(id);
        }

        // "2", "2_Alice" or a bare name known to the table
        auto ResolveKey(std::string_view key, NameTable const& names, PlyrIdxT n) -> PlyrIdxT
        {
            for (auto const& [id, name] : names)
                if (name == key) return id;
            if (auto const id = ParseNumber<long long>(key)) return CheckPlayer(*id, n, key);
            if (auto const cut = key.find('_'); cut != std::string_view::npos)
            {
                if (auto const id = ParseNumber<long long>(key.substr(0, cut))) return CheckPlayer(*id, n, key);
            }
            Malformed(std::format("unknown player '{}'", key));
            return 0;
        }

        auto ResolvePlayer(json const& j, NameTable const& names, PlyrIdxT n) -> PlyrIdxT
        {
            if (j.is_number_integer()) return CheckPlayer(j.get<long long>(), n, "tracker entry");
            if (j.is_string()) return ResolveKey(j.get<std::string>(), names, n);
            Malformed(std::format("player reference must be an id or a name, got {}", j.dump()));
            return 0;
        }

        auto ResolveValue(ValueDomain const& dom, WireValue v) -> ValueIdxT
        {
            auto const idx = dom.IndexOf(v);
            if (!idx) Malformed(std::format("value {} is not in the distribution", v));
            return *idx;
        }

        auto ReadNames(json const& belief) -> NameTable
        {
            NameTable out;
            if (!belief.contains("player_names")) return out;
            for (auto const& it : belief.at("player_names").items())
            {
                auto const id = ParseNumber<unsigned>(it.key());
                if (!id || *id > 255) Malformed(std::format("bad player_names key '{}'", it.key()));
                out.emplace(static_cast<PlyrIdxT>(*id), it.value().get<std::string>());
            }
            return out;
        }

        auto ParseSlots(json const& arr, NameTable const& names, PlyrIdxT n, SlotIdxT hand) -> std::vector<SlotRef>
        {
            std::vector<SlotRef> out;
            for (json const& e : arr)
            {
                if (!e.is_array() || e.size() != 2) Malformed(std::format("bad slot entry {}", e.dump()));
                PlyrIdxT const p = ResolvePlayer(e[0], names, n);
                auto const s = e[1].get<long long>();
                if (s < 0 || s >= hand) Malformed(std::format("slot {} out of range", s));
                out.push_back({p, static_cast<SlotIdxT>(s)});
            }
            return out;
        }

        auto ReadFile(std::filesystem::path const& file) -> json
        {
            if (!std::filesystem::exists(file))
                BMB_THROW(error::Code::Persistence, std::format("missing file {}", file.string()));
            std::ifstream in(file);
            if (!in)
                BMB_THROW(error::Code::Persistence, std::format("cannot open {}", file.string()));
            try
            {
                return json::parse(in);
            }
            catch (json::exception const& e)
            {
                Malformed(std::format("{}: {}", file.string(), e.what()));
            }
            return {};
        }

        auto WriteFile(std::filesystem::path const& file, json const& j) -> void
        {
            std::ofstream out(file, std::ios::trunc);
            if (!out)
                BMB_THROW(error::Code::Persistence, std::format("cannot open {} for writing", file.string()));
            out << j.dump(2) << '\n';
            if (!out)
                BMB_THROW(error::Code::Persistence, std::format("failed writing {}", file.string()));
        }

        auto PlayerDir(std::filesystem::path const& base, PlyrIdxT p) -> std::filesystem::path
        {
            return base / std::format("player_{}", p);
        }
    }

    auto ToJson(BeliefState const& state, NameTable const& names) -> StoredFiles
    {
        ValueDomain const& dom = state.Domain();
        StoredFiles out;

        json beliefs = json::object();
        for (PlyrIdxT p{}; p < state.PlayerCount(); ++p)
        {
            json slots = json::object();
            for (SlotIdxT s{}; s < state.HandSize(); ++s)
            {
                json vals = json::array();
                for (ValueIdxT const v : state.Candidates(p, s)) vals.push_back(ValueToJson(dom.ValueAt(v)));
                slots[std::format("{}", s)] = std::move(vals);
            }
            beliefs[PlayerKey(p, names)] = std::move(slots);
        }
        out.belief["my_player_id"] = state.Owner();
        out.belief["consistent"] = state.IsConsistent();
        out.belief["beliefs"] = std::move(beliefs);

        if (!names.empty())
        {
            json table = json::object();
            for (auto const& [id, name] : names) table[std::format("{}", id)] = name;
            out.belief["player_names"] = std::move(table);
        }

        SlotConstraints const& cons = state.Constraints();
        if (!cons.Empty())
        {
            json cc = json::array();
            for (CopyCountConstraint const& c : cons.copy_counts)
                cc.push_back({{"player", c.player}, {"slot", c.slot}, {"count", c.count}});
            json adj = json::array();
            for (AdjacentConstraint const& c : cons.adjacent)
                adj.push_back({{"player", c.player}, {"low", c.low}, {"is_equal", c.is_equal}});
            out.belief["constraints"] = {{"copy_count", std::move(cc)}, {"adjacent", std::move(adj)}};
        }

        out.trackers = json::object();
        for (ValueTracker const& t : state.Trackers())
        {
            json rev = json::array();
            for (SlotRef const r : t.Revealed()) rev.push_back(json::array({PlayerRef(r.player, names), r.slot}));
            json cert = json::array();
            for (SlotRef const r : t.Certain()) cert.push_back(json::array({PlayerRef(r.player, names), r.slot}));
            json called = json::array();
            for (PlyrIdxT const p : t.Called()) called.push_back(PlayerRef(p, names));

            out.trackers[dom.Format(t.Value())] = {
                {"revealed", std::move(rev)},
                {"certain", std::move(cert)},
                {"called", std::move(called)},
                {"uncertain", std::format("{}/{}", t.Uncertain(), t.Total())},
            };
        }
        return out;
    }

    auto FromJson(StoredFiles const& files,
                  Config const& config,
                  std::optional<NameTable> names,
                  std::shared_ptr<GlobalSolver> solver) -> BeliefState
    {
        ValueDomain const dom(config);
        PlyrIdxT const n = dom.NPlayers();
        SlotIdxT const hand = dom.HandSize();

        BeliefGrid grid(n, Hand(hand, ValueSet{}));
        std::vector<ValueTracker> trackers;
        SlotConstraints cons;
        PlyrIdxT me{};
        bool contradicted = false;

        try
        {
            json const& belief = files.belief;
            if (!belief.is_object() || !belief.contains("my_player_id") || !belief.contains("beliefs"))
                Malformed("belief.json needs my_player_id and beliefs");
            me = CheckPlayer(belief.at("my_player_id").get<long long>(), n, "my_player_id");
            NameTable const table = names ? *names : ReadNames(belief);
            contradicted = !belief.value("consistent", true);

            std::vector<std::vector<bool>> seen(n, std::vector<bool>(hand, false));
            for (auto const& pit : belief.at("beliefs").items())
            {
                PlyrIdxT const p = ResolveKey(pit.key(), table, n);
                for (auto const& sit : pit.value().items())
                {
                    auto const s = ParseNumber<unsigned>(sit.key());
                    if (!s || *s >= hand) Malformed(std::format("bad position key '{}' for P{}", sit.key(), p));
                    ValueSet set;
                    for (json const& v : sit.value()) set.Insert(ResolveValue(dom, v.get<WireValue>()));
                    grid[p][*s] = set;
                    seen[p][*s] = true;
                }
            }
            for (PlyrIdxT p{}; p < n; ++p)
            {
                for (SlotIdxT s{}; s < hand; ++s)
                {
                    if (!seen[p][s]) Malformed(std::format("beliefs miss P{}[{}]", p, s));
                }
            }

            if (belief.contains("constraints"))
            {
                json const& jc = belief.at("constraints");
                for (json const& c : jc.value("copy_count", json::array()))
                {
                    cons.copy_counts.push_back({CheckPlayer(c.at("player").get<long long>(), n, "copy_count"),
                                                c.at("slot").get<SlotIdxT>(), c.at("count").get<uint8_t>()});
                }
                for (json const& c : jc.value("adjacent", json::array()))
                {
                    cons.adjacent.push_back({CheckPlayer(c.at("player").get<long long>(), n, "adjacent"),
                                             c.at("low").get<SlotIdxT>(), c.at("is_equal").get<bool>()});
                }
            }

            trackers.reserve(dom.Size());
            for (size_t v{}; v < dom.Size(); ++v)
                trackers.emplace_back(static_cast<ValueIdxT>(v), dom.Copies(static_cast<ValueIdxT>(v)));

            for (auto const& vit : files.trackers.items())
            {
                auto const raw = ParseNumber<double>(vit.key());
                if (!raw) Malformed(std::format("bad value key '{}'", vit.key()));
                ValueIdxT const v = ResolveValue(dom, *raw);
                json const& jt = vit.value();

                std::vector<PlyrIdxT> called;
                for (json const& c : jt.value("called", json::array())) called.push_back(ResolvePlayer(c, table, n));
                bool const ok = trackers[v].Replace(ParseSlots(jt.value("revealed", json::array()), table, n, hand),
                                                    ParseSlots(jt.value("certain", json::array()), table, n, hand),
                                                    std::move(called));
                if (!ok) Malformed(std::format("tracker for {} is inconsistent", vit.key()));
            }
        }
        catch (json::exception const& e)
        {
            Malformed(std::format("malformed belief files: {}", e.what()));
        }

        return BeliefState::Restore(config, me, std::move(grid), std::move(trackers), std::move(cons), contradicted,
                                    std::move(solver));
    }

    auto SaveToFolder(BeliefState const& state, std::filesystem::path const& base, NameTable const& names)
        -> std::filesystem::path
    {
        std::filesystem::path const dir = PlayerDir(base, state.Owner());
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec)
            BMB_THROW(error::Code::Persistence, std::format("cannot create {}: {}", dir.string(), ec.message()));

        StoredFiles const files = ToJson(state, names);
        WriteFile(dir / "belief.json", files.belief);
        WriteFile(dir / "value_tracker.json", files.trackers);
        return dir;
    }

    auto LoadFromFolder(std::filesystem::path const& base,
                        PlyrIdxT player,
                        Config const& config,
                        std::optional<NameTable> names,
                        std::shared_ptr<GlobalSolver> solver) -> BeliefState
    {
        std::filesystem::path const dir = PlayerDir(base, player);
        StoredFiles files{ReadFile(dir / "belief.json"), ReadFile(dir / "value_tracker.json")};
        BeliefState state = FromJson(files, config, std::move(names), std::move(solver));
        if (state.Owner() != player)
            Malformed(std::format("{} belongs to P{}, not P{}", dir.string(), state.Owner(), player));
        return state;
    }

    auto LoadNames(std::filesystem::path const& base, PlyrIdxT player) -> NameTable
    {
        try
        {
            return ReadNames(ReadFile(PlayerDir(base, player) / "belief.json"));
        }
        catch (json::exception const& e)
        {
            Malformed(std::format("bad player_names: {}", e.what()));
        }
        return {};
    }
}
