//
// Created by Malik T on 05/10/2025.
//

#ifndef BOMBBUSTER_BELIEFSTORE_HPP
#define BOMBBUSTER_BELIEFSTORE_HPP

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "../core/BeliefState.hpp"
#include "../core/GlobalSolver.hpp"

namespace bomb::core::persist
{
    using NameTable = std::map<PlyrIdxT, std::string>;

    // belief.json and value_tracker.json contents of one player
    struct StoredFiles
    {
        nlohmann::json belief;
        nlohmann::json trackers;
    };

    auto ToJson(BeliefState const& state, NameTable const& names = {}) -> StoredFiles;

    // Names come from the caller, else from the file's "player_names", else none.
    // Throws SerializationError on malformed content.
    auto FromJson(StoredFiles const& files,
                  Config const& config,
                  std::optional<NameTable> names = std::nullopt,
                  std::shared_ptr<GlobalSolver> solver = nullptr) -> BeliefState;

    // base/player_{id}/{belief,value_tracker}.json. Returns the player directory.
    auto SaveToFolder(BeliefState const& state, std::filesystem::path const& base, NameTable const& names = {})
        -> std::filesystem::path;

    auto LoadFromFolder(std::filesystem::path const& base,
                        PlyrIdxT player,
                        Config const& config,
                        std::optional<NameTable> names = std::nullopt,
                        std::shared_ptr<GlobalSolver> solver = nullptr) -> BeliefState;

    // "player_names" stored next to a player's beliefs, empty if absent
    auto LoadNames(std::filesystem::path const& base, PlyrIdxT player) -> NameTable;
}

#endif //BOMBBUSTER_BELIEFSTORE_HPP
