//
// Created by Malik T on 14/08/2025.
//

#ifndef BOMBBUSTER_LOG_HPP
#define BOMBBUSTER_LOG_HPP

#include <cstdio>
#include <format>
#include <print>
#include <utility>

namespace bomb::core::log
{
    template <typename... Args>
    inline auto Info(bool enabled, std::format_string<Args...> fmt, Args&&... args) -> void
    {
        if (!enabled) return;
        std::print(stderr, "[info] {}\n", std::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    inline auto Warn(std::format_string<Args...> fmt, Args&&... args) -> void
    {
        std::print(stderr, "[warn] {}\n", std::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    inline auto Critical(std::format_string<Args...> fmt, Args&&... args) -> void
    {
        std::print(stderr, "[critical] {}\n", std::format(fmt, std::forward<Args>(args)...));
    }
}

#endif //BOMBBUSTER_LOG_HPP
