//
// Created by Malik T on 13/08/2025.
//

#ifndef BOMBBUSTER_OMEGAEXCEPTION_HPP
#define BOMBBUSTER_OMEGAEXCEPTION_HPP
#include <source_location>
#include <format>
#include <stacktrace>
#include <string>
#include <string_view>
#include "Types.hpp"

namespace bomb::core
{
    // frames beyond this are dropped from reports
    inline constexpr std::size_t kMaxReportedFrames = 16;

    //inspired by CPPCon2023 "Exceptionally bad" by Peter Muldoon
    // T is the failure category; describe_code(T) is looked up next to T
    template <typename T>
    class OmegaException
    {
    public:
        OmegaException(std::string err_str,
                       T code,
                       std::source_location const& src_loc = std::source_location::current(),
                       std::stacktrace backtrace = std::stacktrace::current()) :
            err_str_{std::move(err_str)},
            code_{std::move(code)},
            src_loc_{src_loc},
            backtrace_{std::move(backtrace)}
        {
        }

        [[nodiscard]]
        auto what() const noexcept -> std::string const& { return err_str_; }

        [[nodiscard]]
        auto where() const noexcept -> std::source_location const& { return src_loc_; }

        [[nodiscard]]
        auto stack() const noexcept -> std::stacktrace const& { return backtrace_; }

        [[nodiscard]]
        auto data() const noexcept -> T const& { return code_; }

        // "<category>: <message>" on one line
        [[nodiscard]]
        auto headline() const -> std::string
        {
            return std::format("{}: {}", describe_code(code_), err_str_);
        }

        // throw site, then the frames below the throw helpers
        [[nodiscard]]
        auto to_str() const -> std::string
        {
            std::string s = std::format("  thrown in `{}`\n  at {}:{}\n", src_loc_.function_name(),
                                        src_loc_.file_name(), src_loc_.line());
            std::size_t shown{};
            for (auto const& frame : backtrace_)
            {
                std::string const desc = frame.description();
                if (IsThrowHelper(desc)) continue;
                if (shown++ == kMaxReportedFrames)
                {
                    s += "  ...\n";
                    break;
                }
                if (frame.source_file().empty())
                    s += std::format("  #{} {}\n", shown, desc);
                else
                    s += std::format("  #{} {} ({}:{})\n", shown, desc, frame.source_file(), frame.source_line());
            }
            return s;
        }

    private:
        static auto IsThrowHelper(std::string_view desc) -> bool
        {
            return desc.find("OmegaException") != std::string_view::npos
                || desc.find("error::fail") != std::string_view::npos;
        }

        std::string err_str_;
        T code_;
        std::source_location const src_loc_;
        std::stacktrace backtrace_;
    };
}

//extension to std format to allow use with std::print();
template <class T>
struct std::formatter<bomb::core::OmegaException<T>> : std::formatter<std::string_view>
{
    constexpr auto parse(std::format_parse_context& ctx)
    {
        return std::formatter<std::string_view>::parse(ctx);
    }

    template <class FormatContext>
    auto format(bomb::core::OmegaException<T> const& p, FormatContext& ctx) const
    {
        std::string const s = std::format("[bombbuster] {}\n{}", p.headline(), p.to_str());
        return std::formatter<std::string_view>::format(s, ctx);
    }
};
#endif //BOMBBUSTER_OMEGAEXCEPTION_HPP
