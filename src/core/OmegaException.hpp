//
// Created by Malik T on 14/10/2025.
//

#ifndef CLUEGAME_OMEGAEXCEPTION_HPP
#define CLUEGAME_OMEGAEXCEPTION_HPP

#include <algorithm>
#include <cstddef>
#include <format>
#include <source_location>
#include <stacktrace>
#include <string>
#include <string_view>
#include <utility>

namespace clue::core
{
    //inspired by CPPCon2023 "Exceptionally bad" by Peter Muldoon
    //CodeT is an error category enum with a to_string() overload found by ADL.
    template <typename CodeT>
    class OmegaException
    {
    public:
        OmegaException(std::string err_str,
                       CodeT const code,
                       std::source_location const& src_loc = std::source_location::current(),
                       std::stacktrace backtrace = std::stacktrace::current()) :
            err_str_{std::move(err_str)},
            code_{code},
            src_loc_{src_loc},
            backtrace_{std::move(backtrace)}
        {
        }

        [[nodiscard]]
        auto what() const noexcept -> std::string const& { return err_str_; }

        [[nodiscard]]
        auto code() const noexcept -> CodeT { return code_; }

        [[nodiscard]]
        auto where() const noexcept -> std::source_location const& { return src_loc_; }

        [[nodiscard]]
        auto stack() const noexcept -> std::stacktrace const& { return backtrace_; }

        // "<code> error: <message> [file:line]", short enough for a log line or a test failure.
        [[nodiscard]]
        auto headline() const -> std::string
        {
            std::string_view file = src_loc_.file_name();
            if (auto const slash = file.find_last_of("/\\"); slash != std::string_view::npos)
                file.remove_prefix(slash + 1);
            return std::format("{} error: {} [{}:{}]", to_string(code_), err_str_, file, src_loc_.line());
        }

        // Throwing function followed by at most max_frames captured frames, innermost first.
        [[nodiscard]]
        auto trace(std::size_t const max_frames = 16) const -> std::string
        {
            std::string s = std::format("  in `{}`\n", src_loc_.function_name());
            std::size_t const n = std::min(max_frames, backtrace_.size());
            for (std::size_t i{}; i < n; ++i)
            {
                auto const& frame = backtrace_[i];
                s += std::format("  #{} {}({}):{}\n", i, frame.source_file(), frame.source_line(),
                                 frame.description());
            }
            return s;
        }

    private:
        std::string err_str_;
        CodeT code_;
        std::source_location src_loc_;
        std::stacktrace backtrace_;
    };
}

//extension to std format to allow use with std::print();
template <class CodeT>
struct std::formatter<clue::core::OmegaException<CodeT>> : std::formatter<std::string_view>
{
    template <class FormatContext>
    auto format(clue::core::OmegaException<CodeT> const& p, FormatContext& ctx) const
    {
        std::string s = std::format("{}\n{}", p.headline(), p.trace());
        return std::formatter<std::string_view>::format(s, ctx);
    }
};

#endif //CLUEGAME_OMEGAEXCEPTION_HPP
