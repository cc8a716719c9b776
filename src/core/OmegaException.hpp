//
// Created by Malik T on 02/11/2025.
//

#ifndef YAHTZEE_OMEGAEXCEPTION_HPP
#define YAHTZEE_OMEGAEXCEPTION_HPP
#include <format>
#include <source_location>
#include <stacktrace>
#include <string>
#include <string_view>

namespace yahtzee::core
{
    // Carries a payload (usually an error code) plus where it was raised and the
    // call stack at that point. Not derived from std::exception, catch by payload type.
    template <typename T>
    class OmegaException
    {
    public:
        OmegaException(std::string err_str,
                       T usr_data,
                       std::source_location const& src_loc = std::source_location::current(),
                       std::stacktrace backtrace = std::stacktrace::current()) :
            err_str_{std::move(err_str)},
            usr_data_{std::move(usr_data)},
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
        auto data() const noexcept -> T const& { return usr_data_; }

        // Origin line followed by one line per frame. The innermost frames belong
        // to the throw helpers and are skipped.
        [[nodiscard]]
        auto to_str(size_t skip_frames = 2) const -> std::string
        {
            std::string s = std::format("{}({}:{}) in `{}`\n", src_loc_.file_name(), src_loc_.line(),
                                        src_loc_.column(), src_loc_.function_name());
            size_t idx{};
            for (auto const& entry : backtrace_)
            {
                if (idx++ < skip_frames) continue;
                s += std::format("  #{} {}({}): {}\n", idx - 1, entry.source_file(), entry.source_line(),
                                 entry.description());
            }
            return s;
        }

    private:
        std::string err_str_;
        T usr_data_;
        std::source_location src_loc_;
        std::stacktrace backtrace_;
    };
}

template <class T>
struct std::formatter<yahtzee::core::OmegaException<T>> : std::formatter<std::string_view>
{
    template <class FormatContext>
    auto format(yahtzee::core::OmegaException<T> const& e, FormatContext& ctx) const
    {
        std::string const s = std::format("error ({}): {}\n{}", static_cast<int>(e.data()), e.what(), e.to_str());
        return std::formatter<std::string_view>::format(s, ctx);
    }
};
#endif //YAHTZEE_OMEGAEXCEPTION_HPP
