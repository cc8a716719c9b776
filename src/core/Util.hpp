//
// Created by Malik T on 02/11/2025.
//

#ifndef YAHTZEE_UTIL_HPP
#define YAHTZEE_UTIL_HPP

#include <algorithm>
#include <iterator>
#include <numeric>
#include <span>
#include <format>
#include "Types.hpp"
#include "Exception.hpp"


namespace yahtzee::core::util
{
    inline constexpr auto IsValidFace(FaceT const f) -> bool
    {
        return f >= 1 && f <= constants::NumFaces;
    }

    // Throws InvalidDice on the first face outside [1,6].
    inline auto RequireValidFaces(std::span<FaceT const> faces) -> void
    {
        auto const it = std::ranges::find_if_not(faces, IsValidFace);
        if (it != faces.end())
        {
            YTZ_THROW(error::Code::InvalidDice,
                      std::format("Die {} has face {} (expected 1-6)",
                                  std::distance(faces.begin(), it), static_cast<int>(*it)));
        }
    }

    inline auto FacesOf(DiceT const& dice) -> FacesT
    {
        FacesT out{};
        std::ranges::transform(dice, out.begin(), [](Die const& d) { return d.value; });
        return out;
    }

    inline auto SumFaces(std::span<FaceT const> faces) -> ScoreT
    {
        return static_cast<ScoreT>(std::accumulate(faces.begin(), faces.end(), 0u));
    }

    // counts[f] = number of dice showing f, counts[0] unused
    class FaceCounts
    {
    public:
        explicit FaceCounts(std::span<FaceT const> faces)
        {
            for (FaceT const f : faces)
            {
                ++counts_[f];
                mask_ |= static_cast<uint8_t>(1u << f);
            }
        }

        [[nodiscard]]
        auto Of(FaceT const f) const -> uint8_t { return counts_[f]; }

        [[nodiscard]]
        auto MaxOfAKind() const -> uint8_t
        {
            return *std::ranges::max_element(counts_);
        }

        // Sorted non-zero counts, e.g. {2,3} for a full house.
        [[nodiscard]]
        auto Partition() const -> std::vector<uint8_t>
        {
            std::vector<uint8_t> parts;
            for (uint8_t const c : counts_) if (c) parts.push_back(c);
            std::ranges::sort(parts);
            return parts;
        }

        // Bit f is set when face f appears at least once.
        [[nodiscard]]
        auto Mask() const -> uint8_t { return mask_; }

        [[nodiscard]]
        auto ContainsRun(FaceT const from, FaceT const to) const -> bool
        {
            uint8_t run{};
            for (FaceT f = from; f <= to; ++f) run |= static_cast<uint8_t>(1u << f);
            return (mask_ & run) == run;
        }

    private:
        std::array<uint8_t, constants::NumFaces + 1> counts_{};
        uint8_t mask_{0};
    };
}

#endif //YAHTZEE_UTIL_HPP
