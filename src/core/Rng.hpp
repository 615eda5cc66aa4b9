//
// Created by Malik T on 15/10/2025.
//

#ifndef CLUEGAME_RNG_HPP
#define CLUEGAME_RNG_HPP

#include <algorithm>
#include <cstdint>
#include <random>
#include <span>
#include "Exception.hpp"
#include "Types.hpp"

namespace clue::core
{
    // Single source of randomness for dice and tie-breaks. Seed it to replay a game.
    class Rng
    {
    public:
        explicit Rng(uint64_t seed) : eng_(seed) {}

        // Uniform in [lo, hi]
        auto UniformInt(int lo, int hi) -> int
        {
            CLU_ASSERT(lo <= hi, "Empty range for UniformInt");
            return std::uniform_int_distribution<int>{lo, hi}(eng_);
        }

        // Sum of two dice, uniform over [2, 12]
        auto RollDice() -> int
        {
            return UniformInt(constants::MinRoll, constants::MaxRoll);
        }

        template <class T>
        auto Pick(std::span<T const> v) -> T const&
        {
            CLU_ASSERT(!v.empty(), "Uniform choice from an empty candidate set");
            return v[std::uniform_int_distribution<size_t>{0, v.size() - 1}(eng_)];
        }

        template <class T>
        auto Pick(std::vector<T> const& v) -> T const&
        {
            return Pick(std::span<T const>{v});
        }

        template <class Vec>
        auto Shuffle(Vec& v) -> void
        {
            std::ranges::shuffle(v, eng_);
        }

    private:
        std::mt19937_64 eng_;
    };
}

#endif //CLUEGAME_RNG_HPP
