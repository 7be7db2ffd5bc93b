//
// Created by Malik T on 21/08/2025.
//

#ifndef BJSIM_STACKEDSHOE_HPP
#define BJSIM_STACKEDSHOE_HPP

#include <deque>
#include <initializer_list>

#include "../core/Exception.hpp"
#include "../core/Shoe.hpp"

namespace bjsim::core::debug
{
    // Deals a scripted sequence of ranks in order. Running dry throws
    // ShoeExhaustedError, the signal a finite shoe raises.
    class StackedShoe final : public DrawSource
    {
    public:
        StackedShoe(std::initializer_list<Rank> ranks)
        {
            for (Rank const r : ranks) cards_.push_back(Card{r});
        }

        auto Next() -> Card override
        {
            if (cards_.empty()) BJS_THROW(error::Code::ShoeExhausted, "Stacked shoe ran out of cards");
            Card const c = cards_.front();
            cards_.pop_front();
            ++dealt_;
            return c;
        }

        auto Exhausted() const noexcept -> bool override { return cards_.empty(); }

        auto Dealt() const noexcept -> size_t { return dealt_; }

    private:
        std::deque<Card> cards_;
        size_t dealt_{0};
    };
}

#endif //BJSIM_STACKEDSHOE_HPP
