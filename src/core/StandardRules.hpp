//
// Created by Malik T on 15/08/2025.
//

#ifndef BJSIM_STANDARDRULES_HPP
#define BJSIM_STANDARDRULES_HPP
#include "Rules.hpp"

namespace bjsim::core
{
    class StandardRules final : public Rules
    {
    public:
        auto Options(RoundImpl const& round) const -> ActionOptions override;
        auto Validate(RoundImpl const& round, Action a) const -> CheckResult override;
        auto Apply(RoundImpl& round, Action a) -> void override;
        auto Advance(RoundImpl& round) -> StepOutcome override;
    };
}

#endif //BJSIM_STANDARDRULES_HPP
