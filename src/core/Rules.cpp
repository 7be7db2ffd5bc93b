//
// Created by Malik T on 15/08/2025.
//

#include "Rules.hpp"

#include <charconv>
#include <format>

namespace bjsim::core
{
    namespace
    {
        auto ParseBool(std::string_view const key, std::string_view const value) -> bool
        {
            if (value == "1" || value == "true" || value == "yes" || value == "on") return true;
            if (value == "0" || value == "false" || value == "no" || value == "off") return false;
            BJS_THROW(error::Code::Config, std::format("Rule '{}' expects a boolean, got '{}'", key, value));
        }

        auto ParseInt(std::string_view const key, std::string_view const value) -> int
        {
            int out{};
            auto const res = std::from_chars(value.data(), value.data() + value.size(), out);
            if (res.ec != std::errc{} || res.ptr != value.data() + value.size())
                BJS_THROW(error::Code::Config, std::format("Rule '{}' expects an integer, got '{}'", key, value));
            return out;
        }

        auto ParsePolicy(std::string_view const value) -> InvalidActionPolicy
        {
            if (value == "reject") return InvalidActionPolicy::Reject;
            if (value == "fallback") return InvalidActionPolicy::Fallback;
            BJS_THROW(error::Code::Config,
                      std::format("Rule 'invalid_action' expects reject|fallback, got '{}'", value));
        }
    }

    auto Validate(RuleSet const& rules) -> void
    {
        if (rules.resplit_limit < 0)
            BJS_THROW(error::Code::Config,
                      std::format("resplit_limit must not be negative (got {})", rules.resplit_limit));
        if (rules.resplit_limit > constants::MaxResplitLimit)
            BJS_THROW(error::Code::Config,
                      std::format("resplit_limit {} exceeds the supported maximum {}",
                                  rules.resplit_limit, constants::MaxResplitLimit));
    }

    auto Label(RuleSet const& rules) -> std::string_view
    {
        return rules.hit_soft_17 ? "H17" : "S17";
    }

    auto Describe(RuleSet const& rules) -> std::string
    {
        return std::format("{} surrender={} das={} resplit_limit={} peek={} bj={} invalid_action={}",
                           Label(rules), rules.late_surrender, rules.das, rules.resplit_limit, rules.peek,
                           rules.blackjack_3to2 ? "3:2" : "1:1",
                           rules.invalid_action == InvalidActionPolicy::Reject ? "reject" : "fallback");
    }

    auto ApplyRuleOverride(RuleSet& rules, std::string_view const key, std::string_view const value) -> void
    {
        if (key == "hit_soft_17") rules.hit_soft_17 = ParseBool(key, value);
        else if (key == "late_surrender") rules.late_surrender = ParseBool(key, value);
        else if (key == "das") rules.das = ParseBool(key, value);
        else if (key == "resplit_limit") rules.resplit_limit = ParseInt(key, value);
        else if (key == "peek") rules.peek = ParseBool(key, value);
        else if (key == "blackjack_3to2") rules.blackjack_3to2 = ParseBool(key, value);
        else if (key == "invalid_action") rules.invalid_action = ParsePolicy(value);
        else BJS_THROW(error::Code::Config, std::format("Unknown rule '{}'", key));
    }

    auto RuleSetFromPairs(std::span<std::pair<std::string, std::string> const> pairs) -> RuleSet
    {
        RuleSet rules{};
        for (auto const& [key, value] : pairs)
        {
            ApplyRuleOverride(rules, key, value);
        }
        Validate(rules);
        return rules;
    }
}
