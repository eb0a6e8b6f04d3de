/**
 * @file BudgetEnforcer.hpp
 * @brief The four per-generation budgets: new tokens, context, wall clock,
 *        caller cancellation.
 *
 * check() runs once per token; the first exhausted budget wins.
 */

#ifndef TL_BUDGET_ENFORCER_HPP
#define TL_BUDGET_ENFORCER_HPP

#include "tokenloom/tokenloom_abi.h"

#include <chrono>
#include <cstdint>
#include <optional>
#include <stop_token>
#include <utility>

namespace tl {

enum class BudgetVerdict {
    CONTINUE,
    MAX_TOKENS,
    MAX_CONTEXT,
    TIMEOUT,
    CANCELLED,
};

inline tl_finish_reason to_finish_reason(BudgetVerdict v) {
    switch (v) {
        case BudgetVerdict::MAX_TOKENS:  return TL_FINISH_MAX_TOKENS;
        case BudgetVerdict::MAX_CONTEXT: return TL_FINISH_MAX_CONTEXT;
        case BudgetVerdict::TIMEOUT:     return TL_FINISH_TIMEOUT;
        case BudgetVerdict::CANCELLED:   return TL_FINISH_CANCELLED;
        default:                         return TL_FINISH_NONE;
    }
}

class BudgetEnforcer {
public:
    using Clock = std::chrono::steady_clock;

    struct Limits {
        uint32_t max_new_tokens     = 0;
        uint32_t max_context_tokens = 0;  /**< 0 = model window only */
        uint32_t model_context      = 0;
        uint32_t timeout_ms         = 0;  /**< 0 = none */
    };

    BudgetEnforcer(const Limits& limits, std::stop_token caller)
        : limits_(limits), caller_(std::move(caller)) {
        if (limits_.timeout_ms)
            deadline_ = Clock::now() + std::chrono::milliseconds(limits_.timeout_ms);
    }

    BudgetEnforcer(const BudgetEnforcer&) = delete;
    BudgetEnforcer& operator=(const BudgetEnforcer&) = delete;

    /**
     * Called before producing each token. Order: token budget, context
     * budget, deadline, cancellation.
     */
    BudgetVerdict check(uint32_t generated, uint32_t context_len) {
        if (generated >= limits_.max_new_tokens)
            return BudgetVerdict::MAX_TOKENS;
        if ((limits_.max_context_tokens && context_len >= limits_.max_context_tokens) ||
            (limits_.model_context && context_len >= limits_.model_context))
            return BudgetVerdict::MAX_CONTEXT;
        if (deadline_passed())
            return BudgetVerdict::TIMEOUT;
        if (caller_.stop_requested())
            return BudgetVerdict::CANCELLED;
        return BudgetVerdict::CONTINUE;
    }

private:
    /* Sticky: once the deadline is seen, later checks skip the clock. */
    bool deadline_passed() {
        if (!timed_out_ && deadline_ && Clock::now() >= *deadline_) timed_out_ = true;
        return timed_out_;
    }

    Limits                           limits_;
    std::stop_token                  caller_;
    std::optional<Clock::time_point> deadline_;
    bool                             timed_out_ = false;
};

} // namespace tl

#endif // TL_BUDGET_ENFORCER_HPP
