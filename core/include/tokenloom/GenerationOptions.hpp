/**
 * @file GenerationOptions.hpp
 * @brief Per-request sampling, budget and stop configuration
 *
 * Plain value type. A session copies the options at construction, so the
 * caller may mutate or destroy its instance while generation runs.
 *
 * Text surface: set("MaxNewTokens", "5") / parse_options("TopK=40;TopP=0.9")
 * recognize the keys listed in k_option_keys. List values (StopTokenIds,
 * StopSequences) are comma separated; a literal comma in a stop sequence
 * is written as "\,", a newline as "\n".
 */

#ifndef TL_GENERATION_OPTIONS_HPP
#define TL_GENERATION_OPTIONS_HPP

#include "tokenloom/tokenloom_abi.h"
#include "tokenloom/Backend.hpp"
#include "tokenloom/Sampler.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tl {

static constexpr uint32_t TL_DEFAULT_REPETITION_WINDOW = 256;

struct GenerationOptions {
    /* Sampling */
    float    temperature        = 0.8f;
    int32_t  top_k              = 40;     // <= 0 disables
    float    top_p              = 0.95f;  // 1.0 disables
    float    min_p              = 0.0f;   // 0 disables
    float    repetition_penalty = 1.0f;   // 1.0 disables
    float    presence_penalty   = 0.0f;
    float    frequency_penalty  = 0.0f;
    uint32_t repetition_window  = 0;      // 0 = TL_DEFAULT_REPETITION_WINDOW
    std::optional<uint64_t> seed;         // set = deterministic mode

    /* Budgets */
    uint32_t max_new_tokens     = 100;
    uint32_t max_context_tokens = 4096;   // 0 = model window only
    uint32_t max_input_tokens   = 2048;   // 0 = unlimited
    bool     truncate_input     = false;
    uint32_t timeout_ms         = 0;      // 0 = no deadline

    /* Stop conditions */
    std::vector<int32_t>     stop_token_ids;
    std::vector<std::string> stop_sequences;
    bool remove_stop_sequence_from_output = true;

    /* Output */
    bool             include_logprobs = false;
    ConstraintHandle output_constraint;
    bool             constraint_fallback = true;   // false = NO_CONTINUATION when all masked

    uint32_t effective_repetition_window() const {
        return repetition_window ? repetition_window : TL_DEFAULT_REPETITION_WINDOW;
    }

    SamplerParams sampler_params() const {
        SamplerParams sp;
        sp.temperature        = temperature;
        sp.top_k              = top_k;
        sp.top_p              = top_p;
        sp.min_p              = min_p;
        sp.repetition_penalty = repetition_penalty;
        sp.presence_penalty   = presence_penalty;
        sp.frequency_penalty  = frequency_penalty;
        sp.repetition_window  = effective_repetition_window();
        return sp;
    }

    /** Returns TL_ERROR_INVALID_ARG with a message in `err` on bad values. */
    tl_status validate(std::string* err = nullptr) const;

    /** Set one option from its textual key/value form. */
    tl_status set(std::string_view key, std::string_view value,
                  std::string* err = nullptr);
};

/** Recognized keys of GenerationOptions::set, NULL-terminated. */
extern const char* const k_option_keys[];

/** Parse "Key=Value;Key=Value" into `out` (applied over its current values). */
tl_status parse_options(std::string_view text, GenerationOptions& out,
                        std::string* err = nullptr);

} // namespace tl

#endif // TL_GENERATION_OPTIONS_HPP
