/**
 * @file options.cpp
 * @brief GenerationOptions validation and key=value configuration surface
 */

#include "tokenloom/GenerationOptions.hpp"
#include "tokenloom/metrics.h"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <cstring>

namespace tl {

const char* const k_option_keys[] = {
    "MaxNewTokens", "MaxContextTokens", "MaxInputTokens", "TruncateInput",
    "TimeoutMs", "Seed", "Temperature", "TopK", "TopP", "MinP",
    "RepetitionPenalty", "PresencePenalty", "FrequencyPenalty",
    "RepetitionWindow", "StopTokenIds", "StopSequences",
    "RemoveStopSequenceFromOutput", "IncludeLogProbs", "ConstraintFallback",
    "OutputConstraint", nullptr
};

namespace {

tl_status fail(std::string* err, std::string msg) {
    if (err) *err = std::move(msg);
    return TL_ERROR_INVALID_ARG;
}

/* ---- scalar parsers: whole string must be consumed ---- */

bool parse_i64(std::string_view v, int64_t* out) {
    std::string s(v);
    if (s.empty()) return false;
    char* end = nullptr;
    errno = 0;
    long long x = std::strtoll(s.c_str(), &end, 10);
    if (errno != 0 || *end != '\0') return false;
    *out = x;
    return true;
}

bool parse_u32(std::string_view v, uint32_t* out) {
    int64_t x = 0;
    if (!parse_i64(v, &x) || x < 0 || x > UINT32_MAX) return false;
    *out = static_cast<uint32_t>(x);
    return true;
}

bool parse_u64(std::string_view v, uint64_t* out) {
    std::string s(v);
    if (s.empty() || s[0] == '-') return false;
    char* end = nullptr;
    errno = 0;
    unsigned long long x = std::strtoull(s.c_str(), &end, 0);
    if (errno != 0 || *end != '\0') return false;
    *out = x;
    return true;
}

bool parse_float(std::string_view v, float* out) {
    std::string s(v);
    if (s.empty()) return false;
    char* end = nullptr;
    errno = 0;
    float x = std::strtof(s.c_str(), &end);
    if (errno != 0 || *end != '\0' || !std::isfinite(x)) return false;
    *out = x;
    return true;
}

bool parse_bool(std::string_view v, bool* out) {
    if (v == "1" || v == "true" || v == "True" || v == "yes") { *out = true;  return true; }
    if (v == "0" || v == "false" || v == "False" || v == "no") { *out = false; return true; }
    return false;
}

/** Splits on unescaped ',' and unescapes "\," "\n" "\\". */
std::vector<std::string> split_list(std::string_view v) {
    std::vector<std::string> items;
    std::string cur;
    for (size_t i = 0; i < v.size(); ++i) {
        char c = v[i];
        if (c == '\\' && i + 1 < v.size()) {
            char n = v[++i];
            if (n == 'n')      cur.push_back('\n');
            else if (n == 't') cur.push_back('\t');
            else               cur.push_back(n);
        } else if (c == ',') {
            items.push_back(std::move(cur));
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    items.push_back(std::move(cur));
    return items;
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t'))   s.remove_suffix(1);
    return s;
}

} // namespace

/* ================================================================== */
/*  validate                                                           */
/* ================================================================== */

tl_status GenerationOptions::validate(std::string* err) const {
    if (!(temperature > 0.0f))
        return fail(err, "Temperature must be > 0");
    if (!(top_p >= 0.0f && top_p <= 1.0f))
        return fail(err, "TopP must be within [0, 1]");
    if (!(min_p >= 0.0f && min_p <= 1.0f))
        return fail(err, "MinP must be within [0, 1]");
    if (!(repetition_penalty > 0.0f))
        return fail(err, "RepetitionPenalty must be > 0");
    if (!std::isfinite(presence_penalty) || !std::isfinite(frequency_penalty))
        return fail(err, "PresencePenalty/FrequencyPenalty must be finite");
    if (max_new_tokens == 0)
        return fail(err, "MaxNewTokens must be > 0");
    if (max_input_tokens && max_context_tokens && max_input_tokens > max_context_tokens)
        return fail(err, "MaxInputTokens (" + std::to_string(max_input_tokens) +
                         ") exceeds MaxContextTokens (" +
                         std::to_string(max_context_tokens) + ")");
    for (const auto& s : stop_sequences)
        if (s.empty()) return fail(err, "StopSequences must not contain empty strings");
    for (int32_t id : stop_token_ids)
        if (id < 0) return fail(err, "StopTokenIds must be non-negative");
    return TL_OK;
}

/* ================================================================== */
/*  set                                                                */
/* ================================================================== */

tl_status GenerationOptions::set(std::string_view key, std::string_view value,
                                 std::string* err) {
    key = trim(key);
    value = trim(value);
    const std::string k(key);
    auto bad = [&]() {
        return fail(err, "invalid value '" + std::string(value) + "' for " + k);
    };

    if (key == "MaxNewTokens")     return parse_u32(value, &max_new_tokens) ? TL_OK : bad();
    if (key == "MaxContextTokens") return parse_u32(value, &max_context_tokens) ? TL_OK : bad();
    if (key == "MaxInputTokens")   return parse_u32(value, &max_input_tokens) ? TL_OK : bad();
    if (key == "TimeoutMs")        return parse_u32(value, &timeout_ms) ? TL_OK : bad();
    if (key == "RepetitionWindow") return parse_u32(value, &repetition_window) ? TL_OK : bad();
    if (key == "TruncateInput")    return parse_bool(value, &truncate_input) ? TL_OK : bad();
    if (key == "IncludeLogProbs")  return parse_bool(value, &include_logprobs) ? TL_OK : bad();
    if (key == "ConstraintFallback")
        return parse_bool(value, &constraint_fallback) ? TL_OK : bad();
    if (key == "RemoveStopSequenceFromOutput")
        return parse_bool(value, &remove_stop_sequence_from_output) ? TL_OK : bad();
    if (key == "Temperature")       return parse_float(value, &temperature) ? TL_OK : bad();
    if (key == "TopP")              return parse_float(value, &top_p) ? TL_OK : bad();
    if (key == "MinP")              return parse_float(value, &min_p) ? TL_OK : bad();
    if (key == "RepetitionPenalty") return parse_float(value, &repetition_penalty) ? TL_OK : bad();
    if (key == "PresencePenalty")   return parse_float(value, &presence_penalty) ? TL_OK : bad();
    if (key == "FrequencyPenalty")  return parse_float(value, &frequency_penalty) ? TL_OK : bad();

    if (key == "TopK") {
        int64_t x = 0;
        if (!parse_i64(value, &x) || x < INT32_MIN || x > INT32_MAX) return bad();
        top_k = static_cast<int32_t>(x);
        return TL_OK;
    }
    if (key == "Seed") {
        if (value.empty() || value == "none") { seed.reset(); return TL_OK; }
        uint64_t x = 0;
        if (!parse_u64(value, &x)) return bad();
        seed = x;
        return TL_OK;
    }
    if (key == "StopTokenIds") {
        std::vector<int32_t> ids;
        if (!value.empty()) {
            for (const auto& item : split_list(value)) {
                int64_t x = 0;
                if (!parse_i64(trim(item), &x) || x < 0 || x > INT32_MAX) return bad();
                ids.push_back(static_cast<int32_t>(x));
            }
        }
        stop_token_ids = std::move(ids);
        return TL_OK;
    }
    if (key == "StopSequences") {
        std::vector<std::string> seqs;
        if (!value.empty()) {
            for (auto& item : split_list(value)) {
                if (item.empty()) return bad();
                seqs.push_back(std::move(item));
            }
        }
        stop_sequences = std::move(seqs);
        return TL_OK;
    }
    if (key == "OutputConstraint")
        return fail(err, "OutputConstraint takes a constraint handle, not text");

    return fail(err, "unknown option '" + k + "'");
}

/* ================================================================== */
/*  parse_options                                                      */
/* ================================================================== */

tl_status parse_options(std::string_view text, GenerationOptions& out,
                        std::string* err) {
    size_t pos = 0;
    while (pos <= text.size()) {
        size_t end = text.find(';', pos);
        if (end == std::string_view::npos) end = text.size();
        std::string_view item = trim(text.substr(pos, end - pos));
        pos = end + 1;
        if (item.empty()) continue;

        size_t eq = item.find('=');
        if (eq == std::string_view::npos)
            return fail(err, "expected Key=Value, got '" + std::string(item) + "'");
        tl_status st = out.set(item.substr(0, eq), item.substr(eq + 1), err);
        if (st != TL_OK) {
            tl_log(TL_LOG_WARN, "options", "%s", err ? err->c_str() : "bad option");
            return st;
        }
    }
    return TL_OK;
}

} // namespace tl
