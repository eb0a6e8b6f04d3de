/**
 * @file reference_model.hpp
 * @brief Header-only deterministic CPU attention model for tests and demos
 *
 * Not a trained network. Weights come from a fixed-seed splitmix64 stream;
 * each layer is a diagonal-projection multi-head attention block with a
 * residual connection, and the logits are the final state dotted with the
 * (tied) embedding table.
 *
 * What matters is the cache contract: forward() reads K/V rows
 * [0, pos_offset) from the caller's tl_kv_view and writes rows
 * [pos_offset, pos_offset + n). Every position is computed by the same
 * sequential float loop, so one prefill over N tokens and N single-token
 * decodes give bit-identical logits.
 */

#ifndef TL_REFERENCE_MODEL_HPP
#define TL_REFERENCE_MODEL_HPP

#include "tokenloom/Backend.hpp"

#include <atomic>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <string>
#include <thread>
#include <vector>

namespace tl {

class ReferenceModel {
public:
    struct Config {
        uint32_t    vocab_size       = 257;
        uint32_t    context_length   = 512;
        uint32_t    n_layers         = 2;
        uint32_t    n_heads          = 2;
        uint32_t    head_dim         = 8;
        uint64_t    seed             = 0x5eedULL;
        float       logit_scale      = 4.0f;
        uint32_t    forward_delay_us = 0;     /**< simulated slow backend */
        std::string name             = "reference";
    };

    ReferenceModel() : ReferenceModel(Config{}) {}
    explicit ReferenceModel(Config cfg) : cfg_(std::move(cfg)) {
        dim_ = cfg_.n_heads * cfg_.head_dim;
        uint64_t state = cfg_.seed;
        auto next = [&state]() {
            /* splitmix64 -> [-1, 1) */
            uint64_t z = (state += 0x9E3779B97F4A7C15ULL);
            z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
            z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
            z ^= z >> 31;
            return static_cast<float>(static_cast<double>(z >> 11) * 0x1.0p-53 * 2.0 - 1.0);
        };
        embed_.resize(static_cast<size_t>(cfg_.vocab_size) * dim_);
        for (auto& w : embed_) w = next();
        size_t per_layer = static_cast<size_t>(cfg_.n_layers) * dim_;
        for (auto* v : {&wq_, &wk_, &wv_, &wo_}) {
            v->resize(per_layer);
            for (auto& w : *v) w = next();
        }
    }

    ReferenceModel(const ReferenceModel&) = delete;
    ReferenceModel& operator=(const ReferenceModel&) = delete;

    ModelHandle handle() {
        return ModelHandle(reinterpret_cast<tl_model>(this), vtable());
    }

    tl_model_shape shape() const {
        return tl_model_shape{cfg_.n_layers, cfg_.n_heads, cfg_.head_dim};
    }

    const Config& config()        const { return cfg_; }
    uint64_t      forward_calls() const { return forward_calls_.load(); }
    uint64_t      kv_releases()   const { return kv_releases_.load(); }

    tl_status forward(tl_kv_view* kv, const int32_t* tokens, uint32_t n,
                      uint32_t pos_offset, float* logits_out) const {
        forward_calls_.fetch_add(1);
        if (!kv || !tokens || n == 0 || !logits_out) return TL_ERROR_INVALID_ARG;
        if (!shape_equal(kv->shape, shape())) return TL_ERROR_SHAPE_MISMATCH;
        if (pos_offset > kv->n_tokens) return TL_ERROR_INVALID_ARG;
        if (pos_offset + n > kv->max_tokens || pos_offset + n > cfg_.context_length)
            return TL_ERROR_RESOURCE_LIMIT;
        for (uint32_t i = 0; i < n; ++i)
            if (tokens[i] < 0 || static_cast<uint32_t>(tokens[i]) >= cfg_.vocab_size)
                return TL_ERROR_INVALID_ARG;

        if (cfg_.forward_delay_us)
            std::this_thread::sleep_for(std::chrono::microseconds(cfg_.forward_delay_us));

        const uint32_t hd = cfg_.head_dim;
        const float inv_sqrt = 1.0f / std::sqrt(static_cast<float>(hd));
        std::vector<float> x(dim_), q(dim_), att(dim_);
        std::vector<float> scores(pos_offset + n);

        for (uint32_t t = 0; t < n; ++t) {
            const uint32_t pos = pos_offset + t;
            const float* e = &embed_[static_cast<size_t>(tokens[t]) * dim_];
            for (uint32_t d = 0; d < dim_; ++d) {
                float freq = std::pow(10000.0f, -static_cast<float>(d) / static_cast<float>(dim_));
                x[d] = e[d] + 0.1f * std::sin(static_cast<float>(pos) * freq);
            }

            for (uint32_t l = 0; l < cfg_.n_layers; ++l) {
                const float* wq = &wq_[static_cast<size_t>(l) * dim_];
                const float* wk = &wk_[static_cast<size_t>(l) * dim_];
                const float* wv = &wv_[static_cast<size_t>(l) * dim_];
                const float* wo = &wo_[static_cast<size_t>(l) * dim_];
                float* K = kv->keys[l];
                float* V = kv->values[l];

                float* k_row = K + static_cast<size_t>(pos) * dim_;
                float* v_row = V + static_cast<size_t>(pos) * dim_;
                for (uint32_t d = 0; d < dim_; ++d) {
                    q[d]     = x[d] * wq[d];
                    k_row[d] = x[d] * wk[d];
                    v_row[d] = x[d] * wv[d];
                }

                for (uint32_t h = 0; h < cfg_.n_heads; ++h) {
                    const uint32_t off = h * hd;
                    float max_s = -INFINITY;
                    for (uint32_t j = 0; j <= pos; ++j) {
                        const float* kj = K + static_cast<size_t>(j) * dim_ + off;
                        float s = 0.0f;
                        for (uint32_t d = 0; d < hd; ++d) s += q[off + d] * kj[d];
                        s *= inv_sqrt;
                        scores[j] = s;
                        if (s > max_s) max_s = s;
                    }
                    float sum = 0.0f;
                    for (uint32_t j = 0; j <= pos; ++j) {
                        scores[j] = std::exp(scores[j] - max_s);
                        sum += scores[j];
                    }
                    for (uint32_t d = 0; d < hd; ++d) att[off + d] = 0.0f;
                    for (uint32_t j = 0; j <= pos; ++j) {
                        const float a = scores[j] / sum;
                        const float* vj = V + static_cast<size_t>(j) * dim_ + off;
                        for (uint32_t d = 0; d < hd; ++d) att[off + d] += a * vj[d];
                    }
                }
                for (uint32_t d = 0; d < dim_; ++d) x[d] += att[d] * wo[d];
            }
        }

        /* Logits of the last position, tied to the embedding table. */
        for (uint32_t v = 0; v < cfg_.vocab_size; ++v) {
            const float* e = &embed_[static_cast<size_t>(v) * dim_];
            float s = 0.0f;
            for (uint32_t d = 0; d < dim_; ++d) s += x[d] * e[d];
            logits_out[v] = s * cfg_.logit_scale;
        }
        return TL_OK;
    }

    static const tl_model_vtable& vtable() {
        static const tl_model_vtable vt = {
            [](tl_model self) -> const char* { return as(self)->cfg_.name.c_str(); },
            [](tl_model self) -> uint32_t { return as(self)->cfg_.vocab_size; },
            [](tl_model self) -> uint32_t { return as(self)->cfg_.context_length; },
            [](tl_model self) -> tl_model_shape { return as(self)->shape(); },
            [](tl_model self, tl_kv_view* kv, const int32_t* tokens, uint32_t n,
               uint32_t pos, float* logits) -> tl_status {
                return as(self)->forward(kv, tokens, n, pos, logits);
            },
            [](tl_model self, tl_kv_view*) { as(self)->kv_releases_.fetch_add(1); },
        };
        return vt;
    }

private:
    static ReferenceModel* as(tl_model self) {
        return reinterpret_cast<ReferenceModel*>(self);
    }

    Config             cfg_;
    uint32_t           dim_ = 0;
    std::vector<float> embed_;
    std::vector<float> wq_, wk_, wv_, wo_;

    mutable std::atomic<uint64_t> forward_calls_{0};
    std::atomic<uint64_t>         kv_releases_{0};
};

} // namespace tl

#endif // TL_REFERENCE_MODEL_HPP
