/**
 * @file Backend.hpp
 * @brief C++ handles over the backend C ABI (model, tokenizer, constraint)
 *
 * INTERNAL TO CORE. Never crosses a dynamic library boundary.
 *
 * This is the "upper C++ layer" of the hourglass:
 *   C++ ModelHandle / TokenizerHandle (core-internal)
 *       |
 *   C ABI waist (tokenloom_backend_abi.h)
 *       |
 *   backend internals (reference CPU model, test mocks, ...)
 *
 * Handles are cheap value types: an opaque self pointer plus a copy of the
 * vtable. They do not own the backend object.
 */

#ifndef TL_BACKEND_HPP
#define TL_BACKEND_HPP

#include "tokenloom/tokenloom_backend_abi.h"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace tl {

inline bool shape_equal(const tl_model_shape& a, const tl_model_shape& b) {
    return a.n_layers == b.n_layers && a.n_heads == b.n_heads &&
           a.head_dim == b.head_dim;
}

/* ================================================================== */
/*  ModelHandle                                                        */
/* ================================================================== */

class ModelHandle {
public:
    ModelHandle() = default;
    ModelHandle(tl_model self, const tl_model_vtable& vt)
        : self_(self), vt_(vt) {}

    bool valid() const {
        return vt_.forward && vt_.vocab_size && vt_.context_length && vt_.shape;
    }

    const char* name() const {
        return vt_.get_name ? vt_.get_name(self_) : "unknown";
    }
    uint32_t       vocab_size()     const { return vt_.vocab_size(self_); }
    uint32_t       context_length() const { return vt_.context_length(self_); }
    tl_model_shape shape()          const { return vt_.shape(self_); }

    tl_status forward(tl_kv_view* kv, std::span<const int32_t> tokens,
                      uint32_t pos_offset, float* logits_out) const {
        if (tokens.empty() || !logits_out) return TL_ERROR_INVALID_ARG;
        return vt_.forward(self_, kv, tokens.data(),
                           static_cast<uint32_t>(tokens.size()),
                           pos_offset, logits_out);
    }

    void kv_release(tl_kv_view* kv) const {
        if (vt_.kv_release) vt_.kv_release(self_, kv);
    }

private:
    tl_model        self_ = nullptr;
    tl_model_vtable vt_{};
};

/* ================================================================== */
/*  TokenizerHandle                                                    */
/* ================================================================== */

class TokenizerHandle {
public:
    TokenizerHandle() = default;
    TokenizerHandle(tl_tokenizer self, const tl_tokenizer_vtable& vt)
        : self_(self), vt_(vt) {}

    bool valid() const {
        return vt_.encode && vt_.decode && vt_.eos_id && vt_.vocab_size;
    }

    int32_t  eos_id()     const { return vt_.eos_id(self_); }
    uint32_t vocab_size() const { return vt_.vocab_size(self_); }

    tl_status encode(std::string_view text, std::vector<int32_t>& out) const {
        uint32_t n = 0;
        out.resize(out.capacity() > 0 ? out.capacity() : text.size() + 8);
        tl_status st = vt_.encode(self_, text.data(), text.size(), out.data(),
                                  static_cast<uint32_t>(out.size()), &n);
        if (st != TL_OK) { out.clear(); return st; }
        if (n > out.size()) {
            out.resize(n);
            st = vt_.encode(self_, text.data(), text.size(), out.data(), n, &n);
            if (st != TL_OK) { out.clear(); return st; }
        }
        out.resize(n);
        return TL_OK;
    }

    tl_status decode(std::span<const int32_t> ids, std::string& out) const {
        size_t n = 0;
        out.resize(out.capacity() > 0 ? out.capacity() : ids.size() * 4 + 16);
        tl_status st = vt_.decode(self_, ids.data(), static_cast<uint32_t>(ids.size()),
                                  out.data(), out.size(), &n);
        if (st != TL_OK) { out.clear(); return st; }
        if (n > out.size()) {
            out.resize(n);
            st = vt_.decode(self_, ids.data(), static_cast<uint32_t>(ids.size()),
                            out.data(), n, &n);
            if (st != TL_OK) { out.clear(); return st; }
        }
        out.resize(n);
        return TL_OK;
    }

private:
    tl_tokenizer        self_ = nullptr;
    tl_tokenizer_vtable vt_{};
};

/* ================================================================== */
/*  ConstraintHandle                                                   */
/* ================================================================== */

class ConstraintHandle {
public:
    ConstraintHandle() = default;
    ConstraintHandle(tl_constraint self, const tl_constraint_vtable& vt)
        : self_(self), vt_(vt) {}

    bool active() const { return vt_.allows != nullptr; }

    bool allows(std::string_view generated, std::string_view piece) const {
        return vt_.allows(self_, generated.data(), generated.size(),
                          piece.data(), piece.size()) != 0;
    }

private:
    tl_constraint        self_ = nullptr;
    tl_constraint_vtable vt_{};
};

} // namespace tl

#endif // TL_BACKEND_HPP
