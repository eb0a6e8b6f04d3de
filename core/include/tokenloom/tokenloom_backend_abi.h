/**
 * @file tokenloom_backend_abi.h
 * @brief Backend contract: model forward pass, tokenizer, output constraint
 *
 * The generation core never sees model weights or vocabulary tables. It
 * drives three collaborators through structs of function pointers, each
 * paired with an opaque self handle (the same capability-token idiom as
 * the status header):
 *
 *   tl_model_vtable       forward pass over a session-owned KV view
 *   tl_tokenizer_vtable   text <-> token ids, EOS id
 *   tl_constraint_vtable  optional grammar / format filter
 *
 * KV ownership: the model is immutable and shared by every session. The
 * attention history lives in a tl_kv_view that the CALLER owns (one arena
 * per session id). forward() reads positions [0, pos_offset) and writes
 * [pos_offset, pos_offset + n_tokens). It never retains the view past the
 * call, so concurrent sessions cannot observe each other's state.
 */

#ifndef TOKENLOOM_BACKEND_ABI_H
#define TOKENLOOM_BACKEND_ABI_H

#include "tokenloom/tokenloom_abi.h"

#ifdef __cplusplus
extern "C" {
#endif

/* ------------------------------------------------------------------ */
/*  Opaque Handles                                                     */
/* ------------------------------------------------------------------ */

typedef struct tl_model_t*      tl_model;
typedef struct tl_tokenizer_t*  tl_tokenizer;
typedef struct tl_constraint_t* tl_constraint;

/* ------------------------------------------------------------------ */
/*  KV View: per-session attention arena                               */
/* ------------------------------------------------------------------ */

/**
 * Layout per layer: [position][head][head_dim] float32, row stride
 * n_heads * head_dim. keys[l] / values[l] each hold max_tokens rows.
 * n_tokens is the number of committed rows; the core advances it after a
 * successful forward().
 */
typedef struct tl_kv_view {
    tl_model_shape shape;
    uint32_t       max_tokens;
    uint32_t       n_tokens;
    float**        keys;
    float**        values;
} tl_kv_view;

/* ------------------------------------------------------------------ */
/*  Model VTable                                                       */
/* ------------------------------------------------------------------ */

typedef struct tl_model_vtable {
    const char*    (*get_name)(tl_model self);
    uint32_t       (*vocab_size)(tl_model self);
    uint32_t       (*context_length)(tl_model self);
    tl_model_shape (*shape)(tl_model self);

    /**
     * Run the network over `tokens` placed at positions
     * [pos_offset, pos_offset + n_tokens). Writes vocab_size floats to
     * `logits_out`: the logits of the LAST input position.
     */
    tl_status      (*forward)(tl_model self, tl_kv_view* kv,
                              const int32_t* tokens, uint32_t n_tokens,
                              uint32_t pos_offset, float* logits_out);

    /** Optional. Called on every exit path of a generation. NULL-safe. */
    void           (*kv_release)(tl_model self, tl_kv_view* kv);
} tl_model_vtable;

/* ------------------------------------------------------------------ */
/*  Tokenizer VTable                                                   */
/*  Two-call capacity protocol: *n_out always receives the full size.  */
/*  If it exceeds `cap`, nothing past `cap` is written and the caller  */
/*  retries with a larger buffer.                                      */
/* ------------------------------------------------------------------ */

typedef struct tl_tokenizer_vtable {
    tl_status (*encode)(tl_tokenizer self, const char* text, size_t len,
                        int32_t* out, uint32_t cap, uint32_t* n_out);
    tl_status (*decode)(tl_tokenizer self, const int32_t* ids, uint32_t n,
                        char* out, size_t cap, size_t* n_out);
    int32_t   (*eos_id)(tl_tokenizer self);
    uint32_t  (*vocab_size)(tl_tokenizer self);
} tl_tokenizer_vtable;

/* ------------------------------------------------------------------ */
/*  Output Constraint VTable                                           */
/* ------------------------------------------------------------------ */

typedef struct tl_constraint_vtable {
    /** Nonzero when `piece` may be appended to `generated`. */
    int (*allows)(tl_constraint self,
                  const char* generated, size_t generated_len,
                  const char* piece, size_t piece_len);
} tl_constraint_vtable;

#ifdef __cplusplus
}
#endif

#endif /* TOKENLOOM_BACKEND_ABI_H */
