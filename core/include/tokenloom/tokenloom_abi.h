/**
 * @file tokenloom_abi.h
 * @brief TokenLoom Core ABI Contract: status codes, finish reasons, shapes
 *
 * This header defines the C-visible vocabulary shared by the generation
 * core and every backend plugged into it. Every symbol here is:
 *   - Pure C linkage (extern "C")
 *   - POD typed
 *   - Zero vtable, zero RTTI, zero exceptions across the boundary
 *
 * Errors are reported as tl_status values. Ordinary end-of-generation
 * conditions are not errors: they travel as tl_finish_reason.
 */

#ifndef TOKENLOOM_ABI_H
#define TOKENLOOM_ABI_H

#include <stddef.h>
#include <stdint.h>

/* ------------------------------------------------------------------ */
/*  1. Export / Visibility Macros                                      */
/* ------------------------------------------------------------------ */

#if defined(_WIN32) || defined(__CYGWIN__)
  #ifdef TL_BUILDING_DLL
    #define TL_API __declspec(dllexport)
  #else
    #define TL_API __declspec(dllimport)
  #endif
#elif defined(__GNUC__) || defined(__clang__)
  #define TL_API __attribute__((visibility("default")))
#else
  #define TL_API
#endif

/* ------------------------------------------------------------------ */
/*  2. ABI Version                                                     */
/* ------------------------------------------------------------------ */

#define TL_ABI_VERSION_MAJOR 0
#define TL_ABI_VERSION_MINOR 3
#define TL_ABI_VERSION_PATCH 0

/** Packed ABI version: 0x00MMNNPP */
#define TL_ABI_VERSION \
    (((uint32_t)TL_ABI_VERSION_MAJOR << 16) | \
     ((uint32_t)TL_ABI_VERSION_MINOR << 8)  | \
     ((uint32_t)TL_ABI_VERSION_PATCH))

#ifdef __cplusplus
extern "C" {
#endif

/* ------------------------------------------------------------------ */
/*  3. Status Codes                                                    */
/* ------------------------------------------------------------------ */

typedef enum tl_status {
    TL_OK                     = 0,
    TL_ERROR_INVALID_ARG      = 1,
    TL_ERROR_OUT_OF_MEMORY    = 2,
    TL_ERROR_NOT_FOUND        = 3,
    TL_ERROR_RESOURCE_LIMIT   = 4,   /**< input too long, KV budget exceeded */
    TL_ERROR_TIMEOUT          = 5,   /**< wall-clock budget missed */
    TL_ERROR_CANCELLED        = 6,   /**< caller cancellation, never absorbed */
    TL_ERROR_BUSY             = 7,   /**< generation already in flight */
    TL_ERROR_DISPOSED         = 8,
    TL_ERROR_SHAPE_MISMATCH   = 9,   /**< KV entry belongs to another model */
    TL_ERROR_NO_CONTINUATION  = 10,  /**< constraint left nothing to sample */
    TL_ERROR_BACKEND          = 11,  /**< model / tokenizer collaborator failed */
    TL_ERROR_INTERNAL         = 255
} tl_status;

/* ------------------------------------------------------------------ */
/*  4. Finish Reasons                                                  */
/* ------------------------------------------------------------------ */

typedef enum tl_finish_reason {
    TL_FINISH_NONE           = 0,
    TL_FINISH_MAX_TOKENS     = 1,
    TL_FINISH_END_OF_SEQUENCE = 2,
    TL_FINISH_STOP_TOKEN     = 3,
    TL_FINISH_STOP_SEQUENCE  = 4,
    TL_FINISH_TIMEOUT        = 5,
    TL_FINISH_MAX_CONTEXT    = 6,
    TL_FINISH_CANCELLED      = 7
} tl_finish_reason;

/* ------------------------------------------------------------------ */
/*  5. Model Shape (KV cache compatibility key)                        */
/* ------------------------------------------------------------------ */

typedef struct tl_model_shape {
    uint32_t n_layers;
    uint32_t n_heads;      /**< KV heads */
    uint32_t head_dim;
} tl_model_shape;

#ifdef __cplusplus
static_assert(sizeof(tl_model_shape) == 12,
    "ABI break: tl_model_shape size changed");
#else
_Static_assert(sizeof(tl_model_shape) == 12,
    "ABI break: tl_model_shape size changed");
#endif

TL_API const char* tl_status_str(tl_status st);
TL_API const char* tl_finish_reason_str(tl_finish_reason r);

#ifdef __cplusplus
}
#endif

#endif /* TOKENLOOM_ABI_H */
