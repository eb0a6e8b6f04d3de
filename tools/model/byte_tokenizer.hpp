/**
 * @file byte_tokenizer.hpp
 * @brief Header-only byte-level tokenizer: ids 0..255 are bytes, 256 = EOS
 *
 * Lossless for any input, so decode(encode(s)) == s and the LCP of two
 * prompts in tokens equals their common byte prefix.
 */

#ifndef TL_BYTE_TOKENIZER_HPP
#define TL_BYTE_TOKENIZER_HPP

#include "tokenloom/Backend.hpp"

#include <cstdint>
#include <cstring>

namespace tl {

class ByteTokenizer {
public:
    static constexpr int32_t  k_eos   = 256;
    static constexpr uint32_t k_vocab = 257;

    TokenizerHandle handle() {
        return TokenizerHandle(reinterpret_cast<tl_tokenizer>(this), vtable());
    }

    static const tl_tokenizer_vtable& vtable() {
        static const tl_tokenizer_vtable vt = {
            &ByteTokenizer::encode_fn,
            &ByteTokenizer::decode_fn,
            [](tl_tokenizer) -> int32_t { return k_eos; },
            [](tl_tokenizer) -> uint32_t { return k_vocab; },
        };
        return vt;
    }

private:
    static tl_status encode_fn(tl_tokenizer, const char* text, size_t len,
                               int32_t* out, uint32_t cap, uint32_t* n_out) {
        if (!n_out || (len && !text)) return TL_ERROR_INVALID_ARG;
        if (len > UINT32_MAX) return TL_ERROR_RESOURCE_LIMIT;
        *n_out = static_cast<uint32_t>(len);
        if (len > cap) return TL_OK;
        for (size_t i = 0; i < len; ++i)
            out[i] = static_cast<int32_t>(static_cast<unsigned char>(text[i]));
        return TL_OK;
    }

    static tl_status decode_fn(tl_tokenizer, const int32_t* ids, uint32_t n,
                               char* out, size_t cap, size_t* n_out) {
        if (!n_out || (n && !ids)) return TL_ERROR_INVALID_ARG;
        size_t len = 0;
        for (uint32_t i = 0; i < n; ++i) {
            if (ids[i] == k_eos) continue;
            if (ids[i] < 0 || ids[i] > 255) return TL_ERROR_INVALID_ARG;
            ++len;
        }
        *n_out = len;
        if (len > cap) return TL_OK;
        size_t o = 0;
        for (uint32_t i = 0; i < n; ++i) {
            if (ids[i] == k_eos) continue;
            out[o++] = static_cast<char>(static_cast<unsigned char>(ids[i]));
        }
        return TL_OK;
    }
};

} // namespace tl

#endif // TL_BYTE_TOKENIZER_HPP
