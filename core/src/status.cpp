/**
 * @file status.cpp
 * @brief Human-readable names for tl_status / tl_finish_reason
 */

#include "tokenloom/tokenloom_abi.h"

const char* tl_status_str(tl_status st) {
    switch (st) {
        case TL_OK:                    return "ok";
        case TL_ERROR_INVALID_ARG:     return "invalid argument";
        case TL_ERROR_OUT_OF_MEMORY:   return "out of memory";
        case TL_ERROR_NOT_FOUND:       return "not found";
        case TL_ERROR_RESOURCE_LIMIT:  return "resource limit";
        case TL_ERROR_TIMEOUT:         return "timeout";
        case TL_ERROR_CANCELLED:       return "cancelled";
        case TL_ERROR_BUSY:            return "session busy";
        case TL_ERROR_DISPOSED:        return "session disposed";
        case TL_ERROR_SHAPE_MISMATCH:  return "cache shape mismatch";
        case TL_ERROR_NO_CONTINUATION: return "no valid continuation";
        case TL_ERROR_BACKEND:         return "backend failure";
        case TL_ERROR_INTERNAL:        return "internal error";
    }
    return "unknown";
}

const char* tl_finish_reason_str(tl_finish_reason r) {
    switch (r) {
        case TL_FINISH_NONE:            return "none";
        case TL_FINISH_MAX_TOKENS:      return "max_tokens";
        case TL_FINISH_END_OF_SEQUENCE: return "end_of_sequence";
        case TL_FINISH_STOP_TOKEN:      return "stop_token";
        case TL_FINISH_STOP_SEQUENCE:   return "stop_sequence";
        case TL_FINISH_TIMEOUT:         return "timeout";
        case TL_FINISH_MAX_CONTEXT:     return "max_context";
        case TL_FINISH_CANCELLED:       return "cancelled";
    }
    return "unknown";
}
