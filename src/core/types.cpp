#include "core/types.hpp"

namespace cascii {

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS: return "success";
        case ErrorCode::FILE_NOT_FOUND: return "file not found";
        case ErrorCode::INVALID_FORMAT: return "invalid format";
        case ErrorCode::INVALID_ARGUMENT: return "invalid argument";
        case ErrorCode::IO_ERROR: return "i/o error";
        case ErrorCode::PROCESSING_ERROR: return "processing error";
        case ErrorCode::FONT_ERROR: return "font error";
        case ErrorCode::DECODE_ERROR: return "decode error";
        case ErrorCode::DIMENSION_MISMATCH: return "dimension mismatch";
        case ErrorCode::INDEX_GAP: return "index gap";
        case ErrorCode::EXTERNAL_TOOL_ERROR: return "external tool error";
        case ErrorCode::TOOL_NOT_FOUND: return "tool not found";
        case ErrorCode::INVALID_TIME_RANGE: return "invalid time range";
        case ErrorCode::CANCELLED: return "cancelled";
    }
    return "unknown";
}

}
