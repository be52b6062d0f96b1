#include "core/types.hpp"

namespace dipc {

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS: return "success";
        case ErrorCode::INVALID_ARGUMENT: return "invalid argument";
        case ErrorCode::INVALID_STYLE_SELECTION: return "invalid style selection";
        case ErrorCode::STYLE_NOT_OBJECT: return "style is not an object";
        case ErrorCode::STYLE_NOT_FOUND: return "style not found";
        case ErrorCode::INVALID_HEX_COLOR: return "invalid hex color";
        case ErrorCode::INVALID_COLOR_ARRAY: return "invalid color array";
        case ErrorCode::INVALID_COLOR_OBJECT: return "invalid color object";
        case ErrorCode::CHANNEL_OVERFLOW: return "channel overflow";
        case ErrorCode::INVALID_DOCUMENT: return "invalid palette document";
        case ErrorCode::FILE_NOT_FOUND: return "file not found";
        case ErrorCode::CARDINALITY_MISMATCH: return "cardinality mismatch";
        case ErrorCode::DECODE_ERROR: return "decode error";
        case ErrorCode::ENCODE_ERROR: return "encode error";
        case ErrorCode::CONFIG_ERROR: return "config error";
    }
    return "unknown error";
}

bool is_operational(ErrorCode code) {
    return code == ErrorCode::DECODE_ERROR ||
           code == ErrorCode::ENCODE_ERROR;
}

std::string describe(const Result& result) {
    if (result.success()) {
        return "ok";
    }
    if (!result.message.empty()) {
        return result.message;
    }
    std::string text = error_code_name(result.error);
    if (!result.subject.empty()) {
        text += ": `" + result.subject + "`";
    }
    if (!result.value.empty()) {
        text += " (" + result.value + ")";
    }
    return text;
}

}
