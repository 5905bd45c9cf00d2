/**
 * @file mrt_error_model.cpp
 * @brief Category lookup and retry classification for result codes.
 */

#include "mrt/core/mrt_error_model.h"
#include "mrt/core/mrt_error.h"

namespace {

struct CodeRange {
    mrt_result_t low;
    mrt_result_t high;
    const char* category;
};

// Mirrors the numbering blocks in mrt_error.h.
constexpr CodeRange kCategoryRanges[] = {
    {-109, -100, "Initialization"}, {-129, -110, "Model"},
    {-149, -130, "Generation"},     {-179, -150, "Network"},
    {-219, -180, "Storage"},        {-229, -220, "Hardware"},
    {-249, -230, "ComponentState"}, {-279, -250, "Validation"},
    {-299, -280, "Audio"},          {-499, -400, "ModuleService"},
    {-699, -600, "Backend"},        {-899, -800, "Other"},
};

}  // namespace

const char* mrt_error_category(mrt_result_t code) {
    if (code == MRT_SUCCESS) {
        return "Success";
    }
    for (const auto& range : kCategoryRanges) {
        if (code >= range.low && code <= range.high) {
            return range.category;
        }
    }
    return "Unknown";
}

mrt_error_model_t mrt_make_error_model(mrt_result_t code) {
    mrt_error_model_t model;
    model.code = code;
    model.message = mrt_error_message(code);
    model.category = mrt_error_category(code);
    return model;
}

mrt_bool_t mrt_error_is_retryable(mrt_result_t code) {
    switch (code) {
        case MRT_ERROR_NETWORK:
        case MRT_ERROR_TIMEOUT:
            return MRT_TRUE;
        default:
            return MRT_FALSE;
    }
}
