#include "vsc/core/vsc_error_model.h"

// ------------------------------------------------------------
// Internal Helper: Determine Category from Error Code Range
// ------------------------------------------------------------
const char* vsc_error_category(vsc_result_t code) {
    if (code >= -149 && code <= -130) return "Generation";
    if (code >= -179 && code <= -150) return "Network";
    if (code >= -219 && code <= -180) return "Storage";
    if (code >= -249 && code <= -230) return "ComponentState";
    if (code >= -279 && code <= -250) return "Validation";
    if (code >= -299 && code <= -280) return "Audio";

    if (code == VSC_SUCCESS) return "Success";

    return "Unknown";
}

bool vsc_is_validation_error(vsc_result_t code) {
    return code >= -279 && code <= -250;
}

// ------------------------------------------------------------
// Public API: Create Structured Error Model
// ------------------------------------------------------------
vsc_error_model_t vsc_make_error_model(vsc_result_t code) {
    vsc_error_model_t model;
    model.code = code;
    model.message = vsc_error_message(code);
    model.category = vsc_error_category(code);
    return model;
}
