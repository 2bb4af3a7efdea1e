#ifndef VSC_ERROR_MODEL_H
#define VSC_ERROR_MODEL_H

#include "vsc/core/vsc_error.h"

/**
 * @brief Structured error model
 *
 * Bundles a result code with its default message and category name so
 * callers that surface errors (CLI, event subscribers) do not repeat the
 * lookup.
 */
typedef struct {
    vsc_result_t code;    /**< Numeric error code */
    const char* message;  /**< Human-readable error message */
    const char* category; /**< Error category (e.g., Network, Validation) */
} vsc_error_model_t;

/**
 * @brief Create structured error model from error code
 */
vsc_error_model_t vsc_make_error_model(vsc_result_t code);

/**
 * @brief Get error category string from error code
 */
const char* vsc_error_category(vsc_result_t code);

/**
 * @brief True for the codes that represent invalid caller input
 */
bool vsc_is_validation_error(vsc_result_t code);

#endif  // VSC_ERROR_MODEL_H
