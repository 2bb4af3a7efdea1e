/**
 * @file vsc_types.h
 * @brief VoiceStream Commons - Basic Types
 *
 * Result codes are plain 32-bit integers: zero is success, negative values
 * are errors (see vsc_error.h for the full list).
 */

#ifndef VSC_TYPES_H
#define VSC_TYPES_H

#include <stdint.h>

typedef int32_t vsc_result_t;

#define VSC_SUCCESS ((vsc_result_t)0)

#define VSC_SUCCEEDED(result) ((result) >= 0)
#define VSC_FAILED(result) ((result) < 0)

#endif  // VSC_TYPES_H
