/**
 * @file vsc_error.h
 * @brief VoiceStream Commons - Error Codes
 *
 * Codes are grouped into numeric ranges; vsc_error_category() in
 * vsc_error_model.h maps a code back to its range name.
 *
 *   -130 .. -149  Generation
 *   -150 .. -179  Network
 *   -180 .. -219  Storage
 *   -230 .. -249  ComponentState
 *   -250 .. -279  Validation
 *   -280 .. -299  Audio
 */

#ifndef VSC_ERROR_H
#define VSC_ERROR_H

#include "vsc/core/vsc_types.h"

// =============================================================================
// GENERATION
// =============================================================================

/** The operation was cancelled by its owner */
#define VSC_ERROR_CANCELLED ((vsc_result_t)-130)

// =============================================================================
// NETWORK
// =============================================================================

/** The synthesis service answered with a non-2xx status */
#define VSC_ERROR_SERVICE ((vsc_result_t)-150)

/** The connection failed after the response started */
#define VSC_ERROR_TRANSPORT ((vsc_result_t)-151)

/** No response could be obtained (resolve / connect / send failure) */
#define VSC_ERROR_CONNECTION_FAILED ((vsc_result_t)-152)

/** URL could not be parsed or uses an unsupported scheme */
#define VSC_ERROR_INVALID_URL ((vsc_result_t)-153)

/** Response body did not have the expected shape */
#define VSC_ERROR_MALFORMED_RESPONSE ((vsc_result_t)-154)

// =============================================================================
// STORAGE
// =============================================================================

#define VSC_ERROR_FILE_WRITE ((vsc_result_t)-180)
#define VSC_ERROR_FILE_READ ((vsc_result_t)-181)

// =============================================================================
// COMPONENT STATE
// =============================================================================

/** A generation session is already in flight */
#define VSC_ERROR_SESSION_ACTIVE ((vsc_result_t)-230)

/** Artifact export requested before the buffer was sealed */
#define VSC_ERROR_NOT_SEALED ((vsc_result_t)-231)

/** Append after seal */
#define VSC_ERROR_BUFFER_SEALED ((vsc_result_t)-232)

/** Operation on a discarded buffer */
#define VSC_ERROR_BUFFER_DISCARDED ((vsc_result_t)-233)

/** Operation not valid in the current state */
#define VSC_ERROR_INVALID_STATE ((vsc_result_t)-234)

// =============================================================================
// VALIDATION
// =============================================================================

#define VSC_ERROR_INVALID_ARGUMENT ((vsc_result_t)-250)
#define VSC_ERROR_EMPTY_TEXT ((vsc_result_t)-251)
#define VSC_ERROR_TEXT_TOO_LONG ((vsc_result_t)-252)
#define VSC_ERROR_NO_VOICE_SELECTED ((vsc_result_t)-253)
#define VSC_ERROR_INVALID_SPEED ((vsc_result_t)-254)
#define VSC_ERROR_CONFIG_PARSE ((vsc_result_t)-255)

// =============================================================================
// AUDIO
// =============================================================================

#define VSC_ERROR_AUDIO_DEVICE ((vsc_result_t)-280)
#define VSC_ERROR_UNSUPPORTED_FORMAT ((vsc_result_t)-281)

/**
 * @brief Default human-readable message for an error code
 *
 * Never returns nullptr.
 */
const char* vsc_error_message(vsc_result_t code);

#endif  // VSC_ERROR_H
