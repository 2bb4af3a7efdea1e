/**
 * @file vsc_error.cpp
 * @brief VoiceStream Commons - Error Messages
 */

#include "vsc/core/vsc_error.h"

const char* vsc_error_message(vsc_result_t code) {
    switch (code) {
        case VSC_SUCCESS:
            return "Success";

        case VSC_ERROR_CANCELLED:
            return "Operation cancelled";

        case VSC_ERROR_SERVICE:
            return "Synthesis service returned an error";
        case VSC_ERROR_TRANSPORT:
            return "Network transfer failed";
        case VSC_ERROR_CONNECTION_FAILED:
            return "Could not connect to the synthesis service";
        case VSC_ERROR_INVALID_URL:
            return "Invalid or unsupported URL";
        case VSC_ERROR_MALFORMED_RESPONSE:
            return "Malformed response from the synthesis service";

        case VSC_ERROR_FILE_WRITE:
            return "Failed to write file";
        case VSC_ERROR_FILE_READ:
            return "Failed to read file";

        case VSC_ERROR_SESSION_ACTIVE:
            return "A generation is already in progress";
        case VSC_ERROR_NOT_SEALED:
            return "Audio is not complete yet";
        case VSC_ERROR_BUFFER_SEALED:
            return "Buffer is sealed";
        case VSC_ERROR_BUFFER_DISCARDED:
            return "Buffer was discarded";
        case VSC_ERROR_INVALID_STATE:
            return "Operation not allowed in the current state";

        case VSC_ERROR_INVALID_ARGUMENT:
            return "Invalid argument";
        case VSC_ERROR_EMPTY_TEXT:
            return "Please enter some text";
        case VSC_ERROR_TEXT_TOO_LONG:
            return "Input exceeds the maximum number of characters";
        case VSC_ERROR_NO_VOICE_SELECTED:
            return "Please select a voice";
        case VSC_ERROR_INVALID_SPEED:
            return "Speed must be between 0.25 and 4.0";
        case VSC_ERROR_CONFIG_PARSE:
            return "Invalid configuration";

        case VSC_ERROR_AUDIO_DEVICE:
            return "Audio device error";
        case VSC_ERROR_UNSUPPORTED_FORMAT:
            return "Unsupported audio format";

        default:
            return "Unknown error";
    }
}
