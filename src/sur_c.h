// C API for WASM and FFI bindings.

#ifndef SUR_C_H
#define SUR_C_H

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

// ============================================================================
// Handle and Error Definitions
// ============================================================================

/// @brief Opaque handle holding the last parsed document.
typedef void* SurHandle;

/// @brief Error codes returned by API functions.
typedef enum {
  SUR_OK = 0,
  SUR_ERROR_INVALID_PARAM = 1,
  SUR_ERROR_NO_DOCUMENT = 2,
  SUR_ERROR_VALIDATION_FAILED = 3,
} SurError;

// ============================================================================
// Output Data Structures
// ============================================================================

/// @brief Text output (formatted notation or JSON).
typedef struct {
  char* text;     ///< NUL-terminated text
  size_t length;  ///< Length without the terminator
} SurText;

/// @brief Summary of the last parse.
typedef struct {
  uint32_t section_count;  ///< Number of sections
  uint32_t beat_count;     ///< Beats across all sections
  uint32_t warning_count;  ///< Fragments skipped by the lenient parser
} SurInfo;

// ============================================================================
// Lifecycle
// ============================================================================

/// @brief Create a new handle.
/// @return Handle (must be freed with sur_destroy)
SurHandle sur_create(void);

/// @brief Destroy a handle.
/// @param handle Handle to destroy
void sur_destroy(SurHandle handle);

// ============================================================================
// Parsing
// ============================================================================

/// @brief Parse SureScript text into the handle, replacing any previous document.
///
/// Lenient: malformed fragments are skipped and counted in SurInfo, never
/// reported as errors. Warnings are not logged.
///
/// @param handle Sur handle
/// @param text Document text (need not be NUL-terminated)
/// @param length Length of the text
/// @return SUR_OK on success
SurError sur_parse(SurHandle handle, const char* text, size_t length);

/// @brief Validate the parsed document.
/// @param handle Sur handle
/// @return SUR_OK, or SUR_ERROR_VALIDATION_FAILED with details in sur_last_message()
SurError sur_validate(SurHandle handle);

/// @brief Message describing the last failure or the last parse's warnings.
/// @param handle Sur handle
/// @return Message owned by the handle (valid until the next call on it)
const char* sur_last_message(SurHandle handle);

// ============================================================================
// Output Retrieval
// ============================================================================

/// @brief Get the canonical text of the parsed document.
/// @param handle Sur handle
/// @return Text (must be freed with sur_free_text), or NULL without a document
SurText* sur_get_formatted(SurHandle handle);

/// @brief Get the parsed document as JSON.
/// @param handle Sur handle
/// @param pretty Non-zero for indented output
/// @return Text (must be freed with sur_free_text), or NULL without a document
SurText* sur_get_json(SurHandle handle, int pretty);

/// @brief Free text returned by sur_get_formatted or sur_get_json.
/// @param text Pointer to free
void sur_free_text(SurText* text);

/// @brief Get parse summary.
/// @param handle Sur handle
/// @return Pointer owned by the handle (valid until next call, do not free), NULL without a handle
SurInfo* sur_get_info(SurHandle handle);

// ============================================================================
// Error Handling
// ============================================================================

/// @brief Get error message for error code.
/// @param error Error code
/// @return Error message (static, do not free)
const char* sur_error_string(SurError error);

// ============================================================================
// Utilities
// ============================================================================

/// @brief Get library version string.
/// @return Version (e.g., "0.1.0")
const char* sur_version(void);

#ifdef __cplusplus
}
#endif

#endif  // SUR_C_H
