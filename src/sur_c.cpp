// Implementation of C API for WASM and FFI bindings.

#include "sur_c.h"

#include <cstdlib>
#include <cstring>
#include <string>
#include <string_view>
#include <vector>

#include "core/version_info.h"
#include "notation/document_json.h"
#include "notation/document_parser.h"
#include "notation/formatter.h"
#include "notation/notation_types.h"
#include "notation/parse_warning.h"
#include "notation/validator.h"

namespace {

/// @brief Internal state held per SurHandle.
struct SurInstance {
  sur::Document document;
  std::vector<sur::ParseWarning> warnings;
  std::string last_message;
  SurInfo info = {};
  bool has_document = false;
};

/// @brief Copy a string into a malloc'd SurText.
SurText* makeText(const std::string& str) {
  auto* result = static_cast<SurText*>(malloc(sizeof(SurText)));
  if (!result) return nullptr;

  result->length = str.size();
  result->text = static_cast<char*>(malloc(result->length + 1));
  if (!result->text) {
    free(result);
    return nullptr;
  }

  memcpy(result->text, str.c_str(), result->length + 1);
  return result;
}

}  // namespace

extern "C" {

// ============================================================================
// Lifecycle
// ============================================================================

SurHandle sur_create(void) {
  return new SurInstance();
}

void sur_destroy(SurHandle handle) {
  delete static_cast<SurInstance*>(handle);
}

// ============================================================================
// Parsing
// ============================================================================

SurError sur_parse(SurHandle handle, const char* text, size_t length) {
  if (!handle || (!text && length > 0)) {
    return SUR_ERROR_INVALID_PARAM;
  }

  auto* instance = static_cast<SurInstance*>(handle);
  instance->warnings.clear();
  std::string_view input = text ? std::string_view(text, length) : std::string_view();
  instance->document = sur::parse(input, instance->warnings);
  instance->has_document = true;

  instance->last_message.clear();
  for (const auto& warning : instance->warnings) {
    if (!instance->last_message.empty()) instance->last_message += '\n';
    instance->last_message += sur::describeWarning(warning);
  }
  return SUR_OK;
}

SurError sur_validate(SurHandle handle) {
  if (!handle) return SUR_ERROR_INVALID_PARAM;
  auto* instance = static_cast<SurInstance*>(handle);
  if (!instance->has_document) return SUR_ERROR_NO_DOCUMENT;

  sur::ValidationResult result = sur::checkDocument(instance->document);
  if (!result.success) {
    instance->last_message = result.error_message;
    return SUR_ERROR_VALIDATION_FAILED;
  }
  instance->last_message.clear();
  return SUR_OK;
}

const char* sur_last_message(SurHandle handle) {
  if (!handle) return "";
  return static_cast<SurInstance*>(handle)->last_message.c_str();
}

// ============================================================================
// Output Retrieval
// ============================================================================

SurText* sur_get_formatted(SurHandle handle) {
  if (!handle) return nullptr;
  auto* instance = static_cast<SurInstance*>(handle);
  if (!instance->has_document) return nullptr;
  return makeText(sur::format(instance->document));
}

SurText* sur_get_json(SurHandle handle, int pretty) {
  if (!handle) return nullptr;
  auto* instance = static_cast<SurInstance*>(handle);
  if (!instance->has_document) return nullptr;
  return makeText(sur::documentToJson(instance->document, pretty != 0));
}

void sur_free_text(SurText* text) {
  if (text) {
    free(text->text);
    free(text);
  }
}

SurInfo* sur_get_info(SurHandle handle) {
  if (!handle) return nullptr;

  auto* instance = static_cast<SurInstance*>(handle);
  instance->info = {};
  if (!instance->has_document) return &instance->info;

  instance->info.section_count =
      static_cast<uint32_t>(instance->document.composition.sections.size());
  instance->info.beat_count = static_cast<uint32_t>(instance->document.beatCount());
  instance->info.warning_count = static_cast<uint32_t>(instance->warnings.size());
  return &instance->info;
}

// ============================================================================
// Error Handling
// ============================================================================

const char* sur_error_string(SurError error) {
  switch (error) {
    case SUR_OK: return "No error";
    case SUR_ERROR_INVALID_PARAM: return "Invalid parameter";
    case SUR_ERROR_NO_DOCUMENT: return "No document parsed";
    case SUR_ERROR_VALIDATION_FAILED: return "Validation failed";
  }
  return "Unknown error";
}

// ============================================================================
// Utilities
// ============================================================================

const char* sur_version(void) {
  return SUR_VERSION;
}

}  // extern "C"
