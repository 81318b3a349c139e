#pragma once
#include <cstdint>

#if defined(_WIN32)
  #define AZULA_API __declspec(dllexport)
#else
  #define AZULA_API __attribute__((visibility("default")))
#endif

extern "C" {
  // 0 on success with *out_json = {"tokens": [...], "diagnostics": [...]}.
  // 1 bad arguments, 2 allocation failure, 3 internal error (*out_error set).
  // Strings returned through out parameters must be released with azula_free.
  AZULA_API int azula_tokenize(const char* source_utf8, const char* file_utf8, char** out_json, char** out_error);
  // *out_json = {"diagnostics": [...]}. Returns 4 when the source has lexical errors.
  AZULA_API int azula_check_source(const char* source_utf8, const char* file_utf8, char** out_json, char** out_error);
  AZULA_API void azula_free(char* ptr);
}
