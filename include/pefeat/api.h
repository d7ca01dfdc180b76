#pragma once

#include <stddef.h>

#if defined(_WIN32)
  #if defined(PEFEAT_BUILD_DLL)
    #define PEFEAT_API __declspec(dllexport)
  #else
    #define PEFEAT_API __declspec(dllimport)
  #endif
#else
  #define PEFEAT_API
#endif

#if defined(_WIN32)
  #define PEFEAT_CALL __cdecl
#else
  #define PEFEAT_CALL
#endif

#ifdef __cplusplus
extern "C" {
#endif

typedef struct pefeat_handle pefeat_handle;

// Zero fields take PEFEAT_FEATURE_VERSION / PEFEAT_ENTROPY_WINDOW /
// PEFEAT_ENTROPY_STEP from the environment, then the built-in defaults.
typedef struct pefeat_config {
  int feature_version;
  unsigned int entropy_window;
  unsigned int entropy_step;
  int print_feature_warning; // < 0: default (on)
} pefeat_config;

typedef enum pefeat_status {
  PEFEAT_OK = 0,
  PEFEAT_ERR_INVALID_ARGUMENT = -1,
  PEFEAT_ERR_BAD_RECORD = -2,
  PEFEAT_ERR_BUFFER_TOO_SMALL = -3,
  PEFEAT_ERR_OOM = -100
} pefeat_status;

// Returns NULL on an unsupported version or invalid configuration.
// A NULL config means all defaults.
PEFEAT_API pefeat_handle* PEFEAT_CALL pefeat_create(const pefeat_config* config);
PEFEAT_API void PEFEAT_CALL pefeat_destroy(pefeat_handle* handle);

PEFEAT_API size_t PEFEAT_CALL pefeat_dim(const pefeat_handle* handle);

// Raw record as a malloc'd JSON string; release with pefeat_free.
PEFEAT_API int PEFEAT_CALL pefeat_raw_features(
    const pefeat_handle* handle, const unsigned char* bytes, size_t len, char** out_json, size_t* out_len);

// `out` must hold at least pefeat_dim() floats.
PEFEAT_API int PEFEAT_CALL pefeat_feature_vector(
    const pefeat_handle* handle, const unsigned char* bytes, size_t len, float* out, size_t out_capacity);
PEFEAT_API int PEFEAT_CALL pefeat_process_raw_features(
    const pefeat_handle* handle, const char* raw_json, size_t raw_len, float* out, size_t out_capacity);

PEFEAT_API void PEFEAT_CALL pefeat_free(char* p);

// level: trace, debug, info, warn, error, critical, off. NULL reads
// PEFEAT_LOG_LEVEL, falling back to warn.
PEFEAT_API int PEFEAT_CALL pefeat_init_logging(const char* level);

#ifdef __cplusplus
}
#endif
