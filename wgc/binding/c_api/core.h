#pragma once

// =============================================================================
// FILE: wgc/binding/c_api/core.h
// BRIEF: Shared C ABI types, error codes and last-error access
// =============================================================================
//
// Entry points return a wgc_error_t. A failing call leaves its code and a
// message in per-thread storage; the next successful call on that thread
// clears them. Codes match wgc::ErrorCode one to one.
// =============================================================================

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

#if defined(__GNUC__) || defined(__clang__)
    #define WGC_C_EXPORT __attribute__((visibility("default")))
#else
    #define WGC_C_EXPORT
#endif

typedef size_t wgc_size_t;
typedef int wgc_bool_t;

#define WGC_FALSE 0
#define WGC_TRUE 1

typedef int32_t wgc_error_t;

#define WGC_OK                        0
#define WGC_ERROR_UNKNOWN             1
#define WGC_ERROR_INTERNAL            2
#define WGC_ERROR_OUT_OF_MEMORY       3
#define WGC_ERROR_NULL_POINTER        4
#define WGC_ERROR_INVALID_ARGUMENT    10
#define WGC_ERROR_DIMENSION_MISMATCH  11
#define WGC_ERROR_RANGE_ERROR         13
#define WGC_ERROR_IO_ERROR            30
#define WGC_ERROR_FILE_NOT_FOUND      31
#define WGC_ERROR_READ_ERROR          33
#define WGC_ERROR_WRITE_ERROR         34
#define WGC_ERROR_OVERFLOW            52
#define WGC_ERROR_MALFORMED_EDGE      60
#define WGC_ERROR_UNKNOWN_NODE        61
#define WGC_ERROR_INCOMPLETE_RUN      70
#define WGC_ERROR_CHECKPOINT_MISMATCH 71

/* "major.minor.patch" of the linked library */
WGC_C_EXPORT const char* wgc_get_version(void);

/* Message of the last failed call on this thread, "No error" if none */
WGC_C_EXPORT const char* wgc_get_last_error(void);
WGC_C_EXPORT wgc_error_t wgc_get_last_error_code(void);
WGC_C_EXPORT void wgc_clear_error(void);

#ifdef __cplusplus
}
#endif
