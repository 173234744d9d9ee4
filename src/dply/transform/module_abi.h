#pragma once

#include <stddef.h>

/*
 * Binary interface of transform modules that are loaded from shared objects.
 *
 * A transform module exports one or both of:
 *
 *     DPLY_MODULE_API int dply_transform_data(const dply_transform_args*);
 *     DPLY_MODULE_API int dply_restore_data(const dply_transform_args*);
 *
 * The function writes its result through `emit` (which may be called more than once; the
 * pieces are concatenated) and returns zero. On failure it returns nonzero and may write a
 * NUL-terminated message into `error_buf`.
 */

#if defined(_WIN32)
#define DPLY_MODULE_EXPORT __declspec(dllexport)
#else
#define DPLY_MODULE_EXPORT __attribute__((visibility("default")))
#endif

#if defined(__cplusplus)
#define DPLY_MODULE_EXTERN extern "C"
#else
#define DPLY_MODULE_EXTERN
#endif

#define DPLY_MODULE_API DPLY_MODULE_EXTERN DPLY_MODULE_EXPORT

#define DPLY_TRANSFORM_ABI_VERSION 1

#if defined(__cplusplus)
extern "C" {
#endif

typedef void (*dply_emit_fn)(void* sink, const char* data, size_t size);

typedef struct dply_transform_args {
    unsigned abi_version;
    /// The bytes to transform
    const char* data;
    size_t      size;
    /// The target's transformer options, serialized as a YAML document. Never NULL.
    const char* options_yaml;

    void*        sink;
    dply_emit_fn emit;

    char*  error_buf;
    size_t error_buf_size;
} dply_transform_args;

typedef int (*dply_transform_fn)(const dply_transform_args*);

#if defined(__cplusplus)
}
#endif
