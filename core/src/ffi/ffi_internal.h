// ffi_internal.h — Internal shared declarations for FFI implementation

#ifndef FFI_INTERNAL_H
#define FFI_INTERNAL_H

#include "thinkara/thinkara_c.h"
#include "thinkara/ContentPipeline.h"
#include <memory>
#include <string>
#include <cstring>

#ifdef _WIN32
    #define tk_strdup _strdup
#else
    #define tk_strdup strdup
#endif

// Thread-local error state
extern thread_local TKError g_lastError;
extern thread_local std::string g_lastErrorMessage;

// Note: default argument only in declaration, not in definition
void setLastError(TKError error, const std::string& message = "");
inline void clearLastError() { setLastError(TK_OK); }

// String allocation (defined in thinkara_c.cpp)
char* alloc_string(const std::string& str);

/// Хендл конвейера для C API
struct PipelineHolder {
    std::unique_ptr<Thinkara::ContentPipeline> pipeline;
};

#endif // FFI_INTERNAL_H
