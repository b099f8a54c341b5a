#pragma once

#ifdef _WIN32
    #ifdef THINKARA_EXPORTS
        #define TK_API __declspec(dllexport)
    #else
        #define TK_API __declspec(dllimport)
    #endif
#else
    #define TK_API __attribute__((visibility("default")))
#endif
