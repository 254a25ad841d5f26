#ifndef CIMAP_API_H
#define CIMAP_API_H

#ifdef _WIN32
    #define CIMAP_API_EXPORT __declspec(dllexport)
    #define CIMAP_API_IMPORT __declspec(dllimport)
#else
    #define CIMAP_API_EXPORT __attribute__((visibility("default")))
    #define CIMAP_API_IMPORT __attribute__((visibility("default")))
#endif // _WIN32

#ifdef CIMAP_BUILD
    #define CIMAP_API CIMAP_API_EXPORT
#else
    #define CIMAP_API CIMAP_API_IMPORT
#endif

#if defined(_MSC_VER)
    #define CIMAP_FORCEINLINE __forceinline
#else
    #define CIMAP_FORCEINLINE inline __attribute__((always_inline))
#endif

#endif // CIMAP_API_H
