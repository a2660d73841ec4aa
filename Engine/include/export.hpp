#pragma once

// Static builds define ROSETTA_STATIC; shared builds define ROSETTA_EXPORT
// while compiling the library itself.
#if defined(ROSETTA_STATIC)
    #define ROSETTA_API
#elif defined(_WIN32)
    #if defined(ROSETTA_EXPORT)
        #define ROSETTA_API __declspec(dllexport)
    #else
        #define ROSETTA_API __declspec(dllimport)
    #endif
#else
    #define ROSETTA_API __attribute__((visibility("default")))
#endif
