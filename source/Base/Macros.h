#pragma once

// Whether or not asserts are enabled
#ifndef NDEBUG
    #define ASSERTS_ENABLED 1
#endif

// Required includes for error handling
#include <cstdio>
#include <cstdlib>

// Namespace open and close helpers
#define BEGIN_NAMESPACE(Name) namespace Name {
#define END_NAMESPACE(Name) }

// Silence warnings about an unused variable or parameter
#define MARK_UNUSED(Variable) ((void) Variable)

// Regular assert without a message
#if ASSERTS_ENABLED == 1
    #define ASSERT(Condition)\
        do {\
            if (!(Condition)) {\
                std::printf("Assert failed! Condition: %s\n", #Condition);\
                std::abort();\
            }\
        } while (0)
#else
    #define ASSERT(Condition)
#endif

// Print a formatted message and abort: for errors the program has no way to recover from
#define FATAL_ERROR_F(MessageFormat, ...)\
    do {\
        std::printf(MessageFormat "\n", __VA_ARGS__);\
        std::abort();\
    } while (0)

// Used to decorate exception throwing C++ functions
#define THROWS noexcept(false)
