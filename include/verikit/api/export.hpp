#pragma once

#if defined(_WIN32)
#if defined(VERIKIT_BUILD_DLL)
#define VERIKIT_API __declspec(dllexport)
#elif defined(VERIKIT_USE_DLL)
#define VERIKIT_API __declspec(dllimport)
#else
#define VERIKIT_API
#endif
#else
#define VERIKIT_API __attribute__((visibility("default")))
#endif
