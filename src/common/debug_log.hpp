#pragma once

#include <iostream>

#ifndef NDEBUG
    #define NOISELINK_LOG(x) std::cout << "[noiselink] " << x
    #define NOISELINK_LOG_ENDL std::endl
#else
    #define NOISELINK_LOG(x) ((void)0)
    #define NOISELINK_LOG_ENDL ((void)0)
#endif

// Failures are reported in every build type.
#define NOISELINK_ERROR(x) (std::cerr << "[noiselink] " << x << std::endl)
