#pragma once

#include <iostream>

// Debug tracing for the planner stages.
// Configure with -DDIRACROUTE_DEBUG_LOG=ON (defines DEBUG=1) to enable it.
#if DEBUG
    #define DBG(x) do { std::cerr << "[diracroute] " << x << std::endl; } while (0)
    #define DBG_NOENDL(x) do { std::cerr << x; } while (0)
#else
    #define DBG(x) do {} while (0)
    #define DBG_NOENDL(x) do {} while (0)
#endif
