#pragma once

// Precompiled header for the executable and the testcases; `main.cpp` and every
// `*_tc.cpp` include it first. Library sources include `courier/utils/base-include.hpp`.

#include "courier/utils/base-include.hpp"
