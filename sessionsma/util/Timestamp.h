#pragma once

#include <chrono>

// fractional seconds since the Unix epoch
using Timestamp = std::chrono::duration<double>;
