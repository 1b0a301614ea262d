// Platform.h
#pragma once

#include <cstdint>

bool PlatformInit();        // runs at program start
void PlatformShutdown();    // cleanup
bool PlatformRunning();     // master loop condition
uint64_t PlatformTicks();   // milliseconds
