#pragma once
#include <cstdint>

// Milliseconds since process start (monotonic). Wraps after ~49 days;
// compare timestamps with unsigned subtraction only.
uint32_t millis();

// Sleeps the calling thread.
void delayMs(uint32_t ms);
