#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

using Key = uint32_t *;

void AtomicWait(std::atomic<uint32_t> &atomic, uint32_t value);

// Returns false if the timeout expired before a wake up
bool AtomicWaitFor(std::atomic<uint32_t> &atomic, uint32_t value,
                   std::chrono::nanoseconds timeout);

Key AtomicAddr(std::atomic<uint32_t> &atomic);

void AtomicWakeOne(Key key);

void AtomicWakeAll(Key key);
