#pragma once

#include <cstddef>
#include <string>

/// Per-frame numbers for the debug panel: stage timings plus how much session state the frame carried.
struct FramePerf
{
    float fps = 0.0f;
    float msPump = 0.0f;
    float msSimulate = 0.0f;
    float msRender = 0.0f;
    int drawCalls = 0;
    std::size_t remotes = 0;
    std::size_t collectibles = 0;
    std::size_t pendingTimers = 0;
    std::size_t lostEvents = 0;
    std::string connection;
    bool budgetExceeded = false;
    std::string budgetStage;
};
