// Wall-clock types shared by timed gameplay (dungeon rooms, expeditions).
#pragma once

#include <chrono>

namespace Engine {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

inline TimePoint addSeconds(TimePoint t, double seconds) {
    return t + std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(seconds));
}

inline double secondsBetween(TimePoint from, TimePoint to) {
    return std::chrono::duration<double>(to - from).count();
}

}  // namespace Engine
