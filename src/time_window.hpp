// time_window.hpp

#pragma once

#include <ctime>
#include <optional>

#include "config.hpp"
#include "sun_times.hpp"

// True when `now` (local time) falls inside the configured active window:
// an active weekday, within [active_start, active_end] inclusive, and, with
// astral gating, between sunrise and sunset. Missing sun times under astral
// gating count as outside the window. Pause is the caller's concern.
bool is_active(const std::tm& now, const ScheduleConfig& config, const std::optional<SunTimes>& sun);
