#pragma once

// Tracy instrumentation for the frame loop. Without TRACY_ENABLE every macro is a no-op.
//
//   KILN_PROFILE_FRAME("Frame")            - frame boundary, once per presented tick
//   KILN_PROFILE_FUNCTION()                - zone covering the enclosing function
//   KILN_PROFILE_SCOPE("Dispatch")         - named zone
//   KILN_PROFILE_VALUE("free_slots", n)    - plotted value

// NOLINTBEGIN(cppcoreguidelines-macro-usage)

#ifdef TRACY_ENABLE

#include <tracy/Tracy.hpp>

#define KILN_PROFILE_FRAME(name) FrameMarkNamed(name)
#define KILN_PROFILE_FUNCTION() ZoneScoped
#define KILN_PROFILE_SCOPE(name) ZoneScopedN(name)
#define KILN_PROFILE_VALUE(name, value) TracyPlot(name, static_cast<int64_t>(value))

#else // !TRACY_ENABLE

#define KILN_PROFILE_FRAME(name) (void)0
#define KILN_PROFILE_FUNCTION() (void)0
#define KILN_PROFILE_SCOPE(name) (void)0
#define KILN_PROFILE_VALUE(name, value) (void)0

#endif // TRACY_ENABLE

// NOLINTEND(cppcoreguidelines-macro-usage)
