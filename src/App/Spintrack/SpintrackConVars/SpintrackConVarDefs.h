#ifndef SPINTRACK_CONVARDEFS_H
#define SPINTRACK_CONVARDEFS_H

// put spinner/gameplay convars in this file (NOT ConVarDefs.h)

// NOLINTBEGIN(misc-definitions-in-headers)

#define _CV(name) name

// defined and included at the end of SpintrackConVars.cpp
#if defined(DEFINE_SPINTRACK_CONVARS)
#undef CONVAR
#define CONVAR(name, ...) ConVar _CV(name)(#name __VA_OPT__(, ) __VA_ARGS__)

#include "BaseEnvironment.h"

#else
#define CONVAR(name, ...) extern ConVar _CV(name)
#endif

class ConVar;
namespace cv {

// Debug
CONVAR(debug_spinner, false, CLIENT, "log every tick, completion and judgement of spinners");

// Gameplay
CONVAR(spinner_min_rps_fudge, 0.6f, CLIENT | GAMEPLAY,
       "multiplier on the OD-derived spins per second a spinner requires");
CONVAR(spinner_max_rotations_per_second, 8.0f, CLIENT | GAMEPLAY,
       "spin rate used to compute how many bonus ticks a spinner has");
CONVAR(spinner_max_rpm, 477.0f, CLIENT | GAMEPLAY, "spins per minute cap of the disc");
CONVAR(spinner_tick_score, 100, CLIENT | GAMEPLAY, "score for each whole spin up to the requirement");
CONVAR(spinner_bonus_tick_score, 1100, CLIENT | GAMEPLAY, "score for each whole spin past the requirement");

// SpinnerSimulator
CONVAR(sim_spinner_start, 1000, CLIENT, "spinner start time in ms");
CONVAR(sim_spinner_duration, 3000, CLIENT, "spinner length in ms");
CONVAR(sim_spinner_od, 5.0f, CLIENT, "overall difficulty of the simulated map");
CONVAR(sim_spinner_rpm, 300.0f, CLIENT, "how fast the simulated cursor circles the spinner");
CONVAR(sim_frame_time, 1.0f / 60.0f, CLIENT, "seconds per simulated frame");
CONVAR(sim_autoplay, false, CLIENT, "let the disc spin by itself instead of simulating a cursor");
CONVAR(sim_speed_multiplier, 1.0f, CLIENT, "playback speed (only affects autoplay spinning)");
CONVAR(sim_release_at, -1, CLIENT, "let go of the keys at this time in ms (-1 = hold until the end)");
CONVAR(sim_rewind_at, -1, CLIENT, "seek back to the spinner start once this time in ms is reached (-1 = never)");

}  // namespace cv

// NOLINTEND(misc-definitions-in-headers)

#endif
