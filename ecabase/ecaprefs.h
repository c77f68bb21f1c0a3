// This file is part of Ecaline.
// See docs/License.html for the copyright notice.

#ifndef _ECAPREFS_H_
#define _ECAPREFS_H_

#include <stdio.h>      // for FILE

// Tunable settings for the engine, the backend selector and the perf
// monitor.  Every field has a default; setpref() parses and clamps
// "keyword=value" strings the same way the GUI preferences are read.

enum render_style_t {
    STYLE_BACKGROUND = 0,   // faint full-page backdrop
    STYLE_HEADER            // brighter header with breathing alpha
};

struct ecaprefs {
    ecaprefs();

    // returns NULL on success, otherwise an error message
    const char* setpref(const char* keyword, const char* value);
    // accepts a single "keyword=value" string
    const char* setpref(const char* line);
    // writes every setting as a keyword=value line
    void writeprefs(FILE* f) const;

    int rule;                   // Wolfram rule id (0..255)
    int grid_width;             // cells per generation (0 gives an idle engine)
    int generation_count;       // rows in a bounded run
    int cell_size;              // pixels per cell
    int interval_ms;            // minimum time between advances
    int first_tier;             // highest tier to probe (TIER_COMPUTE etc)
    double compute_min_fps;     // demote compute below this average
    double raster_min_fps;      // demote raster below this average
    int fps_window;             // samples in the rolling window
    int fps_check_interval;     // ticks between threshold checks
    int fps_sustain_checks;     // consecutive failed checks before demoting
    int probe_attempts;         // pollinit calls before giving up on a tier
    int probe_interval_ms;      // sleep between probe attempts
    int readback_timeout_ms;    // compute readback deadline
    int workgroup_size;         // compute local size
    int max_grid_width;         // upper limit for any backend
    int render_style;           // STYLE_BACKGROUND or STYLE_HEADER
    bool auto_cycle;            // pick a new rule after each completed run?
    int cycle_delay_ms;         // pause before cycling to the next rule
    bool verbose;               // periodic status lines
};

const int PREF_LINE_SIZE = 256;     // max length of a keyword=value string

#endif
