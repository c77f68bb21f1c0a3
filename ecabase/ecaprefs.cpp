// This file is part of Ecaline.
// See docs/License.html for the copyright notice.

#include <stdlib.h>     // for strtol, strtod
#include <string.h>     // for strcmp, strchr, strncpy

#include "ecaprefs.h"
#include "ecarules.h"       // for parserule
#include "ecabackend.h"     // for tierfromname, tiername

// -----------------------------------------------------------------------------

ecaprefs::ecaprefs()
{
    rule = 30;
    grid_width = 101;
    generation_count = 50;
    cell_size = 3;
    interval_ms = 200;
    first_tier = TIER_COMPUTE;
    compute_min_fps = 20.0;
    raster_min_fps = 25.0;
    fps_window = 60;
    fps_check_interval = 30;
    fps_sustain_checks = 1;
    probe_attempts = 50;
    probe_interval_ms = 100;
    readback_timeout_ms = 2000;
    workgroup_size = 64;
    max_grid_width = 1048576;
    render_style = STYLE_BACKGROUND;
    auto_cycle = false;
    cycle_delay_ms = 1800;
    verbose = false;
}

// -----------------------------------------------------------------------------

static const char* GetInt(const char* value, int* result, int minval, int maxval)
{
    char* end;
    long n = strtol(value, &end, 10);
    if (end == value) return "Value must be an integer.";
    while (*end == ' ' || *end == '\t') end++;
    if (*end != 0) return "Value must be an integer.";
    if (n < minval) n = minval;
    if (n > maxval) n = maxval;
    *result = (int)n;
    return NULL;
}

// -----------------------------------------------------------------------------

static const char* GetDouble(const char* value, double* result, double minval, double maxval)
{
    char* end;
    double d = strtod(value, &end);
    if (end == value) return "Value must be a number.";
    while (*end == ' ' || *end == '\t') end++;
    if (*end != 0) return "Value must be a number.";
    if (d < minval) d = minval;
    if (d > maxval) d = maxval;
    *result = d;
    return NULL;
}

// -----------------------------------------------------------------------------

static const char* GetBool(const char* value, bool* result)
{
    if (strcmp(value, "1") == 0 || strcmp(value, "true") == 0) {
        *result = true;
    } else if (strcmp(value, "0") == 0 || strcmp(value, "false") == 0) {
        *result = false;
    } else {
        return "Value must be 0 or 1.";
    }
    return NULL;
}

// -----------------------------------------------------------------------------

const char* ecaprefs::setpref(const char* keyword, const char* value)
{
    if (keyword == NULL || value == NULL) return "Missing keyword or value.";

    if (strcmp(keyword, "rule") == 0) {
        int r;
        const char* err = parserule(value, r);
        if (err) return err;
        rule = r;

    } else if (strcmp(keyword, "grid_width") == 0) {
        return GetInt(value, &grid_width, 0, max_grid_width);

    } else if (strcmp(keyword, "generation_count") == 0) {
        return GetInt(value, &generation_count, 1, 100000);

    } else if (strcmp(keyword, "cell_size") == 0) {
        return GetInt(value, &cell_size, 1, 64);

    } else if (strcmp(keyword, "interval_ms") == 0) {
        return GetInt(value, &interval_ms, 0, 5000);

    } else if (strcmp(keyword, "first_tier") == 0) {
        int t = tierfromname(value);
        if (t == TIER_NONE) return "Tier must be compute, raster or cpu.";
        first_tier = t;

    } else if (strcmp(keyword, "compute_min_fps") == 0) {
        return GetDouble(value, &compute_min_fps, 0.0, 1000.0);

    } else if (strcmp(keyword, "raster_min_fps") == 0) {
        return GetDouble(value, &raster_min_fps, 0.0, 1000.0);

    } else if (strcmp(keyword, "fps_window") == 0) {
        return GetInt(value, &fps_window, 1, 1000);

    } else if (strcmp(keyword, "fps_check_interval") == 0) {
        return GetInt(value, &fps_check_interval, 1, 1000);

    } else if (strcmp(keyword, "fps_sustain_checks") == 0) {
        return GetInt(value, &fps_sustain_checks, 1, 100);

    } else if (strcmp(keyword, "probe_attempts") == 0) {
        return GetInt(value, &probe_attempts, 1, 1000);

    } else if (strcmp(keyword, "probe_interval_ms") == 0) {
        return GetInt(value, &probe_interval_ms, 0, 5000);

    } else if (strcmp(keyword, "readback_timeout_ms") == 0) {
        return GetInt(value, &readback_timeout_ms, 1, 60000);

    } else if (strcmp(keyword, "workgroup_size") == 0) {
        return GetInt(value, &workgroup_size, 1, 1024);

    } else if (strcmp(keyword, "max_grid_width") == 0) {
        const char* err = GetInt(value, &max_grid_width, 1, 16777216);
        if (err) return err;
        if (grid_width > max_grid_width) grid_width = max_grid_width;

    } else if (strcmp(keyword, "render_style") == 0) {
        if (strcmp(value, "background") == 0) {
            render_style = STYLE_BACKGROUND;
        } else if (strcmp(value, "header") == 0) {
            render_style = STYLE_HEADER;
        } else {
            return "Style must be background or header.";
        }

    } else if (strcmp(keyword, "auto_cycle") == 0) {
        return GetBool(value, &auto_cycle);

    } else if (strcmp(keyword, "cycle_delay_ms") == 0) {
        return GetInt(value, &cycle_delay_ms, 0, 60000);

    } else if (strcmp(keyword, "verbose") == 0) {
        return GetBool(value, &verbose);

    } else {
        return "Unknown keyword.";
    }
    return NULL;
}

// -----------------------------------------------------------------------------

const char* ecaprefs::setpref(const char* line)
{
    if (line == NULL) return "Missing keyword=value.";

    // split a private copy at the first '=' like GetKeywordAndValue does
    char buf[PREF_LINE_SIZE];
    strncpy(buf, line, PREF_LINE_SIZE - 1);
    buf[PREF_LINE_SIZE - 1] = 0;
    char* keyword = buf;
    char* value = strchr(buf, '=');
    if (value == NULL) return "Expected keyword=value.";
    *value = 0;
    value += 1;

    // ignore trailing CR/LF so lines read from scripts work as is
    char* p = value + strlen(value);
    while (p > value && (p[-1] == '\n' || p[-1] == '\r')) *--p = 0;

    return setpref(keyword, value);
}

// -----------------------------------------------------------------------------

void ecaprefs::writeprefs(FILE* f) const
{
    fprintf(f, "rule=%d\n", rule);
    fprintf(f, "grid_width=%d\n", grid_width);
    fprintf(f, "generation_count=%d\n", generation_count);
    fprintf(f, "cell_size=%d\n", cell_size);
    fprintf(f, "interval_ms=%d\n", interval_ms);
    fprintf(f, "first_tier=%s\n", tiername(first_tier));
    fprintf(f, "compute_min_fps=%g\n", compute_min_fps);
    fprintf(f, "raster_min_fps=%g\n", raster_min_fps);
    fprintf(f, "fps_window=%d\n", fps_window);
    fprintf(f, "fps_check_interval=%d\n", fps_check_interval);
    fprintf(f, "fps_sustain_checks=%d\n", fps_sustain_checks);
    fprintf(f, "probe_attempts=%d\n", probe_attempts);
    fprintf(f, "probe_interval_ms=%d\n", probe_interval_ms);
    fprintf(f, "readback_timeout_ms=%d\n", readback_timeout_ms);
    fprintf(f, "workgroup_size=%d\n", workgroup_size);
    fprintf(f, "max_grid_width=%d\n", max_grid_width);
    fprintf(f, "render_style=%s\n", render_style == STYLE_HEADER ? "header" : "background");
    fprintf(f, "auto_cycle=%d\n", auto_cycle ? 1 : 0);
    fprintf(f, "cycle_delay_ms=%d\n", cycle_delay_ms);
    fprintf(f, "verbose=%d\n", verbose ? 1 : 0);
}
