// This file is part of Ecaline.
// See docs/License.html for the copyright notice.

#include "perfmonitor.h"
#include "ecaprefs.h"
#include "util.h"
#include <stdio.h>

perfmonitor::perfmonitor() {
   ecaprefs defaults ;
   tier = TIER_NONE ;
   signals = 0 ;
   lastreport = 0 ;
   /*
    *   How frequently do we write the status line?  Every two seconds
    *   should be reasonable.  Zero disables it.
    */
   reportInterval = 2 ;
   for (int t=0; t<NUMTIERS; t++)
      thresholds[t] = 0 ;
   setoptions(defaults) ;
}

void perfmonitor::setoptions(const ecaprefs &prefs) {
   window.assign(prefs.fps_window, perfsample()) ;
   checkinterval = prefs.fps_check_interval ;
   sustain = prefs.fps_sustain_checks ;
   thresholds[TIER_CPU] = 0 ;
   thresholds[TIER_RASTER] = prefs.raster_min_fps ;
   thresholds[TIER_COMPUTE] = prefs.compute_min_fps ;
   reset(tier) ;
}

void perfmonitor::setthreshold(int t, double minfps) {
   if (t >= 0 && t < NUMTIERS)
      thresholds[t] = minfps ;
}

double perfmonitor::getthreshold(int t) const {
   if (t < 0 || t >= NUMTIERS)
      return 0 ;
   return thresholds[t] ;
}

void perfmonitor::reset(int newtier) {
   tier = newtier ;
   next = 0 ;
   count = 0 ;
   total = 0 ;
   ticks = 0 ;
   failedchecks = 0 ;
   breach = 0 ;
}

double perfmonitor::getfps() const {
   if (count == 0 || total <= 0)
      return 0 ;
   return count / total ;
}

int perfmonitor::record(double timestamp, double duration) {
   if (duration < 0)
      duration = 0 ;
   int size = (int)window.size() ;
   if (count < size)
      count++ ;
   window[next].timestamp = timestamp ;
   window[next].duration = duration ;
   next = (next + 1) % size ;
   // summed afresh so a long session cannot drift away from the window
   total = 0 ;
   for (int i=0; i<count; i++)
      total += window[i].duration ;
   if (++ticks % checkinterval != 0)
      return 0 ;
   return check() ;
}

int perfmonitor::check() {
   double threshold = getthreshold(tier) ;
   // no threshold (the cpu tier) or no measurable time yet
   if (threshold <= 0 || total <= 0)
      return 0 ;
   if (getfps() >= threshold) {
      failedchecks = 0 ;
      breach = 0 ;
      return 0 ;
   }
   if (breach)
      return 0 ;
   if (++failedchecks < sustain)
      return 0 ;
   breach = 1 ;
   signals++ ;
   ecastatusf("PERF %s average %.1f fps is below %g over %d frames",
              tiername(tier), getfps(), threshold, count) ;
   return 1 ;
}

void perfmonitor::report(int verbose) {
   double ts = ecaSecondCount() ;
   if (reportInterval == 0 || ts - lastreport < reportInterval)
      return ;
   lastreport = ts ;
   if (verbose)
      ecastatusf("PERF tier %s fps %.1f samples %d", tiername(tier), getfps(), count) ;
}
