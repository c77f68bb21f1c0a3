// This file is part of Ecaline.
// See docs/License.html for the copyright notice.

#include "minitest.h"
#include "perfmonitor.h"
#include <math.h>

// feed n frames of the given duration; returns how many asked to demote
static int feed(perfmonitor &m, int n, double duration, double &clock) {
   int demotes = 0 ;
   for (int i=0; i<n; i++) {
      clock += duration ;
      demotes += m.record(clock, duration) ;
   }
   return demotes ;
}

static ecaprefs monitorprefs(int sustain) {
   ecaprefs p ;
   p.fps_window = 60 ;
   p.fps_check_interval = 30 ;
   p.fps_sustain_checks = sustain ;
   p.compute_min_fps = 20 ;
   p.raster_min_fps = 25 ;
   return p ;
}

static void testsinglesignal() {
   perfmonitor m ;
   m.setoptions(monitorprefs(1)) ;
   m.reset(TIER_COMPUTE) ;
   double clock = 0 ;
   // 10 fps against a 20 fps threshold
   CHECK_EQ(feed(m, 29, 0.1, clock), 0) ;
   CHECK_EQ(feed(m, 1, 0.1, clock), 1) ;
   CHECK_EQ(m.inbreach(), 1) ;
   CHECK_EQ(feed(m, 270, 0.1, clock), 0) ;
   CHECK_EQ(m.getsignals(), 1) ;
   CHECK(fabs(m.getfps() - 10) < 1e-6) ;

   // recover at 100 fps; the breach ends once the window is fast
   CHECK_EQ(feed(m, 120, 0.01, clock), 0) ;
   CHECK_EQ(m.inbreach(), 0) ;
   // a new breach signals again
   CHECK_EQ(feed(m, 300, 0.1, clock), 1) ;
   CHECK_EQ(m.getsignals(), 2) ;
}

static void testsustain() {
   perfmonitor m ;
   m.setoptions(monitorprefs(3)) ;
   m.reset(TIER_RASTER) ;
   double clock = 0 ;
   CHECK_EQ(feed(m, 89, 0.1, clock), 0) ;
   CHECK_EQ(m.inbreach(), 0) ;
   CHECK_EQ(feed(m, 1, 0.1, clock), 1) ;
   CHECK_EQ(feed(m, 200, 0.1, clock), 0) ;
   // one passing check in between restarts the count
   ecaprefs p = monitorprefs(3) ;
   p.fps_window = 30 ;
   perfmonitor n ;
   n.setoptions(p) ;
   n.reset(TIER_RASTER) ;
   CHECK_EQ(feed(n, 60, 0.1, clock), 0) ;
   CHECK_EQ(feed(n, 30, 0.001, clock), 0) ;
   CHECK_EQ(feed(n, 60, 0.1, clock), 0) ;
   CHECK_EQ(feed(n, 30, 0.1, clock), 1) ;
}

static void testcpuneversignals() {
   perfmonitor m ;
   m.setoptions(monitorprefs(1)) ;
   m.reset(TIER_CPU) ;
   double clock = 0 ;
   CHECK_EQ(feed(m, 600, 1.0, clock), 0) ;
   CHECK_EQ(m.getsignals(), 0) ;
   CHECK(m.getthreshold(TIER_CPU) == 0) ;
   // a zero threshold disables a gpu tier too
   m.setthreshold(TIER_COMPUTE, 0) ;
   m.reset(TIER_COMPUTE) ;
   CHECK_EQ(feed(m, 600, 1.0, clock), 0) ;
}

static void testwindow() {
   ecaprefs p = monitorprefs(1) ;
   p.fps_window = 4 ;
   perfmonitor m ;
   m.setoptions(p) ;
   m.reset(TIER_COMPUTE) ;
   CHECK(m.getfps() == 0) ;
   double clock = 0 ;
   feed(m, 10, 1.0, clock) ;
   CHECK_EQ(m.getsamples(), 4) ;
   feed(m, 4, 0.05, clock) ;
   CHECK(fabs(m.getfps() - 20) < 1e-6) ;
   m.reset(TIER_COMPUTE) ;
   CHECK_EQ(m.getsamples(), 0) ;
   CHECK_EQ(m.inbreach(), 0) ;
   CHECK(m.getthreshold(TIER_RASTER) == 25) ;
   CHECK(m.getthreshold(TIER_NONE) == 0) ;
}

static void testnodrift() {
   perfmonitor m ;
   ecaprefs p = monitorprefs(1) ;
   p.fps_window = 4 ;
   p.fps_check_interval = 1000 ;
   m.setoptions(p) ;
   m.reset(TIER_COMPUTE) ;
   double clock = 0 ;
   // huge stalls leave the window, then only 100 fps frames remain
   for (int round=0; round<1000; round++) {
      feed(m, 4, 1e9 + round * 0.37, clock) ;
      feed(m, 4, 0.01, clock) ;
      CHECK(fabs(m.getfps() - 100) < 1e-9) ;
   }
   feed(m, 4, 1e9, clock) ;
   feed(m, 4, 0, clock) ;
   CHECK_EQ(m.getfps(), 0) ;
}

static void testreset() {
   perfmonitor m ;
   m.setoptions(monitorprefs(1)) ;
   m.reset(TIER_COMPUTE) ;
   double clock = 0 ;
   CHECK_EQ(feed(m, 30, 0.1, clock), 1) ;
   // a new tier starts with a clean slate and may signal again
   m.reset(TIER_RASTER) ;
   CHECK_EQ(m.inbreach(), 0) ;
   CHECK_EQ(feed(m, 30, 0.1, clock), 1) ;
   CHECK_EQ(m.getsignals(), 2) ;
}

int main() {
   captureerrors errors ;
   ecaerrors::seterrorhandler(&errors) ;
   testsinglesignal() ;
   testsustain() ;
   testcpuneversignals() ;
   testwindow() ;
   testnodrift() ;
   testreset() ;
   ecaerrors::seterrorhandler(0) ;
   return minitest_report("minitest_perfmonitor") ;
}
