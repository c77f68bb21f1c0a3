// This file is part of Ecaline.
// See docs/License.html for the copyright notice.

/**
 *   The engine drives one animation session: it seeds the row, asks
 *   the selector for one generation per interval, keeps the history,
 *   composites each frame and feeds frame timings to the perf monitor.
 *   Everything runs on the caller's thread from tick().
 */
#ifndef ECAENGINE_H
#define ECAENGINE_H
#include "ecaprefs.h"
#include "ecarules.h"
#include "generation.h"
#include "backendselector.h"
#include "perfmonitor.h"
#include "framerender.h"
#include "ecarender.h"
#include <vector>

// rules picked from when auto_cycle is on
const int NUMCYCLERULES = 6 ;
extern const int cyclerules[NUMCYCLERULES] ;

class ecaengine {
public:
   ecaengine() ;
   ~ecaengine() ;
   // settings take effect at the next start(), except that a changed
   // rule or grid width restarts a running session as setrule() does
   void setprefs(const ecaprefs &p) ;
   const ecaprefs &getprefs() const { return prefs ; }
   void setpoll(ecapoll *pollerarg) ;
   // frames go to r; by default they go to an internal surfacerender
   void setrender(ecarender *r) ;
   // replace the backend creator for a tier (tests inject faults here)
   void setcreator(int tier, ecabackend *(*f)()) { selector.setcreator(tier, f) ; }
   /**
    *   Reset the session to the single seed row, probe the backends and
    *   draw row 0.  Returns BACKEND_OK, or the failing status if no
    *   backend could be started (the engine then stays idle).
    */
   int start() ;
   // stop the session and release the backend
   void stop() ;
   /**
    *   Call regularly with the current time in seconds.  Returns 1 if
    *   a new generation was added to the history.
    */
   int tick(double now) ;
   // produce the next generation now, waiting for the backend; returns
   // a status code
   int step() ;
   // these abandon any step in flight and restart the session
   const char *setrule(const char *s) ;
   const char *setrule(int ruleid) ;
   const char *setgridwidth(int width) ;
   int reset() ;
   // simulate a device loss of the active backend
   void forceloss() ;

   int isidle() const { return idle ; }
   int isdone() const { return done ; }
   int gettier() const { return selector.gettier() ; }
   const char *gettiername() const { return tiername(selector.gettier()) ; }
   double getfps() const { return monitor.getfps() ; }
   // index of the newest row; -1 when idle
   int getgeneration() const { return (int)history.size() - 1 ; }
   const std::vector<generation> &gethistory() const { return history ; }
   const ecarule &getrule() const { return rule ; }
   int getframes() const { return frames ; }
   surfacerender &getsurface() { return surface ; }
   backendselector &getselector() { return selector ; }
   perfmonitor &getmonitor() { return monitor ; }
private:
   int restart() ;
   int requestrestart() ;
   void deliver(const generation &g, double duration) ;
   void render() ;
   void pickcycle() ;

   ecaprefs prefs ;
   ecarule rule ;
   backendselector selector ;
   perfmonitor monitor ;
   framerender frame ;
   surfacerender surface ;
   ecarender *renderer ;
   ecapoll *poller ;
   std::vector<generation> history ;
   int idle ;
   int done ;
   int frames ;
   int restartpending ;
   double lastadvance ;
   double issued ;
   double cycleat ;
} ;
#endif
