// This file is part of Ecaline.
// See docs/License.html for the copyright notice.

/**
 *   The selector owns the single active backend.  It probes the tiers
 *   from the configured first tier downwards, keeps the last generation
 *   the active backend produced, and on loss, timeout or a perf signal
 *   disposes the backend and seeds the next lower tier from that
 *   generation.  There is no automatic upgrade; only start() probes
 *   from the top again.
 */
#ifndef BACKENDSELECTOR_H
#define BACKENDSELECTOR_H
#include "ecabackend.h"
#include "ecaprefs.h"

class perfmonitor ;

/**
 *   Bounded wait for an asynchronous init: at most probe_attempts polls
 *   of pollinit(), probe_interval_ms apart.  An interrupt from the host
 *   also gives up.  Returns the final status; err explains a failure
 *   that the backend itself did not report.
 */
int waitforinit(ecabackend *b, const ecaprefs &prefs, ecapoll *poller, std::string &err) ;

enum {
   SELECTOR_UNINITIALIZED = 0,
   SELECTOR_PROBING,
   SELECTOR_ACTIVE
} ;

class backendselector {
public:
   backendselector() ;
   ~backendselector() ;
   void setoptions(const ecaprefs &prefs) ;
   void setpoll(ecapoll *pollerarg) { poller = pollerarg ; }
   // the monitor is reset whenever a new backend becomes active
   void setmonitor(perfmonitor *m) { monitor = m ; }
   // replace the creator for a tier; 0 restores the registered one
   void setcreator(int tier, ecabackend *(*f)()) ;
   /**
    *   Dispose any active backend and probe from the first tier down,
    *   seeding the winner with seed.  Returns BACKEND_OK, or the status
    *   of the last failed tier if none could be activated (for example
    *   INVALID_GRID_SIZE for a width of 0).
    */
   int start(int width, const generation &seed) ;
   // dispose the active backend; back to the uninitialized state
   void stop() ;
   /**
    *   Issue a step if none is in flight, then try to collect it.
    *   Returns BACKEND_OK with g holding the next generation, or
    *   BACKEND_PENDING.  Failures of the active backend are handled
    *   here by demotion; the step is replayed on the successor.
    */
   int advance(const ecarule &rule, generation &g) ;
   // like advance() but waits for the result; used by batch runs
   int step(const ecarule &rule, generation &g) ;
   // poll the active backend's health; returns 1 if it was demoted
   int checkhealth() ;
   // move to the next lower tier; returns the new tier
   int demote(const char *why) ;
   // drop the in-flight step, if any
   void abandon() ;

   int getstate() const { return state ; }
   int gettier() const { return tier ; }
   int getprobingtier() const { return probingtier ; }
   ecabackend *getbackend() { return active ; }
   const generation &getlast() const { return last ; }
   // generations delivered since start()
   int getgeneration() const { return gencount ; }
   int getdemotions() const { return demotions ; }
   int isbusy() const { return inflight ; }
   const char *geterror() const { return errmsg.c_str() ; }
private:
   ecabackend *create(int t) ;
   int probe(int fromtier, int width, const generation &seed, const char *why) ;
   void activate(ecabackend *b, int t, const char *why) ;
   void release() ;

   ecaprefs prefs ;
   ecapoll *poller ;
   perfmonitor *monitor ;
   ecabackend *(*creators[NUMTIERS])() ;
   ecabackend *active ;
   int state ;
   int tier ;
   int previous ;       // tier reported as "from" by the next activation
   int probingtier ;
   int width ;
   generation last ;
   int gencount ;
   int demotions ;
   int inflight ;
   ecarule inflightrule ;
   std::string errmsg ;
} ;
#endif
