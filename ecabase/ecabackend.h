// This file is part of Ecaline.
// See docs/License.html for the copyright notice.

/**
 *   This is the pure abstract class any generation backend must
 *   support.  As long as a backend implements this interface, the
 *   selector can probe it, seed it, step it and tear it down.
 *
 *   Stepping is split in two so synchronous and asynchronous backends
 *   share one contract: computenext() issues a step and collect()
 *   resolves it.  Synchronous backends resolve on the first collect();
 *   asynchronous ones return BACKEND_PENDING until the result is ready.
 *   At most one step may be in flight.
 */
#ifndef ECABACKEND_H
#define ECABACKEND_H
#include "generation.h"
#include "ecarules.h"
#include "ecapoll.h"
#include <string>

struct ecaprefs ;

// status codes returned by backend and selector calls
enum {
   BACKEND_OK = 0,
   BACKEND_PENDING,        // asynchronous work outstanding
   BACKEND_UNAVAILABLE,    // capability missing or init failed
   BACKEND_LOST,           // working backend failed mid-session
   INVALID_GRID_SIZE,      // width <= 0 or above the backend's limit
   COMPUTE_TIMEOUT         // readback never resolved
} ;
const char *statusname(int status) ;

// tiers in preference order; higher is faster
enum {
   TIER_NONE = -1,
   TIER_CPU = 0,
   TIER_RASTER,
   TIER_COMPUTE,
   NUMTIERS
} ;
const char *tiername(int tier) ;
// "compute", "raster" or "cpu" (case-insensitive); TIER_NONE if unknown
int tierfromname(const char *s) ;

class ecabackend {
public:
   ecabackend() : width(0), busy(0), lost(0), maxwidth(1048576)
      { poller = &default_poller ; }
   virtual ~ecabackend() ;
   // copy whatever settings the backend cares about
   virtual void setoptions(const ecaprefs &prefs) ;
   // allocate for rows of the given width; may return BACKEND_PENDING,
   // in which case pollinit() must be called until it stops doing so
   virtual int init(int width) = 0 ;
   virtual int pollinit() { return BACKEND_OK ; }
   // seed the front buffer
   virtual int upload(const generation &g) = 0 ;
   // copy the front buffer out
   virtual int readback(generation &g) = 0 ;
   // issue one step with the given rule
   virtual int computenext(const ecarule &rule) = 0 ;
   // resolve the step issued by computenext(); on BACKEND_OK g holds
   // the new generation and the buffers have been swapped
   virtual int collect(generation &g) = 0 ;
   // drop an in-flight step; the front buffer keeps the last result
   virtual void abandon() { busy = 0 ; }
   // release everything init() allocated; safe to call more than once
   virtual void dispose() = 0 ;
   // BACKEND_OK or BACKEND_LOST; read once per tick by the selector
   virtual int checkhealth() { return lost ? BACKEND_LOST : BACKEND_OK ; }
   // simulate a device loss; checkhealth() reports it from now on
   virtual void forceloss() { lost = 1 ; }
   virtual int gettier() const = 0 ;
   // human-readable description (device, version, limits)
   virtual const char *getinfo() { return info.c_str() ; }
   const char *geterror() { return errmsg.c_str() ; }
   int getwidth() const { return width ; }
   int isbusy() const { return busy ; }
   void setpoll(ecapoll *pollerarg) { poller = pollerarg ; }

protected:
   // record a formatted error message and return the given status
   int fail(int status, const char *fmt, ...) ;
   // common width validation against maxwidth and an extra backend limit
   int checkwidth(int w, int limit) ;

   ecapoll *poller ;
   int width ;
   int busy ;
   int lost ;
   int maxwidth ;
   std::string errmsg ;
   std::string info ;
} ;

/**
 *   Static information about each backend, one per tier.  Backends
 *   register themselves through doInitializeBackendInfo(), and the
 *   selector looks up the creator for each tier here.
 */
class staticBackendInfo {
public:
   staticBackendInfo() ;
   virtual ~staticBackendInfo() { } ;

   // mandatory
   void setBackendName(const char *s) { backendName = s ; }
   void setBackendTier(int t) { tier = t ; }
   void setBackendCreator(ecabackend *(*f)()) { creator = f ; }

   // basic data
   const char *backendName ;
   int tier ;
   ecabackend *(*creator)() ;
   int id ; // my index
   staticBackendInfo *next ;

   // support:  give me sequential backend IDs
   static int getNumBackends() { return nextBackendId ; }
   static int nextBackendId ;
   static staticBackendInfo &tick() ;
   static staticBackendInfo *head ;
   static staticBackendInfo *byName(const char *s) ;
   static staticBackendInfo *byTier(int tier) ;
} ;

// register the cpu, raster and compute backends once
void registerbackends() ;
#endif
