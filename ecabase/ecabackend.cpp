// This file is part of Ecaline.
// See docs/License.html for the copyright notice.

#include "ecabackend.h"
#include "ecaprefs.h"
#include "cpubackend.h"
#include "rasterbackend.h"
#include "computebackend.h"
#include "util.h"
#include <stdio.h>
#include <stdarg.h>
#include <string.h>
#include <ctype.h>

const char *statusname(int status) {
   switch (status) {
      case BACKEND_OK: return "ok" ;
      case BACKEND_PENDING: return "pending" ;
      case BACKEND_UNAVAILABLE: return "backend unavailable" ;
      case BACKEND_LOST: return "backend lost" ;
      case INVALID_GRID_SIZE: return "invalid grid size" ;
      case COMPUTE_TIMEOUT: return "compute timeout" ;
   }
   return "unknown status" ;
}

static const char *tiernames[NUMTIERS] = { "cpu", "raster", "compute" } ;

const char *tiername(int tier) {
   if (tier < 0 || tier >= NUMTIERS)
      return "none" ;
   return tiernames[tier] ;
}

int tierfromname(const char *s) {
   if (s == 0)
      return TIER_NONE ;
   for (int t=0; t<NUMTIERS; t++) {
      const char *p = s ;
      const char *q = tiernames[t] ;
      while (*p && *q && tolower(*p) == *q) {
         p++ ;
         q++ ;
      }
      if (*p == 0 && *q == 0)
         return t ;
   }
   return TIER_NONE ;
}

ecabackend::~ecabackend() {}

void ecabackend::setoptions(const ecaprefs &prefs) {
   maxwidth = prefs.max_grid_width ;
}

int ecabackend::fail(int status, const char *fmt, ...) {
   char buf[ECAMSGSIZE] ;
   va_list args ;
   va_start(args, fmt) ;
   vsnprintf(buf, sizeof(buf), fmt, args) ;
   va_end(args) ;
   errmsg = buf ;
   return status ;
}

int ecabackend::checkwidth(int w, int limit) {
   if (w <= 0)
      return fail(INVALID_GRID_SIZE, "%s: grid width %d is not positive",
                  tiername(gettier()), w) ;
   if (w > maxwidth)
      return fail(INVALID_GRID_SIZE, "%s: grid width %d exceeds the limit of %d",
                  tiername(gettier()), w, maxwidth) ;
   if (limit > 0 && w > limit)
      return fail(INVALID_GRID_SIZE, "%s: grid width %d exceeds the device limit of %d",
                  tiername(gettier()), w, limit) ;
   return BACKEND_OK ;
}

int staticBackendInfo::nextBackendId = 0 ;
staticBackendInfo *staticBackendInfo::head = 0 ;
staticBackendInfo::staticBackendInfo() {
   id = nextBackendId++ ;
   next = head ;
   head = this ;
   backendName = "" ;
   tier = TIER_NONE ;
   creator = 0 ;
}
staticBackendInfo *staticBackendInfo::byName(const char *s) {
   for (staticBackendInfo *i=head; i; i=i->next)
      if (strcmp(i->backendName, s) == 0)
         return i ;
   return 0 ;
}
staticBackendInfo *staticBackendInfo::byTier(int t) {
   for (staticBackendInfo *i=head; i; i=i->next)
      if (i->tier == t)
         return i ;
   return 0 ;
}
staticBackendInfo &staticBackendInfo::tick() {
   return *(new staticBackendInfo()) ;
}

void registerbackends() {
   static bool registered = false ;
   if (registered)
      return ;
   cpubackend::doInitializeBackendInfo(staticBackendInfo::tick()) ;
   rasterbackend::doInitializeBackendInfo(staticBackendInfo::tick()) ;
   computebackend::doInitializeBackendInfo(staticBackendInfo::tick()) ;
   registered = true ;
}
