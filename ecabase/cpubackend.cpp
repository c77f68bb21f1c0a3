// This file is part of Ecaline.
// See docs/License.html for the copyright notice.

#include "cpubackend.h"

cpubackend::cpubackend() {
   info = "cpu: scalar reference" ;
}

cpubackend::~cpubackend() {
   dispose() ;
}

int cpubackend::init(int w) {
   int r = checkwidth(w, 0) ;
   if (r != BACKEND_OK)
      return r ;
   width = w ;
   rows[0].assign(w, 0) ;
   rows[1].assign(w, 0) ;
   rows.resetroles() ;
   busy = 0 ;
   return BACKEND_OK ;
}

int cpubackend::upload(const generation &g) {
   if ((int)g.size() != width)
      return fail(INVALID_GRID_SIZE, "cpu: upload of %d cells into a row of %d",
                  (int)g.size(), width) ;
   rows.front() = g ;
   busy = 0 ;
   return BACKEND_OK ;
}

int cpubackend::readback(generation &g) {
   g = rows.front() ;
   return BACKEND_OK ;
}

int cpubackend::computenext(const ecarule &rule) {
   if (width <= 0)
      return fail(INVALID_GRID_SIZE, "cpu: not initialized") ;
   stepgeneration(rule.gettable(), rows.front(), rows.back()) ;
   busy = 1 ;
   return BACKEND_OK ;
}

int cpubackend::collect(generation &g) {
   if (!busy)
      return fail(BACKEND_UNAVAILABLE, "cpu: no step in flight") ;
   rows.swap() ;
   busy = 0 ;
   g = rows.front() ;
   return BACKEND_OK ;
}

void cpubackend::dispose() {
   generation().swap(rows[0]) ;
   generation().swap(rows[1]) ;
   width = 0 ;
   busy = 0 ;
}

static ecabackend *creator() { return new cpubackend() ; }
void cpubackend::doInitializeBackendInfo(staticBackendInfo &ai) {
   ai.setBackendName("CPU") ;
   ai.setBackendTier(TIER_CPU) ;
   ai.setBackendCreator(&creator) ;
}
