// This file is part of Ecaline.
// See docs/License.html for the copyright notice.

/**
 *   Reference backend: one scalar pass over the row per step.  It
 *   never fails for a width in 1..max_grid_width and is the terminal
 *   fallback of the selector.
 */
#ifndef CPUBACKEND_H
#define CPUBACKEND_H
#include "ecabackend.h"
#include "statepair.h"

class cpubackend : public ecabackend {
public:
   cpubackend() ;
   virtual ~cpubackend() ;
   virtual int init(int width) ;
   virtual int upload(const generation &g) ;
   virtual int readback(generation &g) ;
   virtual int computenext(const ecarule &rule) ;
   virtual int collect(generation &g) ;
   virtual void dispose() ;
   // the cpu cannot be lost
   virtual int checkhealth() { return BACKEND_OK ; }
   virtual void forceloss() {}
   virtual int gettier() const { return TIER_CPU ; }
   static void doInitializeBackendInfo(staticBackendInfo &) ;
private:
   statepair<generation> rows ;
} ;
#endif
