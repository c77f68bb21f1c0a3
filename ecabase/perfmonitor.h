// This file is part of Ecaline.
// See docs/License.html for the copyright notice.

#ifndef PERFMONITOR_H
#define PERFMONITOR_H
#include "ecabackend.h"
#include <vector>
/*
 *   Frame timing.  We keep a rolling window of (timestamp, duration)
 *   samples and every few frames compare the average rate against the
 *   threshold of the active tier.  A breach produces exactly one demote
 *   signal; another one needs the rate to recover first, or a reset for
 *   a new tier.
 */
struct perfsample {
   double timestamp ;
   double duration ;
} ;

class perfmonitor {
public:
   perfmonitor() ;
   void setoptions(const ecaprefs &prefs) ;
   void setthreshold(int tier, double minfps) ;
   double getthreshold(int tier) const ;
   // forget every sample and any breach; thresholds now apply to tier
   void reset(int tier) ;
   // record a frame; returns 1 when the caller should demote
   int record(double timestamp, double duration) ;
   // samples in the window divided by their total duration
   double getfps() const ;
   int getsamples() const { return count ; }
   int inbreach() const { return breach ; }
   int getsignals() const { return signals ; }
   // periodic status line if verbose
   void report(int verbose) ;
   double getReportInterval() { return reportInterval ; }
   void setReportInterval(double v) { reportInterval = v ; }
private:
   int check() ;
   std::vector<perfsample> window ;
   int next ;
   int count ;
   double total ;
   int ticks ;
   int checkinterval ;
   int sustain ;
   int failedchecks ;
   int breach ;
   int signals ;
   int tier ;
   double thresholds[NUMTIERS] ;
   double lastreport ;
   double reportInterval ;
} ;
#endif
