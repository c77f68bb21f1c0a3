// This file is part of Ecaline.
// See docs/License.html for the copyright notice.

/**
 *   Capability detection and benchmarking.  Both create each tier's
 *   backend on their own, outside any running session.
 */
#ifndef CAPABILITIES_H
#define CAPABILITIES_H
#include "ecabackend.h"
#include "ecaprefs.h"
#include <string>
#include <vector>

struct tiercapability {
   int tier ;
   int available ;
   int status ;            // BACKEND_OK or the init failure
   std::string reason ;    // why it is unavailable
   std::string info ;      // device and limits when available
} ;

struct capabilityreport {
   tiercapability tiers[NUMTIERS] ;
   int recommended ;       // best available tier
} ;

struct benchmarkresult {
   int tier ;
   int gridsize ;
   int iterations ;
   int status ;
   std::string error ;
   double totaltime ;      // seconds
   double averagetime ;    // seconds per generation
   double ips ;            // generations per second
   double speedup ;        // cpu average time / this average time; 0 if unknown
   unsigned long digest ;  // CRC-32 of the final row
} ;

const int DETECT_WIDTH = 64 ;
const int BENCHMARK_ITERATIONS = 100 ;
const int BENCHMARK_RULE = 30 ;
// 100, 500, 1000, 2000
std::vector<int> defaultbenchmarksizes() ;

capabilityreport detectcapabilities(const ecaprefs &prefs, ecapoll *poller = 0) ;
std::vector<benchmarkresult> runbenchmark(const ecaprefs &prefs,
                                          const std::vector<int> &sizes,
                                          int iterations = BENCHMARK_ITERATIONS,
                                          ecapoll *poller = 0) ;
#endif
