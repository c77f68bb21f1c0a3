// This file is part of Ecaline.
// See docs/License.html for the copyright notice.

#include "capabilities.h"
#include "backendselector.h"    // for waitforinit
#include "generation.h"
#include "util.h"

std::vector<int> defaultbenchmarksizes() {
   std::vector<int> sizes ;
   sizes.push_back(100) ;
   sizes.push_back(500) ;
   sizes.push_back(1000) ;
   sizes.push_back(2000) ;
   return sizes ;
}

static ecabackend *createtier(int tier) {
   staticBackendInfo *info = staticBackendInfo::byTier(tier) ;
   if (info == 0 || info->creator == 0)
      return 0 ;
   return info->creator() ;
}

// create and initialize a tier's backend; 0 with err set on failure
static ecabackend *openbackend(int tier, int width, const ecaprefs &prefs,
                               ecapoll *poller, int &status, std::string &err) {
   ecabackend *b = createtier(tier) ;
   if (b == 0) {
      status = BACKEND_UNAVAILABLE ;
      err = "no backend registered" ;
      return 0 ;
   }
   b->setoptions(prefs) ;
   b->setpoll(poller) ;
   err.clear() ;
   status = b->init(width) ;
   if (status == BACKEND_PENDING)
      status = waitforinit(b, prefs, poller, err) ;
   if (status != BACKEND_OK) {
      if (err.empty())
         err = b->geterror() ;
      b->dispose() ;
      delete b ;
      return 0 ;
   }
   return b ;
}

capabilityreport detectcapabilities(const ecaprefs &prefs, ecapoll *poller) {
   registerbackends() ;
   if (poller == 0)
      poller = &default_poller ;
   capabilityreport report ;
   report.recommended = TIER_NONE ;
   for (int t=NUMTIERS-1; t>=TIER_CPU; t--) {
      tiercapability &c = report.tiers[t] ;
      c.tier = t ;
      ecabackend *b = openbackend(t, DETECT_WIDTH, prefs, poller, c.status, c.reason) ;
      c.available = b != 0 ;
      if (b) {
         c.info = b->getinfo() ;
         b->dispose() ;
         delete b ;
         if (report.recommended == TIER_NONE)
            report.recommended = t ;
      }
   }
   return report ;
}

// one generation, waiting for an asynchronous backend
static int stepwait(ecabackend *b, const ecarule &rule, generation &g) {
   int r = b->computenext(rule) ;
   if (r != BACKEND_OK)
      return r ;
   // the compute backend's readback deadline bounds this loop
   while ((r = b->collect(g)) == BACKEND_PENDING)
      ;
   return r ;
}

std::vector<benchmarkresult> runbenchmark(const ecaprefs &prefs,
                                          const std::vector<int> &sizes,
                                          int iterations, ecapoll *poller) {
   registerbackends() ;
   if (poller == 0)
      poller = &default_poller ;
   if (iterations < 1)
      iterations = 1 ;
   std::vector<benchmarkresult> results ;
   ecarule rule(BENCHMARK_RULE) ;
   for (size_t s=0; s<sizes.size(); s++) {
      double cpuaverage = 0 ;
      // cpu first so the others can report their speedup
      for (int t=TIER_CPU; t<NUMTIERS; t++) {
         benchmarkresult res ;
         res.tier = t ;
         res.gridsize = sizes[s] ;
         res.iterations = iterations ;
         res.totaltime = res.averagetime = res.ips = res.speedup = 0 ;
         res.digest = 0 ;
         ecabackend *b = openbackend(t, sizes[s], prefs, poller, res.status, res.error) ;
         if (b) {
            generation g = singleseed(sizes[s]) ;
            res.status = b->upload(g) ;
            double start = ecaSecondCount() ;
            for (int i=0; i<iterations && res.status == BACKEND_OK; i++)
               res.status = stepwait(b, rule, g) ;
            res.totaltime = ecaSecondCount() - start ;
            if (res.status == BACKEND_OK) {
               res.averagetime = res.totaltime / iterations ;
               if (res.totaltime > 0)
                  res.ips = iterations / res.totaltime ;
               if (t == TIER_CPU)
                  cpuaverage = res.averagetime ;
               if (cpuaverage > 0 && res.averagetime > 0)
                  res.speedup = cpuaverage / res.averagetime ;
               res.digest = rowdigest(g) ;
            } else {
               res.error = b->geterror() ;
            }
            b->dispose() ;
            delete b ;
         }
         if (res.status != BACKEND_OK)
            ecawarningf("benchmark %s width %d: %s (%s)", tiername(t), sizes[s],
                        statusname(res.status), res.error.c_str()) ;
         results.push_back(res) ;
      }
   }
   return results ;
}
