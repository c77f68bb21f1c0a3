// This file is part of Ecaline.
// See docs/License.html for the copyright notice.

#include "backendselector.h"
#include "perfmonitor.h"
#include "util.h"
#include <stdio.h>

backendselector::backendselector() {
   registerbackends() ;
   poller = &default_poller ;
   monitor = 0 ;
   for (int t=0; t<NUMTIERS; t++)
      creators[t] = 0 ;
   active = 0 ;
   state = SELECTOR_UNINITIALIZED ;
   tier = TIER_NONE ;
   previous = TIER_NONE ;
   probingtier = TIER_NONE ;
   width = 0 ;
   gencount = 0 ;
   demotions = 0 ;
   inflight = 0 ;
}

backendselector::~backendselector() {
   release() ;
}

void backendselector::setoptions(const ecaprefs &p) {
   prefs = p ;
}

void backendselector::setcreator(int t, ecabackend *(*f)()) {
   if (t >= 0 && t < NUMTIERS)
      creators[t] = f ;
}

ecabackend *backendselector::create(int t) {
   if (creators[t])
      return creators[t]() ;
   staticBackendInfo *info = staticBackendInfo::byTier(t) ;
   if (info == 0 || info->creator == 0)
      return 0 ;
   return info->creator() ;
}

void backendselector::release() {
   if (active) {
      active->abandon() ;
      active->dispose() ;
      delete active ;
      active = 0 ;
   }
   inflight = 0 ;
}

void backendselector::stop() {
   release() ;
   state = SELECTOR_UNINITIALIZED ;
   tier = TIER_NONE ;
   previous = TIER_NONE ;
   probingtier = TIER_NONE ;
}

int backendselector::start(int w, const generation &seed) {
   int from = tier ;
   release() ;
   previous = from ;
   tier = TIER_NONE ;
   width = w ;
   last = seed ;
   gencount = 0 ;
   int first = prefs.first_tier ;
   if (first < TIER_CPU || first >= NUMTIERS)
      first = TIER_COMPUTE ;
   int r = probe(first, w, seed, from == TIER_NONE ? "start" : "restart") ;
   if (r != BACKEND_OK && from != TIER_NONE)
      poller->tierchanged(from, TIER_NONE, errmsg.c_str()) ;
   return r ;
}

int waitforinit(ecabackend *b, const ecaprefs &prefs, ecapoll *poller, std::string &err) {
   for (int i=0; i<prefs.probe_attempts; i++) {
      int r = b->pollinit() ;
      if (r != BACKEND_PENDING)
         return r ;
      if (poller->poll()) {
         err = "probe interrupted" ;
         b->dispose() ;
         return BACKEND_UNAVAILABLE ;
      }
      ecaSleep(prefs.probe_interval_ms) ;
   }
   char buf[ECAMSGSIZE] ;
   snprintf(buf, sizeof(buf), "did not initialize within %d attempts of %d ms",
            prefs.probe_attempts, prefs.probe_interval_ms) ;
   err = buf ;
   b->dispose() ;
   return BACKEND_UNAVAILABLE ;
}

int backendselector::probe(int fromtier, int w, const generation &seed, const char *why) {
   int r = BACKEND_UNAVAILABLE ;
   poller->resetInterrupted() ;
   for (int t=fromtier; t>=TIER_CPU; t--) {
      state = SELECTOR_PROBING ;
      probingtier = t ;
      ecabackend *b = create(t) ;
      if (b == 0) {
         errmsg = "no backend registered" ;
         ecawarningf("%s backend: %s", tiername(t), errmsg.c_str()) ;
         continue ;
      }
      b->setoptions(prefs) ;
      b->setpoll(poller) ;
      errmsg.clear() ;
      r = b->init(w) ;
      if (r == BACKEND_PENDING)
         r = waitforinit(b, prefs, poller, errmsg) ;
      if (r == BACKEND_OK)
         r = b->upload(seed) ;
      if (r == BACKEND_OK) {
         activate(b, t, why) ;
         return BACKEND_OK ;
      }
      if (errmsg.empty())
         errmsg = b->geterror() ;
      ecawarningf("%s backend: %s (%s)", tiername(t), statusname(r), errmsg.c_str()) ;
      b->dispose() ;
      delete b ;
   }
   state = SELECTOR_UNINITIALIZED ;
   tier = TIER_NONE ;
   probingtier = TIER_NONE ;
   return r ;
}

void backendselector::activate(ecabackend *b, int t, const char *why) {
   int from = previous ;
   active = b ;
   tier = t ;
   state = SELECTOR_ACTIVE ;
   probingtier = TIER_NONE ;
   if (monitor)
      monitor->reset(t) ;
   ecastatusf("%s backend active (%s): %s", tiername(t), why, b->getinfo()) ;
   if (from != t)
      poller->tierchanged(from, t, why) ;
   previous = t ;
}

int backendselector::demote(const char *why) {
   if (state != SELECTOR_ACTIVE || tier <= TIER_CPU)
      return tier ;
   int from = tier ;
   // why may point into the backend we are about to delete
   std::string reason = why ;
   ecawarningf("%s backend demoted: %s", tiername(from), reason.c_str()) ;
   // the old backend goes before the new one allocates
   active->abandon() ;
   active->dispose() ;
   delete active ;
   active = 0 ;
   previous = from ;
   tier = TIER_NONE ;
   demotions++ ;
   if (probe(from - 1, width, last, reason.c_str()) != BACKEND_OK)
      ecawarningf("no backend could take over from %s: %s", tiername(from), errmsg.c_str()) ;
   return tier ;
}

int backendselector::checkhealth() {
   if (state != SELECTOR_ACTIVE || active->checkhealth() == BACKEND_OK)
      return 0 ;
   demote(active->geterror()[0] ? active->geterror() : "backend lost") ;
   return 1 ;
}

void backendselector::abandon() {
   if (active)
      active->abandon() ;
   inflight = 0 ;
}

int backendselector::advance(const ecarule &rule, generation &g) {
   for (;;) {
      if (state != SELECTOR_ACTIVE)
         return BACKEND_UNAVAILABLE ;
      int r ;
      if (active->isbusy()) {
         r = active->collect(g) ;
      } else {
         // a step still marked in flight was lost with the previous
         // backend and is replayed here
         if (!inflight)
            inflightrule = rule ;
         inflight = 1 ;
         r = active->computenext(inflightrule) ;
         if (r == BACKEND_OK)
            r = active->collect(g) ;
      }
      if (r == BACKEND_OK) {
         inflight = 0 ;
         last = g ;
         gencount++ ;
         return BACKEND_OK ;
      }
      if (r == BACKEND_PENDING)
         return r ;
      if (tier <= TIER_CPU) {
         errmsg = active->geterror() ;
         return r ;
      }
      std::string why = statusname(r) ;
      why += ": " ;
      why += active->geterror() ;
      demote(why.c_str()) ;
   }
}

int backendselector::step(const ecarule &rule, generation &g) {
   for (;;) {
      int r = advance(rule, g) ;
      if (r != BACKEND_PENDING)
         return r ;
      if (poller->poll()) {
         abandon() ;
         return BACKEND_PENDING ;
      }
      ecaSleep(1) ;
   }
}
