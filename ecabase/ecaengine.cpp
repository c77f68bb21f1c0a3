// This file is part of Ecaline.
// See docs/License.html for the copyright notice.

#include "ecaengine.h"
#include "util.h"
#include <stdlib.h>
#include <stdio.h>

const int cyclerules[NUMCYCLERULES] = { 30, 90, 110, 54, 150, 126 } ;

ecaengine::ecaengine() {
   renderer = &surface ;
   poller = &default_poller ;
   idle = 1 ;
   done = 0 ;
   frames = 0 ;
   restartpending = 0 ;
   lastadvance = -1 ;
   issued = 0 ;
   cycleat = -1 ;
   selector.setmonitor(&monitor) ;
   setprefs(prefs) ;
}

ecaengine::~ecaengine() {
   stop() ;
}

void ecaengine::setprefs(const ecaprefs &p) {
   int reseed = p.rule != prefs.rule || p.grid_width != prefs.grid_width ;
   prefs = p ;
   selector.setoptions(prefs) ;
   monitor.setoptions(prefs) ;
   frame.setstyle(prefs.render_style) ;
   frame.setcellsize(prefs.cell_size) ;
   // a running session never continues under a different rule or width
   if (idle)
      rule.setrule(prefs.rule) ;
   else if (reseed)
      requestrestart() ;
}

void ecaengine::setpoll(ecapoll *pollerarg) {
   poller = pollerarg ? pollerarg : &default_poller ;
   selector.setpoll(poller) ;
}

void ecaengine::setrender(ecarender *r) {
   renderer = r ? r : &surface ;
}

int ecaengine::start() {
   restartpending = 0 ;
   return restart() ;
}

int ecaengine::restart() {
   selector.abandon() ;
   history.clear() ;
   done = 0 ;
   cycleat = -1 ;
   lastadvance = -1 ;
   issued = 0 ;
   rule.setrule(prefs.rule) ;
   generation seed = singleseed(prefs.grid_width) ;
   int r = selector.start(prefs.grid_width, seed) ;
   if (r != BACKEND_OK) {
      // nothing could take a row of this width; stay idle, draw nothing
      ecawarningf("engine idle: %s (%s)", statusname(r), selector.geterror()) ;
      idle = 1 ;
      return r ;
   }
   idle = 0 ;
   history.push_back(seed) ;
   render() ;
   if ((int)history.size() >= prefs.generation_count) {
      done = 1 ;
      poller->runcompleted(rule.getid()) ;
   }
   return BACKEND_OK ;
}

void ecaengine::stop() {
   selector.stop() ;
   history.clear() ;
   idle = 1 ;
   done = 0 ;
}

void ecaengine::render() {
   frame.draw(*renderer, history, prefs.generation_count) ;
   frames++ ;
}

void ecaengine::deliver(const generation &g, double duration) {
   history.push_back(g) ;
   double t0 = ecaSecondCount() ;
   render() ;
   duration += ecaSecondCount() - t0 ;
   if (monitor.record(t0, duration))
      selector.demote("average frame rate below threshold") ;
   monitor.report(prefs.verbose) ;
   if ((int)history.size() >= prefs.generation_count) {
      done = 1 ;
      poller->runcompleted(rule.getid()) ;
   }
}

void ecaengine::pickcycle() {
   int next = rule.getid() ;
   while (next == rule.getid())
      next = cyclerules[rand() % NUMCYCLERULES] ;
   prefs.rule = next ;
}

int ecaengine::tick(double now) {
   if (restartpending) {
      restartpending = 0 ;
      restart() ;
      return 0 ;
   }
   if (idle)
      return 0 ;
   if (done) {
      if (!prefs.auto_cycle)
         return 0 ;
      if (cycleat < 0)
         cycleat = now + prefs.cycle_delay_ms / 1000.0 ;
      if (now >= cycleat) {
         pickcycle() ;
         restart() ;
      }
      return 0 ;
   }
   // loss is handled before anything else this tick
   selector.checkhealth() ;
   if (!selector.isbusy()) {
      if (lastadvance >= 0 && (now - lastadvance) * 1000.0 < prefs.interval_ms)
         return 0 ;
      issued = ecaSecondCount() ;
   }
   generation g ;
   int r = selector.advance(rule, g) ;
   if (r == BACKEND_PENDING)
      return 0 ;
   if (r != BACKEND_OK) {
      ecawarningf("engine idle: %s (%s)", statusname(r), selector.geterror()) ;
      idle = 1 ;
      return 0 ;
   }
   lastadvance = now ;
   deliver(g, ecaSecondCount() - issued) ;
   return 1 ;
}

int ecaengine::step() {
   if (idle)
      return BACKEND_UNAVAILABLE ;
   if (done)
      return BACKEND_OK ;
   selector.checkhealth() ;
   issued = ecaSecondCount() ;
   generation g ;
   int r = selector.step(rule, g) ;
   if (r != BACKEND_OK)
      return r ;
   deliver(g, ecaSecondCount() - issued) ;
   return BACKEND_OK ;
}

const char *ecaengine::setrule(const char *s) {
   int r ;
   const char *err = parserule(s, r) ;
   if (err)
      return err ;
   return setrule(r) ;
}

const char *ecaengine::setrule(int ruleid) {
   if (ruletable(ruleid) == 0)
      return "Rule must be a number from 0 to 255." ;
   prefs.rule = ruleid ;
   requestrestart() ;
   return 0 ;
}

const char *ecaengine::setgridwidth(int width) {
   char buf[32] ;
   snprintf(buf, sizeof(buf), "%d", width) ;
   const char *err = prefs.setpref("grid_width", buf) ;
   if (err)
      return err ;
   requestrestart() ;
   return 0 ;
}

int ecaengine::reset() {
   return requestrestart() ;
}

// a restart from inside a poll callback would pull the backend out
// from under the probe, so interrupt it and restart on the next tick
int ecaengine::requestrestart() {
   if (poller->isPolling()) {
      poller->setInterrupted() ;
      restartpending = 1 ;
      return BACKEND_PENDING ;
   }
   return restart() ;
}

void ecaengine::forceloss() {
   ecabackend *b = selector.getbackend() ;
   if (b)
      b->forceloss() ;
}
