// This file is part of Ecaline.
// See docs/License.html for the copyright notice.

#include "minitest.h"
#include "fakebackends.h"
#include "ecaengine.h"
#include "rule30_w101.h"
#include <stdlib.h>

class enginepoll : public ecapoll {
public:
   enginepoll() : engine(0), pendingrule(-1) {}
   virtual int checkevents() {
      // a rule change arriving while the engine waits on a backend
      if (engine && pendingrule >= 0) {
         engine->setrule(pendingrule) ;
         pendingrule = -1 ;
      }
      return 0 ;
   }
   virtual void tierchanged(int from, int to, const char *) {
      changes.push_back(from * 10 + to) ;
   }
   virtual void runcompleted(int ruleid) { completed.push_back(ruleid) ; }
   ecaengine *engine ;
   int pendingrule ;
   std::vector<int> changes ;
   std::vector<int> completed ;
} ;

static ecaprefs cpuprefs() {
   ecaprefs p = testprefs() ;
   p.first_tier = TIER_CPU ;
   p.grid_width = RULE30_WIDTH ;
   p.generation_count = RULE30_ROWS ;
   return p ;
}

static void testbatchrun() {
   enginepoll poller ;
   ecaengine engine ;
   engine.setprefs(cpuprefs()) ;
   engine.setpoll(&poller) ;
   CHECK_EQ(engine.start(), BACKEND_OK) ;
   CHECK_EQ(engine.isidle(), 0) ;
   CHECK_EQ(engine.getgeneration(), 0) ;
   CHECK_EQ(engine.getframes(), 1) ;
   CHECK(strcmp(engine.gettiername(), "cpu") == 0) ;
   for (int i=1; i<RULE30_ROWS; i++)
      CHECK_EQ(engine.step(), BACKEND_OK) ;
   CHECK_EQ(engine.isdone(), 1) ;
   CHECK_EQ(engine.getgeneration(), RULE30_ROWS - 1) ;
   const std::vector<generation> &h = engine.gethistory() ;
   for (int i=0; i<RULE30_ROWS && i<(int)h.size(); i++)
      CHECK(rowtostring(h[i]) == rule30_w101[i]) ;
   CHECK_EQ((int)poller.completed.size(), 1) ;
   CHECK_EQ(poller.completed[0], 30) ;
   // a finished run stays put
   CHECK_EQ(engine.step(), BACKEND_OK) ;
   CHECK_EQ(engine.tick(100.0), 0) ;
   CHECK_EQ(engine.getgeneration(), RULE30_ROWS - 1) ;
   CHECK_EQ((int)poller.completed.size(), 1) ;
   CHECK_EQ(engine.getframes(), RULE30_ROWS) ;
   surfacerender &s = engine.getsurface() ;
   CHECK_EQ(s.getwidth(), RULE30_WIDTH * 3) ;
   CHECK_EQ(s.getheight(), RULE30_ROWS * 3) ;
   engine.stop() ;
   CHECK_EQ(engine.isidle(), 1) ;
   CHECK_EQ(engine.getgeneration(), -1) ;
}

static void testinterval() {
   ecaengine engine ;
   ecaprefs p = cpuprefs() ;
   p.interval_ms = 200 ;
   engine.setprefs(p) ;
   CHECK_EQ(engine.start(), BACKEND_OK) ;
   CHECK_EQ(engine.tick(1.0), 1) ;
   CHECK_EQ(engine.tick(1.1), 0) ;
   CHECK_EQ(engine.tick(1.15), 0) ;
   CHECK_EQ(engine.tick(1.25), 1) ;
   CHECK_EQ(engine.tick(1.5), 1) ;
   CHECK_EQ(engine.getgeneration(), 3) ;
   CHECK(rowtostring(engine.gethistory()[3]) == rule30_w101[3]) ;
}

static void testidle(captureerrors &errors) {
   errors.clear() ;
   enginepoll poller ;
   ecaengine engine ;
   ecaprefs p = cpuprefs() ;
   p.grid_width = 0 ;
   engine.setprefs(p) ;
   engine.setpoll(&poller) ;
   CHECK_EQ(engine.start(), INVALID_GRID_SIZE) ;
   CHECK_EQ(engine.isidle(), 1) ;
   CHECK_EQ(engine.getframes(), 0) ;
   CHECK_EQ(engine.getgeneration(), -1) ;
   CHECK_EQ(engine.tick(1.0), 0) ;
   CHECK_EQ(engine.tick(2.0), 0) ;
   CHECK(engine.step() != BACKEND_OK) ;
   CHECK_EQ(engine.getframes(), 0) ;
   CHECK_EQ(engine.gettier(), TIER_NONE) ;
   CHECK_EQ(errors.countwarnings("engine idle"), 1) ;
   CHECK_EQ((int)poller.completed.size(), 0) ;
   // a usable width brings it back
   CHECK(engine.setgridwidth(21) == 0) ;
   CHECK_EQ(engine.isidle(), 0) ;
   CHECK_EQ(engine.getframes(), 1) ;
   CHECK_EQ((int)engine.gethistory()[0].size(), 21) ;
}

static void testrestarts() {
   ecaengine engine ;
   engine.setprefs(cpuprefs()) ;
   CHECK_EQ(engine.start(), BACKEND_OK) ;
   for (int i=0; i<10; i++)
      engine.step() ;
   CHECK_EQ(engine.getgeneration(), 10) ;
   CHECK(engine.setrule("W90") == 0) ;
   CHECK_EQ(engine.getrule().getid(), 90) ;
   CHECK_EQ(engine.getgeneration(), 0) ;
   engine.step() ;
   generation expect ;
   stepgeneration(ruletable(90), singleseed(RULE30_WIDTH), expect) ;
   CHECK(engine.gethistory()[1] == expect) ;
   // a bad rule changes nothing
   CHECK(engine.setrule("W300") != 0) ;
   CHECK(engine.setrule("abc") != 0) ;
   CHECK_EQ(engine.getrule().getid(), 90) ;
   CHECK_EQ(engine.getgeneration(), 1) ;
   CHECK_EQ(engine.reset(), BACKEND_OK) ;
   CHECK_EQ(engine.getgeneration(), 0) ;
   CHECK_EQ(engine.getrule().getid(), 90) ;
   CHECK(engine.setgridwidth(63) == 0) ;
   CHECK_EQ((int)engine.gethistory()[0].size(), 63) ;
   CHECK(engine.setgridwidth(-4) == 0) ;
   CHECK_EQ(engine.isidle(), 1) ;
}

static void testsetprefsmidrun() {
   ecaengine engine ;
   ecaprefs p = cpuprefs() ;
   engine.setprefs(p) ;
   CHECK_EQ(engine.start(), BACKEND_OK) ;
   for (int i=0; i<3; i++)
      CHECK_EQ(engine.step(), BACKEND_OK) ;
   CHECK_EQ(engine.getgeneration(), 3) ;
   // a new rule through the settings reseeds the session
   p.rule = 90 ;
   engine.setprefs(p) ;
   CHECK_EQ(engine.getrule().getid(), 90) ;
   CHECK_EQ(engine.getgeneration(), 0) ;
   CHECK(engine.gethistory()[0] == singleseed(RULE30_WIDTH)) ;
   CHECK_EQ(engine.step(), BACKEND_OK) ;
   generation expect ;
   stepgeneration(ruletable(90), singleseed(RULE30_WIDTH), expect) ;
   CHECK(engine.gethistory()[1] == expect) ;
   // other settings leave the session alone
   p.interval_ms = 50 ;
   engine.setprefs(p) ;
   CHECK_EQ(engine.getgeneration(), 1) ;
   // so does handing back the same rule
   engine.setprefs(engine.getprefs()) ;
   CHECK_EQ(engine.getgeneration(), 1) ;
   // a new width reseeds too
   p.grid_width = 63 ;
   engine.setprefs(p) ;
   CHECK_EQ(engine.getgeneration(), 0) ;
   CHECK_EQ((int)engine.gethistory()[0].size(), 63) ;
}

static void testautocycle() {
   enginepoll poller ;
   ecaengine engine ;
   ecaprefs p = cpuprefs() ;
   p.generation_count = 5 ;
   p.auto_cycle = true ;
   p.cycle_delay_ms = 1800 ;
   engine.setprefs(p) ;
   engine.setpoll(&poller) ;
   CHECK_EQ(engine.start(), BACKEND_OK) ;
   double now = 10.0 ;
   for (int i=0; i<4; i++, now += 0.1)
      CHECK_EQ(engine.tick(now), 1) ;
   CHECK_EQ(engine.isdone(), 1) ;
   CHECK_EQ((int)poller.completed.size(), 1) ;
   engine.tick(now) ;
   engine.tick(now + 1.0) ;
   CHECK_EQ(engine.getrule().getid(), 30) ;
   CHECK_EQ(engine.getgeneration(), 4) ;
   engine.tick(now + 1.9) ;
   int next = engine.getrule().getid() ;
   CHECK(next != 30) ;
   int listed = 0 ;
   for (int i=0; i<NUMCYCLERULES; i++)
      if (cyclerules[i] == next)
         listed = 1 ;
   CHECK(listed) ;
   CHECK_EQ(engine.isdone(), 0) ;
   CHECK_EQ(engine.getgeneration(), 0) ;
   now += 2.0 ;
   for (int i=0; i<4; i++, now += 0.1)
      engine.tick(now) ;
   CHECK_EQ((int)poller.completed.size(), 2) ;
   if (poller.completed.size() == 2)
      CHECK_EQ(poller.completed[1], next) ;
}

static void testloss(captureerrors &errors) {
   resetfakes() ;
   errors.clear() ;
   fakeconfig.mode[TIER_COMPUTE] = FAKE_LOSES ;
   fakeconfig.failat = 7 ;
   enginepoll poller ;
   ecaengine engine ;
   ecaprefs p = cpuprefs() ;
   p.first_tier = TIER_COMPUTE ;
   engine.setprefs(p) ;
   engine.setpoll(&poller) ;
   engine.setcreator(TIER_RASTER, fakeraster) ;
   engine.setcreator(TIER_COMPUTE, fakecompute) ;
   CHECK_EQ(engine.start(), BACKEND_OK) ;
   CHECK_EQ(engine.gettier(), TIER_COMPUTE) ;
   for (int i=0; i<20; i++)
      CHECK_EQ(engine.step(), BACKEND_OK) ;
   CHECK_EQ(engine.gettier(), TIER_RASTER) ;
   // then a simulated loss of raster leaves the cpu
   engine.forceloss() ;
   for (int i=0; i<20; i++)
      CHECK_EQ(engine.step(), BACKEND_OK) ;
   CHECK_EQ(engine.gettier(), TIER_CPU) ;
   CHECK_EQ(engine.getselector().getdemotions(), 2) ;
   const std::vector<generation> &h = engine.gethistory() ;
   CHECK_EQ((int)h.size(), 41) ;
   for (int i=0; i<RULE30_ROWS && i<(int)h.size(); i++)
      CHECK(rowtostring(h[i]) == rule30_w101[i]) ;
   CHECK_EQ((int)poller.changes.size(), 3) ;
   if (poller.changes.size() == 3) {
      CHECK_EQ(poller.changes[0], TIER_NONE * 10 + TIER_COMPUTE) ;
      CHECK_EQ(poller.changes[1], TIER_COMPUTE * 10 + TIER_RASTER) ;
      CHECK_EQ(poller.changes[2], TIER_RASTER * 10 + TIER_CPU) ;
   }
   CHECK(fakeconfig.maxlive <= 1) ;
   // the cpu ignores a simulated loss
   engine.forceloss() ;
   CHECK_EQ(engine.step(), BACKEND_OK) ;
   CHECK_EQ(engine.gettier(), TIER_CPU) ;
}

static void testperfdemotion() {
   resetfakes() ;
   ecaengine engine ;
   ecaprefs p = cpuprefs() ;
   p.first_tier = TIER_COMPUTE ;
   p.fps_window = 1 ;
   p.fps_check_interval = 1 ;
   p.fps_sustain_checks = 1 ;
   p.raster_min_fps = 0 ;
   engine.setprefs(p) ;
   engine.setcreator(TIER_RASTER, fakeraster) ;
   engine.setcreator(TIER_COMPUTE, fakecompute) ;
   CHECK_EQ(engine.start(), BACKEND_OK) ;
   CHECK_EQ(engine.gettier(), TIER_COMPUTE) ;
   // no frame can be this fast
   engine.getmonitor().setthreshold(TIER_COMPUTE, 1e12) ;
   CHECK_EQ(engine.step(), BACKEND_OK) ;
   CHECK_EQ(engine.gettier(), TIER_RASTER) ;
   CHECK_EQ(engine.getmonitor().getsignals(), 1) ;
   for (int i=0; i<10; i++)
      CHECK_EQ(engine.step(), BACKEND_OK) ;
   CHECK_EQ(engine.gettier(), TIER_RASTER) ;
   CHECK_EQ(engine.getselector().getdemotions(), 1) ;
   CHECK(rowtostring(engine.gethistory()[11]) == rule30_w101[11]) ;
}

static void testchangeduringpoll() {
   resetfakes() ;
   fakeconfig.mode[TIER_COMPUTE] = FAKE_SLOW ;
   enginepoll poller ;
   ecaengine engine ;
   ecaprefs p = cpuprefs() ;
   p.first_tier = TIER_COMPUTE ;
   engine.setprefs(p) ;
   engine.setpoll(&poller) ;
   engine.setcreator(TIER_COMPUTE, fakecompute) ;
   CHECK_EQ(engine.start(), BACKEND_OK) ;
   poller.engine = &engine ;
   poller.pendingrule = 90 ;
   // the wait is interrupted and the restart happens on the next tick
   CHECK_EQ(engine.step(), BACKEND_PENDING) ;
   CHECK_EQ(engine.getgeneration(), 0) ;
   CHECK_EQ(engine.getrule().getid(), 30) ;
   CHECK_EQ(engine.tick(1.0), 0) ;
   CHECK_EQ(engine.getrule().getid(), 90) ;
   CHECK_EQ(engine.getgeneration(), 0) ;
   CHECK_EQ(engine.gettier(), TIER_COMPUTE) ;
   poller.engine = 0 ;
   CHECK_EQ(engine.step(), BACKEND_OK) ;
   generation expect ;
   stepgeneration(ruletable(90), singleseed(RULE30_WIDTH), expect) ;
   CHECK(engine.gethistory()[1] == expect) ;
}

int main() {
   captureerrors errors ;
   ecaerrors::seterrorhandler(&errors) ;
   srand(1) ;
   testbatchrun() ;
   testinterval() ;
   testidle(errors) ;
   testrestarts() ;
   testsetprefsmidrun() ;
   testautocycle() ;
   testloss(errors) ;
   testperfdemotion() ;
   testchangeduringpoll() ;
   ecaerrors::seterrorhandler(0) ;
   return minitest_report("minitest_engine") ;
}
