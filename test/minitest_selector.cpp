// This file is part of Ecaline.
// See docs/License.html for the copyright notice.

#include "minitest.h"
#include "fakebackends.h"
#include "backendselector.h"

const int SEL_WIDTH = 41 ;

struct tierchange {
   int from, to ;
   std::string why ;
} ;

class recordpoll : public ecapoll {
public:
   recordpoll() : interrupt(0) {}
   virtual int checkevents() { return interrupt ; }
   virtual void tierchanged(int from, int to, const char *why) {
      tierchange c ;
      c.from = from ;
      c.to = to ;
      c.why = why ;
      changes.push_back(c) ;
   }
   int interrupt ;
   std::vector<tierchange> changes ;
} ;

// generations 0..n of the rule from the single seed, on the cpu path
static std::vector<generation> reference(int ruleid, int width, int n) {
   std::vector<generation> rows(1, singleseed(width)) ;
   for (int i=0; i<n; i++) {
      generation next ;
      stepgeneration(ruletable(ruleid), rows.back(), next) ;
      rows.push_back(next) ;
   }
   return rows ;
}

// a selector wired to fakes for raster and compute, real cpu
static void setupselector(backendselector &sel, recordpoll &poller) {
   sel.setoptions(testprefs()) ;
   sel.setpoll(&poller) ;
   sel.setcreator(TIER_RASTER, fakeraster) ;
   sel.setcreator(TIER_COMPUTE, fakecompute) ;
}

// step n times, checking every row against ref and that exactly one
// backend is active throughout
static void runandcompare(backendselector &sel, const ecarule &rule,
                          const std::vector<generation> &ref, int n) {
   for (int i=0; i<n; i++) {
      generation g ;
      CHECK_EQ(sel.step(rule, g), BACKEND_OK) ;
      CHECK_EQ(sel.getstate(), SELECTOR_ACTIVE) ;
      CHECK(sel.getbackend() != 0) ;
      int gen = sel.getgeneration() ;
      CHECK(gen < (int)ref.size()) ;
      if (gen < (int)ref.size())
         CHECK(g == ref[gen]) ;
   }
   CHECK(fakeconfig.maxlive <= 1) ;
}

static void testfallbacktocpu(captureerrors &errors) {
   resetfakes() ;
   errors.clear() ;
   fakeconfig.mode[TIER_COMPUTE] = FAKE_UNAVAILABLE ;
   fakeconfig.mode[TIER_RASTER] = FAKE_UNAVAILABLE ;
   recordpoll poller ;
   backendselector sel ;
   setupselector(sel, poller) ;
   CHECK_EQ(sel.getstate(), SELECTOR_UNINITIALIZED) ;
   CHECK_EQ(sel.start(SEL_WIDTH, singleseed(SEL_WIDTH)), BACKEND_OK) ;
   CHECK_EQ(sel.gettier(), TIER_CPU) ;
   CHECK_EQ(sel.getstate(), SELECTOR_ACTIVE) ;
   CHECK_EQ(fakeconfig.created, 2) ;
   CHECK_EQ(errors.countwarnings("compute backend"), 1) ;
   CHECK_EQ(errors.countwarnings("raster backend"), 1) ;
   CHECK_EQ((int)poller.changes.size(), 1) ;
   if (poller.changes.size() == 1) {
      CHECK_EQ(poller.changes[0].from, TIER_NONE) ;
      CHECK_EQ(poller.changes[0].to, TIER_CPU) ;
   }
   ecarule rule(30) ;
   runandcompare(sel, rule, reference(30, SEL_WIDTH, 20), 20) ;
   // nothing below the cpu
   CHECK_EQ(sel.demote("test"), TIER_CPU) ;
   CHECK_EQ(sel.getdemotions(), 0) ;
   sel.stop() ;
   CHECK_EQ(sel.getstate(), SELECTOR_UNINITIALIZED) ;
   CHECK(sel.getbackend() == 0) ;
}

static void testboundedprobe(captureerrors &errors) {
   resetfakes() ;
   errors.clear() ;
   fakeconfig.mode[TIER_COMPUTE] = FAKE_HANGS ;
   recordpoll poller ;
   backendselector sel ;
   setupselector(sel, poller) ;
   ecaprefs prefs = testprefs() ;
   prefs.probe_attempts = 6 ;
   prefs.probe_interval_ms = 2 ;
   sel.setoptions(prefs) ;
   double t0 = ecaSecondCount() ;
   CHECK_EQ(sel.start(SEL_WIDTH, singleseed(SEL_WIDTH)), BACKEND_OK) ;
   double elapsed = ecaSecondCount() - t0 ;
   CHECK_EQ(fakeconfig.pollinits, 6) ;
   CHECK(elapsed < 5.0) ;
   CHECK_EQ(sel.gettier(), TIER_RASTER) ;
   // the hung backend was released before raster allocated
   CHECK_EQ(fakeconfig.maxlive, 1) ;
   CHECK_EQ(fakeconfig.live, 1) ;
   CHECK_EQ(errors.countwarnings("did not initialize"), 1) ;

   // a host interrupt ends the probe at once
   fakeconfig.pollinits = 0 ;
   poller.interrupt = 1 ;
   CHECK_EQ(sel.start(SEL_WIDTH, singleseed(SEL_WIDTH)), BACKEND_OK) ;
   CHECK_EQ(fakeconfig.pollinits, 1) ;
   CHECK_EQ(sel.gettier(), TIER_RASTER) ;
   poller.interrupt = 0 ;
}

static void testlosscontinuity(captureerrors &errors) {
   resetfakes() ;
   errors.clear() ;
   fakeconfig.mode[TIER_COMPUTE] = FAKE_LOSES ;
   fakeconfig.failat = 10 ;
   recordpoll poller ;
   backendselector sel ;
   setupselector(sel, poller) ;
   CHECK_EQ(sel.start(SEL_WIDTH, singleseed(SEL_WIDTH)), BACKEND_OK) ;
   CHECK_EQ(sel.gettier(), TIER_COMPUTE) ;
   ecarule rule(110) ;
   std::vector<generation> ref = reference(110, SEL_WIDTH, 40) ;
   runandcompare(sel, rule, ref, 10) ;
   CHECK_EQ(sel.gettier(), TIER_COMPUTE) ;
   // generation 11 is replayed on raster from generation 10
   runandcompare(sel, rule, ref, 30) ;
   CHECK_EQ(sel.getgeneration(), 40) ;
   CHECK_EQ(sel.gettier(), TIER_RASTER) ;
   CHECK_EQ(sel.getdemotions(), 1) ;
   CHECK(sel.getlast() == ref[40]) ;
   CHECK_EQ(errors.countwarnings("compute backend demoted"), 1) ;
   CHECK_EQ((int)poller.changes.size(), 2) ;
   if (poller.changes.size() == 2) {
      CHECK_EQ(poller.changes[1].from, TIER_COMPUTE) ;
      CHECK_EQ(poller.changes[1].to, TIER_RASTER) ;
      CHECK(strstr(poller.changes[1].why.c_str(), "device lost") != 0) ;
   }
}

static void testcascade(captureerrors &errors) {
   resetfakes() ;
   errors.clear() ;
   fakeconfig.mode[TIER_COMPUTE] = FAKE_LOSES ;
   fakeconfig.mode[TIER_RASTER] = FAKE_TIMES_OUT ;
   fakeconfig.failat = 5 ;
   recordpoll poller ;
   backendselector sel ;
   setupselector(sel, poller) ;
   CHECK_EQ(sel.start(SEL_WIDTH, singleseed(SEL_WIDTH)), BACKEND_OK) ;
   ecarule rule(54) ;
   std::vector<generation> ref = reference(54, SEL_WIDTH, 30) ;
   runandcompare(sel, rule, ref, 30) ;
   CHECK_EQ(sel.gettier(), TIER_CPU) ;
   CHECK_EQ(sel.getdemotions(), 2) ;
   CHECK_EQ(errors.countwarnings("compute timeout"), 1) ;
   CHECK_EQ((int)poller.changes.size(), 3) ;
}

static void testhealthloss(captureerrors &errors) {
   resetfakes() ;
   errors.clear() ;
   recordpoll poller ;
   backendselector sel ;
   setupselector(sel, poller) ;
   CHECK_EQ(sel.start(SEL_WIDTH, singleseed(SEL_WIDTH)), BACKEND_OK) ;
   ecarule rule(30) ;
   std::vector<generation> ref = reference(30, SEL_WIDTH, 20) ;
   runandcompare(sel, rule, ref, 5) ;
   CHECK_EQ(sel.checkhealth(), 0) ;
   sel.getbackend()->forceloss() ;
   CHECK_EQ(sel.checkhealth(), 1) ;
   CHECK_EQ(sel.gettier(), TIER_RASTER) ;
   CHECK(sel.getlast() == ref[5]) ;
   runandcompare(sel, rule, ref, 15) ;
   // no upgrade until the next start
   CHECK_EQ(sel.gettier(), TIER_RASTER) ;
   CHECK_EQ(sel.start(SEL_WIDTH, singleseed(SEL_WIDTH)), BACKEND_OK) ;
   CHECK_EQ(sel.gettier(), TIER_COMPUTE) ;
   CHECK_EQ(sel.getgeneration(), 0) ;
   CHECK(poller.changes.back().from == TIER_RASTER) ;
   CHECK(poller.changes.back().why == "restart") ;
   // a restart on the same tier is not a tier change
   size_t n = poller.changes.size() ;
   CHECK_EQ(sel.start(SEL_WIDTH, singleseed(SEL_WIDTH)), BACKEND_OK) ;
   CHECK_EQ(poller.changes.size(), n) ;
}

static void testasync() {
   resetfakes() ;
   fakeconfig.mode[TIER_COMPUTE] = FAKE_SLOW ;
   recordpoll poller ;
   backendselector sel ;
   setupselector(sel, poller) ;
   CHECK_EQ(sel.start(SEL_WIDTH, singleseed(SEL_WIDTH)), BACKEND_OK) ;
   ecarule rule(90) ;
   std::vector<generation> ref = reference(90, SEL_WIDTH, 3) ;
   generation g ;
   CHECK_EQ(sel.advance(rule, g), BACKEND_PENDING) ;
   CHECK_EQ(sel.isbusy(), 1) ;
   // the rule is fixed at issue time
   CHECK_EQ(sel.advance(ecarule(30), g), BACKEND_PENDING) ;
   CHECK_EQ(sel.advance(ecarule(30), g), BACKEND_OK) ;
   CHECK(g == ref[1]) ;
   CHECK_EQ(sel.isbusy(), 0) ;
   CHECK_EQ(sel.getgeneration(), 1) ;
   // abandoning drops the step; the last row is kept
   CHECK_EQ(sel.advance(rule, g), BACKEND_PENDING) ;
   sel.abandon() ;
   CHECK_EQ(sel.isbusy(), 0) ;
   CHECK(sel.getlast() == ref[1]) ;
}

static void testwidthzero(captureerrors &errors) {
   resetfakes() ;
   errors.clear() ;
   recordpoll poller ;
   backendselector sel ;
   sel.setoptions(testprefs()) ;
   sel.setpoll(&poller) ;
   CHECK_EQ(sel.start(0, generation()), INVALID_GRID_SIZE) ;
   CHECK_EQ(sel.getstate(), SELECTOR_UNINITIALIZED) ;
   CHECK_EQ(sel.gettier(), TIER_NONE) ;
   CHECK(sel.getbackend() == 0) ;
   CHECK_EQ(errors.countwarnings("invalid grid size"), NUMTIERS) ;
   CHECK_EQ((int)poller.changes.size(), 0) ;
   generation g ;
   CHECK_EQ(sel.advance(ecarule(30), g), BACKEND_UNAVAILABLE) ;
}

static void testfirsttier() {
   resetfakes() ;
   recordpoll poller ;
   backendselector sel ;
   setupselector(sel, poller) ;
   ecaprefs prefs = testprefs() ;
   prefs.first_tier = TIER_RASTER ;
   sel.setoptions(prefs) ;
   CHECK_EQ(sel.start(SEL_WIDTH, singleseed(SEL_WIDTH)), BACKEND_OK) ;
   CHECK_EQ(sel.gettier(), TIER_RASTER) ;
   CHECK_EQ(fakeconfig.created, 1) ;
}

int main() {
   captureerrors errors ;
   ecaerrors::seterrorhandler(&errors) ;
   testfallbacktocpu(errors) ;
   testboundedprobe(errors) ;
   testlosscontinuity(errors) ;
   testcascade(errors) ;
   testhealthloss(errors) ;
   testasync() ;
   testwidthzero(errors) ;
   testfirsttier() ;
   ecaerrors::seterrorhandler(0) ;
   return minitest_report("minitest_selector") ;
}
