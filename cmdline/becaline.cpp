// This file is part of Ecaline.
// See docs/License.html for the copyright notice.

#include "ecaengine.h"
#include "ecaprefs.h"
#include "ecarules.h"
#include "generation.h"
#include "capabilities.h"
#include "util.h"
#include <stdlib.h>
#include <iostream>
#include <cstdio>
#include <string.h>
#include <cstdlib>

using namespace std ;

double start ;
int maxtime = 0 ;
double timestamp() {
   double now = ecaSecondCount() ;
   double r = now - start ;
   if (start == 0)
      start = now ;
   else if (maxtime && r > maxtime)
      exit(0) ;
   return r ;
}

ecaengine engine ;
ecaprefs prefs ;

int benchmark ; // show timing?
/*
 *   This is our standard ecaerrors.
 */
class stderrors : public ecaerrors {
public:
   stderrors() {}
   virtual void fatal(const char *s) { cout << "Fatal error: " << s << endl ; exit(10) ; }
   virtual void warning(const char *s) { cout << "Warning: " << s << endl ; }
   virtual void status(const char *s) {
      if (benchmark)
         cout << timestamp() << " " << s << endl ;
      else {
         timestamp() ;
         cout << s << endl ;
      }
   }
} ;
stderrors stderrors_instance ;

/*
 *   Reports tier changes and completed runs as they happen.
 */
class hostpoll : public ecapoll {
public:
   virtual void tierchanged(int from, int to, const char *why) {
      cout << "Tier " << tiername(from) << " -> " << tiername(to)
           << " (" << why << ")" << endl ;
   }
   virtual void runcompleted(int ruleid) {
      cout << "Run completed for " << rulename(ruleid) << endl ;
   }
} ;
hostpoll hostpoll_instance ;

struct options {
  const char *shortopt ;
  const char *longopt ;
  const char *desc ;
  char opttype ;
  void *data ;
} ;
char *rulestr = 0 ;
int gridwidth = -1 ;
int maxgen = -1 ;
char *tierstr = 0 ;
int quiet, verbose, detect, runbench, digest ;
int loseat = -1 ;
int iterations = BENCHMARK_ITERATIONS ;
char *testscript = 0 ;
options options[] = {
  { "-r", "--rule", "Wolfram rule to use (0..255 or Wn)", 's', &rulestr },
  { "-w", "--width", "Cells per generation", 'i', &gridwidth },
  { "-m", "--generation", "Generations to produce (including the seed row)", 'i', &maxgen },
  { "-a", "--tier", "Highest tier to probe (compute, raster, cpu)", 's', &tierstr },
  { "-s", "--set", "Set keyword=value", 'p', &prefs },
  { "-T", "--maxtime", "Max duration", 'i', &maxtime },
  { "-b", "--timestamps", "Show timestamps", 'b', &benchmark },
  { "-q", "--quiet", "Don't show rows; twice, don't show anything", 'b', &quiet },
  { "-v", "--verbose", "Verbose", 'b', &verbose },
  { "",   "--detect", "Report which tiers are available", 'b', &detect },
  { "",   "--benchmark", "Time every tier at several grid sizes", 'b', &runbench },
  { "-i", "--iterations", "Generations per benchmark run", 'i', &iterations },
  { "",   "--lose", "Simulate a device loss at this generation", 'i', &loseat },
  { "",   "--digest", "Print a CRC-32 digest instead of each row", 'b', &digest },
  { "",   "--exec", "Run testing script", 's', &testscript },
  { 0, 0, 0, 0, 0 }
} ;

void usage(const char *s) {
  fprintf(stderr, "Usage:  becaline [options]\n") ;
  for (int i=0; options[i].shortopt; i++)
    fprintf(stderr, "%3s %-15s %s\n", options[i].shortopt, options[i].longopt,
            options[i].desc) ;
  if (s)
    ecafatal(s) ;
  exit(0) ;
}

#define STRINGIFY(ARG) STR2(ARG)
#define STR2(ARG) #ARG

void showrow(int gen, const generation &g) {
   if (quiet)
      return ;
   if (benchmark)
      cout << timestamp() << " " ;
   else
      timestamp() ;
   cout << gen << ": " ;
   if (digest) {
      char buf[16] ;
      snprintf(buf, sizeof(buf), "%08lx", rowdigest(g)) ;
      cout << buf << " pop " << population(g) << endl ;
   } else {
      cout << rowtostring(g) << endl ;
   }
}

void showcurrent() {
   const vector<generation> &h = engine.gethistory() ;
   if (h.empty())
      cout << "No generation (engine idle)" << endl ;
   else
      showrow((int)h.size() - 1, h.back()) ;
}

// advance one generation, applying a scheduled loss first
int advanceone() {
   if (loseat >= 0 && engine.getgeneration() == loseat) {
      cout << "Simulating device loss at generation " << loseat << endl ;
      engine.forceloss() ;
      loseat = -1 ;
   }
   int r = engine.step() ;
   if (r != BACKEND_OK)
      ecawarningf("step failed: %s", statusname(r)) ;
   return r ;
}

const int MAXCMDLENGTH = 2048 ;
struct cmdbase {
   cmdbase(const char *cmdarg, const char *argsarg) {
      verb = cmdarg ;
      args = argsarg ;
      next = list ;
      list = this ;
   }
   const char *verb ;
   const char *args ;
   int iargs[4] ;
   char sarg[MAXCMDLENGTH+2] ;
   virtual void doit() {}
   int parseargs(const char *cmdargs) {
      int iargn = 0 ;
      for (const char *rargs = args; *rargs; rargs++) {
         while (*cmdargs && *cmdargs <= ' ')
            cmdargs++ ;
         if (*cmdargs == 0) {
            ecawarning("Missing needed argument") ;
            return 0 ;
         }
         switch (*rargs) {
         case 'i':
           if (sscanf(cmdargs, "%d", iargs+iargn) != 1) {
             ecawarning("Missing needed integer argument") ;
             return 0 ;
           }
           iargn++ ;
           break ;
         case 's':
           if (sscanf(cmdargs, "%s", sarg) != 1) {
             ecawarning("Missing needed string argument") ;
             return 0 ;
           }
           break ;
         default:
           ecafatal("Internal error in parseargs") ;
         }
         while (*cmdargs && *cmdargs > ' ')
           cmdargs++ ;
      }
      return 1 ;
   }
   static void docmd(const char *cmdline) {
      while (*cmdline && *cmdline <= ' ')
         cmdline++ ;
      if (*cmdline == 0 || *cmdline == '#')
         return ;
      for (cmdbase *cmd=list; cmd; cmd = cmd->next)
         if (strncmp(cmdline, cmd->verb, strlen(cmd->verb)) == 0 &&
             cmdline[strlen(cmd->verb)] <= ' ') {
            if (cmd->parseargs(cmdline+strlen(cmd->verb))) {
               cmd->doit() ;
            }
            return ;
         }
      ecawarning("Didn't understand command") ;
   }
   cmdbase *next ;
   virtual ~cmdbase() {}
   static cmdbase *list ;
} ;

cmdbase *cmdbase::list = 0 ;

struct startcmd : public cmdbase {
   startcmd() : cmdbase("start", "") {}
   virtual void doit() {
      engine.setprefs(prefs) ;
      if (engine.start() == BACKEND_OK)
         showcurrent() ;
   }
} start_inst ;
struct rulecmd : public cmdbase {
   rulecmd() : cmdbase("rule", "s") {}
   virtual void doit() {
      const char *err = engine.setrule(sarg) ;
      if (err != 0)
         ecawarning(err) ;
      else {
         prefs.rule = engine.getrule().getid() ;
         showcurrent() ;
      }
   }
} rule_inst ;
struct stepcmd : public cmdbase {
   stepcmd() : cmdbase("step", "i") {}
   virtual void doit() {
      for (int i=0; i<iargs[0] && !engine.isdone(); i++) {
         if (advanceone() != BACKEND_OK)
            return ;
         showcurrent() ;
      }
   }
} step_inst ;
struct runcmd : public cmdbase {
   runcmd() : cmdbase("run", "") {}
   virtual void doit() {
      while (!engine.isidle() && !engine.isdone()) {
         if (advanceone() != BACKEND_OK)
            return ;
         showcurrent() ;
      }
   }
} run_inst ;
struct showcmd : public cmdbase {
   showcmd() : cmdbase("show", "") {}
   virtual void doit() {
      showcurrent() ;
   }
} show_inst ;
struct losecmd : public cmdbase {
   losecmd() : cmdbase("lose", "") {}
   virtual void doit() {
      engine.forceloss() ;
      cout << "Device loss simulated on " << engine.gettiername() << endl ;
   }
} lose_inst ;
struct tiercmd : public cmdbase {
   tiercmd() : cmdbase("tier", "") {}
   virtual void doit() {
      ecabackend *b = engine.getselector().getbackend() ;
      cout << "Tier " << engine.gettiername() ;
      if (b)
         cout << ": " << b->getinfo() ;
      cout << endl ;
   }
} tier_inst ;
struct fpscmd : public cmdbase {
   fpscmd() : cmdbase("fps", "") {}
   virtual void doit() {
      cout << "FPS " << engine.getfps() << " over "
           << engine.getmonitor().getsamples() << " frames" << endl ;
   }
} fps_inst ;
struct setcmd : public cmdbase {
   setcmd() : cmdbase("set", "s") {}
   virtual void doit() {
      // start from the engine's settings so rule and width commands stick
      ecaprefs p = engine.getprefs() ;
      const char *err = p.setpref(sarg) ;
      if (err != 0) {
         ecawarning(err) ;
      } else {
         prefs = p ;
         engine.setprefs(prefs) ;
      }
   }
} set_inst ;
struct prefscmd : public cmdbase {
   prefscmd() : cmdbase("prefs", "") {}
   virtual void doit() {
      prefs.writeprefs(stdout) ;
   }
} prefs_inst ;
struct quitcmd : public cmdbase {
   quitcmd() : cmdbase("quit", "") {}
   virtual void doit() {
      cout << "Buh-bye!" << endl ;
      exit(10) ;
   }
} quit_inst ;
struct helpcmd : public cmdbase {
   helpcmd() : cmdbase("help", "") {}
   virtual void doit() {
      for (cmdbase *cmd=list; cmd; cmd = cmd->next)
         cout << cmd->verb << " " << cmd->args << endl ;
   }
} help_inst ;

void runtestscript(const char *testscript) {
   FILE *cmdfile = 0 ;
   if (strcmp(testscript, "-") != 0)
      cmdfile = fopen(testscript, "r") ;
   else
      cmdfile = stdin ;
   char cmdline[MAXCMDLENGTH + 10] ;
   if (cmdfile == 0)
      ecafatal("Cannot open testscript") ;
   for (;;) {
     cerr << flush ;
     if (cmdfile == stdin)
       cout << "becaline> " << flush ;
     else
       cout << flush ;
     if (fgets(cmdline, MAXCMDLENGTH, cmdfile) == 0)
        break ;
     cmdbase::docmd(cmdline) ;
   }
   exit(0) ;
}

void showcapabilities() {
   capabilityreport report = detectcapabilities(prefs) ;
   for (int t=NUMTIERS-1; t>=TIER_CPU; t--) {
      const tiercapability &c = report.tiers[t] ;
      cout << tiername(t) << ": " ;
      if (c.available)
         cout << "available; " << c.info << endl ;
      else
         cout << "unavailable; " << statusname(c.status) << " (" << c.reason << ")" << endl ;
   }
   cout << "recommended: " << tiername(report.recommended) << endl ;
}

void showbenchmark() {
   vector<benchmarkresult> results = runbenchmark(prefs, defaultbenchmarksizes(), iterations) ;
   for (size_t i=0; i<results.size(); i++) {
      const benchmarkresult &b = results[i] ;
      char buf[256] ;
      if (b.status == BACKEND_OK)
         snprintf(buf, sizeof(buf),
                  "%-7s width %5d: total %.4fs avg %.6fs %.1f gens/s speedup %.2f digest %08lx",
                  tiername(b.tier), b.gridsize, b.totaltime, b.averagetime, b.ips,
                  b.speedup, b.digest) ;
      else
         snprintf(buf, sizeof(buf), "%-7s width %5d: %s (%s)", tiername(b.tier),
                  b.gridsize, statusname(b.status), b.error.c_str()) ;
      cout << buf << endl ;
   }
}

int main(int argc, char *argv[]) {
   cout << "This is becaline " STRINGIFY(VERSION) " Copyright 2005-2018 The Golly Gang and the Ecaline authors."
        << endl ;
   cout << "-" ;
   for (int i=0; i<argc; i++)
      cout << " " << argv[i] ;
   cout << endl << flush ;
   registerbackends() ;
   while (argc > 1 && argv[1][0] == '-') {
      argc-- ;
      argv++ ;
      char *opt = argv[0] ;
      int hit = 0 ;
      for (int i=0; options[i].shortopt; i++) {
        if ((options[i].shortopt[0] && strcmp(opt, options[i].shortopt) == 0) ||
            strcmp(opt, options[i].longopt) == 0) {
          switch (options[i].opttype) {
case 'i':
             if (argc < 2)
                ecafatal("Bad option argument") ;
             *(int *)options[i].data = atol(argv[1]) ;
             argc-- ;
             argv++ ;
             break ;
case 'b':
             (*(int *)options[i].data) += 1 ;
             break ;
case 's':
             if (argc < 2)
                ecafatal("Bad option argument") ;
             *(char **)options[i].data = argv[1] ;
             argc-- ;
             argv++ ;
             break ;
case 'p':
             {
                if (argc < 2)
                   ecafatal("Bad option argument") ;
                const char *err = ((ecaprefs *)options[i].data)->setpref(argv[1]) ;
                if (err)
                   ecafatal(err) ;
                argc-- ;
                argv++ ;
             }
             break ;
          }
          hit++ ;
          break ;
        }
      }
      if (!hit)
         usage("Bad option given") ;
   }
   if (argc > 1)
      usage("Extra stuff after options") ;
   ecaerrors::seterrorhandler(&stderrors_instance) ;
   const char *err = 0 ;
   if (rulestr && (err = prefs.setpref("rule", rulestr)) != 0)
      ecafatal(err) ;
   if (tierstr && (err = prefs.setpref("first_tier", tierstr)) != 0)
      ecafatal(err) ;
   if (gridwidth >= 0) {
      char buf[32] ;
      snprintf(buf, sizeof(buf), "%d", gridwidth) ;
      if ((err = prefs.setpref("grid_width", buf)) != 0)
         ecafatal(err) ;
   }
   if (maxgen >= 0) {
      char buf[32] ;
      snprintf(buf, sizeof(buf), "%d", maxgen) ;
      if ((err = prefs.setpref("generation_count", buf)) != 0)
         ecafatal(err) ;
   }
   if (verbose)
      prefs.verbose = true ;
   // a batch run is never paced
   prefs.interval_ms = 0 ;
   timestamp() ;
   if (detect) {
      showcapabilities() ;
      exit(0) ;
   }
   if (runbench) {
      showbenchmark() ;
      exit(0) ;
   }
   engine.setpoll(&hostpoll_instance) ;
   engine.setprefs(prefs) ;
   if (testscript)
      runtestscript(testscript) ;
   if (engine.start() != BACKEND_OK) {
      if (quiet < 2)
         cout << "No backend could run a grid of width " << prefs.grid_width << endl ;
      exit(1) ;
   }
   showcurrent() ;
   while (!engine.isdone()) {
      if (advanceone() != BACKEND_OK)
         exit(1) ;
      showcurrent() ;
   }
   if (quiet < 2) {
      const generation &last = engine.gethistory().back() ;
      char buf[16] ;
      snprintf(buf, sizeof(buf), "%08lx", rowdigest(last)) ;
      cout << "Final tier " << engine.gettiername() << ", generation "
           << engine.getgeneration() << ", digest " << buf << endl ;
   }
   exit(0) ;
}
