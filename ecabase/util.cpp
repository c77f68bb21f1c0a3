// This file is part of Ecaline.
// See docs/License.html for the copyright notice.

#include "util.h"
#include <stdio.h>
#include <stdlib.h>
#include <stdarg.h>

#ifdef _WIN32
#include <windows.h>
#else
#include <sys/time.h>
#include <time.h>
#endif

/**
 *   For now error just uses stderr.
 */
class baseecaerrors : public ecaerrors {
public:
   virtual void fatal(const char *s) {
      fprintf(stderr, "%s\n", s) ;
      exit(10) ;
   }
   virtual void warning(const char *s) {
      fprintf(stderr, "%s\n", s) ;
   }
   virtual void status(const char *s) {
      fprintf(stderr, "%s\n", s) ;
   }
} ;

static baseecaerrors baseecaerrors_instance ;
static ecaerrors *errorhandler = &baseecaerrors_instance ;

void ecaerrors::seterrorhandler(ecaerrors *o) {
  if (o == 0)
    errorhandler = &baseecaerrors_instance ;
  else
    errorhandler = o ;
}

void ecafatal(const char *s) {
   errorhandler->fatal(s) ;
}

void ecawarning(const char *s) {
   errorhandler->warning(s) ;
}

void ecastatus(const char *s) {
   errorhandler->status(s) ;
}

void ecawarningf(const char *fmt, ...) {
   char buf[ECAMSGSIZE] ;
   va_list args ;
   va_start(args, fmt) ;
   vsnprintf(buf, sizeof(buf), fmt, args) ;
   va_end(args) ;
   errorhandler->warning(buf) ;
}

void ecastatusf(const char *fmt, ...) {
   char buf[ECAMSGSIZE] ;
   va_list args ;
   va_start(args, fmt) ;
   vsnprintf(buf, sizeof(buf), fmt, args) ;
   va_end(args) ;
   errorhandler->status(buf) ;
}

#ifdef _WIN32
static double freq = 0.0;
double ecaSecondCount() {
   LARGE_INTEGER now;
   if (freq == 0.0) {
      LARGE_INTEGER f;
      QueryPerformanceFrequency(&f);
      freq = (double)f.QuadPart;
      if (freq <= 0.0) freq = 1.0;	// play safe and avoid div by 0
   }
   QueryPerformanceCounter(&now);
   return (now.QuadPart) / freq;
}
void ecaSleep(int ms) {
   if (ms > 0)
      Sleep(ms) ;
}
#else
double ecaSecondCount() {
   struct timeval tv ;
   gettimeofday(&tv, 0) ;
   return tv.tv_sec + 0.000001 * tv.tv_usec ;
}
void ecaSleep(int ms) {
   if (ms <= 0)
      return ;
   struct timespec ts ;
   ts.tv_sec = ms / 1000 ;
   ts.tv_nsec = (long)(ms % 1000) * 1000000L ;
   nanosleep(&ts, 0) ;
}
#endif
