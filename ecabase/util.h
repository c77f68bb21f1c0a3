// This file is part of Ecaline.
// See docs/License.html for the copyright notice.

/**
 *   Basic utility classes for things like fatal errors.
 */
#ifndef ECA_UTIL_H
#define ECA_UTIL_H

void ecafatal(const char *s) ;
void ecawarning(const char *s) ;
void ecastatus(const char *s) ;
/**
 *   printf-style versions of the above; messages longer than
 *   ECAMSGSIZE-1 characters are truncated.
 */
const int ECAMSGSIZE = 512 ;
void ecawarningf(const char *fmt, ...) ;
void ecastatusf(const char *fmt, ...) ;
/**
 *   To substitute your own routines, use the following class.
 */
class ecaerrors {
public:
   virtual ~ecaerrors() {}
   virtual void fatal(const char *s) = 0 ;
   virtual void warning(const char *s) = 0 ;
   virtual void status(const char *s) = 0 ;
   static void seterrorhandler(ecaerrors *obj) ;
} ;
/**
 *   A routine to get the number of seconds elapsed since an arbitrary
 *   point, as a double.
 */
double ecaSecondCount() ;
/**
 *   Block the calling thread for the given number of milliseconds.
 *   Only the selector's probe loop uses this.
 */
void ecaSleep(int ms) ;
#endif
