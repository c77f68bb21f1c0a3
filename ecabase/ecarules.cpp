// This file is part of Ecaline.
// See docs/License.html for the copyright notice.

#include "ecarules.h"
#include <stdio.h>
#include <ctype.h>      // for isdigit, tolower

static unsigned char alltables[NUMRULES][NUMNEIGHBORHOODS] ;
static bool tablesbuilt = false ;

static void buildtables() {
   for (int r=0; r<NUMRULES; r++)
      totable(r, alltables[r]) ;
   tablesbuilt = true ;
}

void totable(int ruleid, unsigned char *table) {
   for (int i=0; i<NUMNEIGHBORHOODS; i++)
      table[i] = (unsigned char)((ruleid >> i) & 1) ;
}

int fromtable(const unsigned char *table) {
   int r = 0 ;
   for (int i=0; i<NUMNEIGHBORHOODS; i++)
      if (table[i])
         r |= 1 << i ;
   return r ;
}

const unsigned char *ruletable(int ruleid) {
   if (ruleid < 0 || ruleid >= NUMRULES)
      return 0 ;
   if (!tablesbuilt)
      buildtables() ;
   return alltables[ruleid] ;
}

bool ismirrorsymmetric(int ruleid) {
   const unsigned char *t = ruletable(ruleid) ;
   if (t == 0)
      return false ;
   // swapping left and right maps 1<->4 and 3<->6; 0, 2, 5, 7 are fixed
   return t[1] == t[4] && t[3] == t[6] ;
}

const char *rulename(int ruleid) {
   static char name[MAXRULENAME] ;
   if (ruleid < 0 || ruleid >= NUMRULES)
      snprintf(name, sizeof(name), "W?") ;
   else
      snprintf(name, sizeof(name), "W%d", ruleid) ;
   return name ;
}

const char *parserule(const char *s, int &ruleid) {
   if (s == 0)
      return "No rule given." ;
   const char *p = s ;
   while (*p == ' ' || *p == '\t')
      p++ ;
   // optional "rule" prefix
   if (tolower(p[0]) == 'r' && tolower(p[1]) == 'u' &&
       tolower(p[2]) == 'l' && tolower(p[3]) == 'e') {
      p += 4 ;
      while (*p == ' ' || *p == '\t')
         p++ ;
   }
   // optional W prefix as used by Wolfram rule strings
   if (*p == 'w' || *p == 'W')
      p++ ;
   if (!isdigit((unsigned char)*p))
      return "Bad character in rule." ;
   int r = 0 ;
   while (isdigit((unsigned char)*p)) {
      r = 10 * r + (*p - '0') ;
      if (r >= NUMRULES)
         return "Rule must be a number from 0 to 255." ;
      p++ ;
   }
   while (*p == ' ' || *p == '\t' || *p == '\n' || *p == '\r')
      p++ ;
   if (*p != 0)
      return "Bad character in rule." ;
   ruleid = r ;
   return 0 ;
}

ecarule::ecarule() {
   setrule(30) ;
}

ecarule::ecarule(int ruleid) {
   if (setrule(ruleid) != 0)
      setrule(30) ;
}

const char *ecarule::setrule(int ruleid) {
   const unsigned char *t = ruletable(ruleid) ;
   if (t == 0)
      return "Rule must be a number from 0 to 255." ;
   id = ruleid ;
   table = t ;
   snprintf(canonrule, sizeof(canonrule), "W%d", id) ;
   return 0 ;
}

const char *ecarule::setrule(const char *s) {
   int r ;
   const char *err = parserule(s, r) ;
   if (err)
      return err ;
   return setrule(r) ;
}
