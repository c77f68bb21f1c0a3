// This file is part of Ecaline.
// See docs/License.html for the copyright notice.

/**
 *   Elementary (Wolfram) rules.  A rule id in 0..255 encodes the next
 *   state for each of the eight left/center/right neighborhoods; bit i
 *   of the id is the result for neighborhood i = (left<<2)|(center<<1)|right.
 *
 *   The transition tables for all 256 rules live in one fixed array that
 *   is filled on first use, so a table pointer stays valid for the life
 *   of the program and a rule is always replaced wholesale.
 */
#ifndef ECARULES_H
#define ECARULES_H
const int NUMRULES = 256 ;        // rule ids are 0..255
const int NUMNEIGHBORHOODS = 8 ;  // 3-bit left/center/right index
const int MAXRULENAME = 16 ;      // enough for "W255" and a terminator

// fill table[0..7] from the given rule id (which must be in 0..255)
void totable(int ruleid, unsigned char *table) ;
// inverse of totable; table entries are treated as 0 or non-zero
int fromtable(const unsigned char *table) ;
// shared immutable table for the given rule id, or 0 if out of range
const unsigned char *ruletable(int ruleid) ;
// neighborhood index for the given cells (each 0 or 1)
inline int neighborhood(int left, int center, int right) {
   return (left << 2) | (center << 1) | right ;
}
// is the rule invariant under left/right reflection?
bool ismirrorsymmetric(int ruleid) ;
// canonical "W<n>" name; the result is a static buffer
const char *rulename(int ruleid) ;

class ecarule {
public:
   ecarule() ;
   ecarule(int ruleid) ;
   // accepts "30", "W30", "w30" or "rule 30"; returns an error message
   // (and leaves the rule unchanged) if the string is not a valid rule
   const char *setrule(const char *s) ;
   const char *setrule(int ruleid) ;
   // canonical form, eg. "W30"
   const char *getrule() const { return canonrule ; }
   int getid() const { return id ; }
   const unsigned char *gettable() const { return table ; }
   int next(int left, int center, int right) const {
      return table[neighborhood(left, center, right)] ;
   }
   bool operator==(const ecarule &r) const { return id == r.id ; }
   bool operator!=(const ecarule &r) const { return id != r.id ; }
private:
   int id ;
   const unsigned char *table ;
   char canonrule[MAXRULENAME] ;
} ;

// parse a rule string without building an ecarule; returns an error
// message or 0 on success
const char *parserule(const char *s, int &ruleid) ;
#endif
