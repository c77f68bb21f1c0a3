// This file is part of Ecaline.
// See docs/License.html for the copyright notice.

#include "generation.h"
#include "ecarules.h"
#include <zlib.h>

generation singleseed(int width) {
   generation g ;
   if (width <= 0)
      return g ;
   g.assign(width, 0) ;
   g[width / 2] = 1 ;
   return g ;
}

void stepgeneration(const unsigned char *table, const generation &src,
                    generation &dst) {
   int n = (int)src.size() ;
   dst.resize(n) ;
   if (n == 0)
      return ;
   for (int i=0; i<n; i++) {
      int left = src[(i - 1 + n) % n] ;
      int right = src[(i + 1) % n] ;
      dst[i] = table[neighborhood(left, src[i], right)] ;
   }
}

unsigned long rowdigest(const generation &g) {
   uLong crc = crc32(0L, Z_NULL, 0) ;
   if (!g.empty())
      crc = crc32(crc, (const Bytef *)&g[0], (uInt)g.size()) ;
   return crc ;
}

std::string rowtostring(const generation &g, char live, char dead) {
   std::string s(g.size(), dead) ;
   for (size_t i=0; i<g.size(); i++)
      if (g[i])
         s[i] = live ;
   return s ;
}

bool ismirror(const generation &g) {
   size_t n = g.size() ;
   for (size_t i=0; i<n/2; i++)
      if (g[i] != g[n-1-i])
         return false ;
   return true ;
}

int population(const generation &g) {
   int r = 0 ;
   for (size_t i=0; i<g.size(); i++)
      if (g[i])
         r++ ;
   return r ;
}
