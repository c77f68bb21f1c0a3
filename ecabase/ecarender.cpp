// This file is part of Ecaline.
// See docs/License.html for the copyright notice.

#include "ecarender.h"
#include "util.h"
ecarender::~ecarender() {}
void ecarender::beginframe(int, int) {}
void ecarender::pixblit(int, int, int, int, const unsigned char *) {
   ecafatal("pixblit not implemented") ;
}
void ecarender::endframe() {}
void surfacerender::beginframe(int w, int h) {
   wd = w < 0 ? 0 : w ;
   ht = h < 0 ? 0 : h ;
   pixels.assign(4 * (size_t)wd * ht, 0) ;
}
void surfacerender::pixblit(int x, int y, int w, int h, const unsigned char *pm) {
   int ymin = y < 0 ? 0 : y ;
   int ymax = ht < y+h ? ht-1 : y+h-1 ;
   int xmin = x < 0 ? 0 : x ;
   int xmax = wd < x+w ? wd-1 : x+w-1 ;
   if (ymax < ymin || xmax < xmin)
      return ;
   for (int yy=ymin; yy<=ymax; yy++) {
      const unsigned char *rp = pm + 4 * ((size_t)(yy - y) * w + (xmin - x)) ;
      unsigned char *wp = &pixels[4 * ((size_t)yy * wd + xmin)] ;
      for (int xx=xmin; xx<=xmax; xx++, rp += 4, wp += 4) {
         int a = rp[3] ;
         if (a == 0)
            continue ;
         for (int c=0; c<3; c++)
            wp[c] = (unsigned char)((rp[c] * a + wp[c] * (255 - a) + 127) / 255) ;
         wp[3] = (unsigned char)(a + (wp[3] * (255 - a) + 127) / 255) ;
      }
   }
}
