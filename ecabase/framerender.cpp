// This file is part of Ecaline.
// See docs/License.html for the copyright notice.

#include "framerender.h"
#include "ecaprefs.h"
#include <math.h>
#include <string.h>

// golden ramp
static const double rampred = 212, rampgreen = 175, rampblue = 55 ;

static const framestyle backgroundstyle = { 0.2, 0.1, 0.3, 0.08, false } ;
static const framestyle headerstyle = { 0.3, 0.2, 0.4, 1.0, true } ;

// breathing range and step per frame
static const double minbreath = 0.2, maxbreath = 0.6, breathstep = 0.01 ;

framerender::framerender() : cellsize(3), globalalpha(1.0), fadedirection(1.0) {
   setstyle(STYLE_BACKGROUND) ;
}

void framerender::setstyle(int renderstyle) {
   style = renderstyle == STYLE_HEADER ? headerstyle : backgroundstyle ;
   globalalpha = style.breathing ? 0.3 : 1.0 ;
   fadedirection = 1.0 ;
}

void framerender::breathe() {
   if (!style.breathing)
      return ;
   globalalpha += fadedirection * breathstep ;
   if (globalalpha >= maxbreath) {
      globalalpha = maxbreath ;
      fadedirection = -1.0 ;
   } else if (globalalpha <= minbreath) {
      globalalpha = minbreath ;
      fadedirection = 1.0 ;
   }
}

void framerender::cellcolor(int cols, int totalrows, int col, int row, int currentrow,
                            unsigned char *rgba) const {
   double dx = col - cols / 2.0 ;
   double dy = row - currentrow / 2.0 ;
   double maxdist = sqrt(cols * cols / 4.0 + totalrows * totalrows / 4.0) ;
   double intensity = 1.0 - sqrt(dx * dx + dy * dy) / maxdist ;
   if (intensity < style.minintensity)
      intensity = style.minintensity ;
   double age = currentrow - row ;
   double agefactor = 1.0 - age / (totalrows * style.agespan) ;
   if (agefactor < style.minage)
      agefactor = style.minage ;
   double strength = intensity * agefactor ;
   double alpha = strength * style.basealpha * globalalpha ;
   rgba[0] = (unsigned char)floor(rampred * strength) ;
   rgba[1] = (unsigned char)floor(rampgreen * strength) ;
   rgba[2] = (unsigned char)floor(rampblue * strength) ;
   rgba[3] = (unsigned char)floor(alpha * 255.0 + 0.5) ;
}

void framerender::draw(ecarender &r, const std::vector<generation> &history, int totalrows) {
   breathe() ;
   if (history.empty())
      return ;
   int cols = (int)history[0].size() ;
   if (totalrows < (int)history.size())
      totalrows = (int)history.size() ;
   int w = cols * cellsize ;
   // leave a one pixel gap between cells when there is room for it
   int drawn = cellsize > 1 ? cellsize - 1 : 1 ;
   int currentrow = (int)history.size() - 1 ;
   // distance and age fade are relative to the rows drawn so far
   int drawnrows = (int)history.size() ;
   r.beginframe(w, totalrows * cellsize) ;
   strip.resize(4 * (size_t)w * cellsize) ;
   for (int row=0; row<(int)history.size(); row++) {
      const generation &g = history[row] ;
      memset(&strip[0], 0, strip.size()) ;
      int live = 0 ;
      for (int col=0; col<cols && col<(int)g.size(); col++) {
         if (!g[col])
            continue ;
         unsigned char rgba[4] ;
         cellcolor(cols, drawnrows, col, row, currentrow, rgba) ;
         for (int y=0; y<drawn; y++) {
            unsigned char *p = &strip[4 * ((size_t)y * w + col * cellsize)] ;
            for (int x=0; x<drawn; x++, p += 4)
               memcpy(p, rgba, 4) ;
         }
         live++ ;
      }
      if (live)
         r.pixblit(0, row * cellsize, w, cellsize, &strip[0]) ;
   }
   r.endframe() ;
}
