// This file is part of Ecaline.
// See docs/License.html for the copyright notice.

#ifndef FRAMERENDER_H
#define FRAMERENDER_H
#include "generation.h"
#include "ecarender.h"
#include <vector>
/**
 *   Cosmetic compositing of the session history.  Live cells get a
 *   golden ramp that fades with the distance from the middle of the
 *   drawn area and with the age of the row.  Nothing here feeds back
 *   into the computed generations.
 */
struct framestyle {
   double minintensity ;
   double minage ;
   double agespan ;     // fraction of the rows over which a row fades out
   double basealpha ;
   bool breathing ;     // oscillate the global alpha each frame
} ;

class framerender {
public:
   framerender() ;
   void setstyle(int renderstyle) ;
   const framestyle &getstyle() const { return style ; }
   void setcellsize(int cs) { cellsize = cs < 1 ? 1 : cs ; }
   int getcellsize() const { return cellsize ; }
   // composite history (row 0 first) into a frame sized for totalrows
   void draw(ecarender &r, const std::vector<generation> &history, int totalrows) ;
   // color and alpha of a live cell at (col,row) as draw() computes them;
   // totalrows is the number of rows drawn so far
   void cellcolor(int cols, int totalrows, int col, int row, int currentrow,
                  unsigned char *rgba) const ;
   double getglobalalpha() const { return globalalpha ; }
private:
   void breathe() ;
   framestyle style ;
   int cellsize ;
   double globalalpha ;
   double fadedirection ;
   std::vector<unsigned char> strip ;
} ;
#endif
