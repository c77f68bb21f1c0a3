// This file is part of Ecaline.
// See docs/License.html for the copyright notice.

/**
 *   Encapsulate a class capable of receiving rendered frames.  The
 *   frame renderer only uses pixblit calls, each with a block of RGBA
 *   pixels that is composited over what is already there.
 *
 *   If clipping is needed, it's the responsibility of these routines,
 *   *not* the caller.
 */
#ifndef ECARENDER_H
#define ECARENDER_H
#include <stddef.h>
#include <vector>
class ecarender {
public:
   virtual ~ecarender() ;
   // start a frame of the given size in pixels
   virtual void beginframe(int w, int h) ;
   // pm contains 4*w*h bytes where each byte quadruplet holds the
   // RGBA values for the corresponding pixel
   virtual void pixblit(int x, int y, int w, int h, const unsigned char *pm) ;
   virtual void endframe() ;
} ;
/**
 *   Keeps the frame in memory, cleared to transparent black at the
 *   start of each frame and blended source-over.
 */
class surfacerender : public ecarender {
public:
   surfacerender() : wd(0), ht(0), frames(0) {}
   virtual void beginframe(int w, int h) ;
   virtual void pixblit(int x, int y, int w, int h, const unsigned char *pm) ;
   virtual void endframe() { frames++ ; }
   int getwidth() const { return wd ; }
   int getheight() const { return ht ; }
   int getframes() const { return frames ; }
   const unsigned char *getpixel(int x, int y) const {
      return &pixels[4 * ((size_t)y * wd + x)] ;
   }
   const std::vector<unsigned char> &getpixels() const { return pixels ; }
private:
   std::vector<unsigned char> pixels ;
   int wd, ht ;
   int frames ;
} ;
#endif
