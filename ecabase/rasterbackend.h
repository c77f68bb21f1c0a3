// This file is part of Ecaline.
// See docs/License.html for the copyright notice.

/**
 *   OpenGL ES 3.0 backend.  A generation is a one-row R8 texture; a
 *   fragment program computes the next row into the other texture's
 *   framebuffer.  The texture repeats horizontally so the neighbors of
 *   the edge cells come from the sampler, not from index arithmetic.
 */
#ifndef RASTERBACKEND_H
#define RASTERBACKEND_H
#include "ecabackend.h"
#include "statepair.h"
#include "glcontext.h"
#include <vector>

struct rastertarget {
   rastertarget() : texture(0), framebuffer(0) {}
   GLuint texture ;
   GLuint framebuffer ;
} ;

class rasterbackend : public ecabackend {
public:
   rasterbackend() ;
   virtual ~rasterbackend() ;
   virtual int init(int width) ;
   virtual int upload(const generation &g) ;
   virtual int readback(generation &g) ;
   virtual int computenext(const ecarule &rule) ;
   virtual int collect(generation &g) ;
   virtual void dispose() ;
   virtual int checkhealth() ;
   virtual int gettier() const { return TIER_RASTER ; }
   static void doInitializeBackendInfo(staticBackendInfo &) ;
private:
   int buildprogram() ;
   int readtarget(const rastertarget &t, generation &g) ;
   int glerror(const char *where) ;
   glcontext ctx ;
   GLuint program ;
   GLuint quadbuffer ;
   GLuint vertexarray ;
   GLint ruleloc, widthloc, stateloc ;
   int lastrule ;
   statepair<rastertarget> targets ;
   std::vector<unsigned char> pixels ;
} ;
#endif
