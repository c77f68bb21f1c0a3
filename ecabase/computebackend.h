// This file is part of Ecaline.
// See docs/License.html for the copyright notice.

/**
 *   OpenGL ES 3.1 backend.  A compute program reads one storage buffer
 *   and writes the other; the result is copied into a staging buffer
 *   and a fence marks when it may be mapped.  collect() never blocks:
 *   it reports BACKEND_PENDING until the fence has signalled, or
 *   COMPUTE_TIMEOUT once the readback deadline has passed.
 */
#ifndef COMPUTEBACKEND_H
#define COMPUTEBACKEND_H
#include "ecabackend.h"
#include "statepair.h"
#include "glcontext.h"
#include <vector>
#include <string>

// matches the std140 layout of the Params block in the compute program
struct computeparams {
   GLuint gridsize ;
   GLuint pad[3] ;
   GLuint rule[NUMNEIGHBORHOODS] ;
} ;

// GLSL of the compute program for the given workgroup size
std::string computeshadersource(int workgroup) ;

class computebackend : public ecabackend {
public:
   computebackend() ;
   virtual ~computebackend() ;
   virtual void setoptions(const ecaprefs &prefs) ;
   virtual int init(int width) ;
   virtual int pollinit() ;
   virtual int upload(const generation &g) ;
   virtual int readback(generation &g) ;
   virtual int computenext(const ecarule &rule) ;
   virtual int collect(generation &g) ;
   virtual void abandon() ;
   virtual void dispose() ;
   virtual int checkhealth() ;
   virtual int gettier() const { return TIER_COMPUTE ; }
   static void doInitializeBackendInfo(staticBackendInfo &) ;
private:
   int buildprogram() ;
   void setparams(int ruleid) ;
   void bindstate() ;
   void dispatch() ;
   int waitfence(double deadline) ;
   int mapstaging(GLuint buffer, generation &g) ;
   void dropfence() ;
   int glerror(const char *where) ;
   glcontext ctx ;
   GLuint program ;
   GLuint parambuffer ;
   GLuint staging ;
   statepair<GLuint> buffers ;
   GLsync fence ;
   double issuetime ;
   int lastrule ;
   int validating ;
   int workgroup ;
   int timeoutms ;
   std::vector<GLuint> cells ;
} ;
#endif
