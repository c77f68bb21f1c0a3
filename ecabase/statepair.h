// This file is part of Ecaline.
// See docs/License.html for the copyright notice.

/**
 *   Double-buffered state: front holds the current generation and back
 *   receives the next one.  After a step the roles are swapped; the
 *   storage itself is never copied.  T may be a CPU row, a texture and
 *   framebuffer, or a storage buffer handle.
 */
#ifndef ECASTATEPAIR_H
#define ECASTATEPAIR_H
template <class T> class statepair {
public:
   statepair() : frontindex(0) {}
   T &front() { return slot[frontindex] ; }
   T &back() { return slot[1 - frontindex] ; }
   const T &front() const { return slot[frontindex] ; }
   const T &back() const { return slot[1 - frontindex] ; }
   T &operator[](int i) { return slot[i] ; }
   void swap() { frontindex = 1 - frontindex ; }
   void resetroles() { frontindex = 0 ; }
   int getfrontindex() const { return frontindex ; }
private:
   T slot[2] ;
   int frontindex ;
} ;
#endif
