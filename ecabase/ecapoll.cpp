// This file is part of Ecaline.
// See docs/License.html for the copyright notice.

#include "ecapoll.h"
ecapoll::ecapoll() {
  interrupted = 0 ;
  polling = 0 ;
}
ecapoll::~ecapoll() {}
int ecapoll::checkevents() {
  return 0 ;
}
int ecapoll::poll() {
  polling++ ;
  // checkevents() may itself call setInterrupted()
  if (!interrupted && checkevents())
    interrupted = 1 ;
  polling-- ;
  return interrupted ;
}
void ecapoll::tierchanged(int, int, const char *) {}
void ecapoll::runcompleted(int) {}
ecapoll default_poller ;
