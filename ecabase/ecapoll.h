// This file is part of Ecaline.
// See docs/License.html for the copyright notice.

/**
 *   This interface is called by the engine and the backend selector
 *   to let the host process events, to report tier changes, and to
 *   announce the end of a bounded run.  The default class does nothing
 *   (no actual callbacks); the user of this class should override
 *   checkevents() and the notification methods to do the right thing.
 */
#ifndef ECAPOLL_H
#define ECAPOLL_H
class ecapoll {
public:
   ecapoll() ;
   virtual ~ecapoll() ;
   /**
    *   This is what should be overridden; it should check events,
    *   and return 0 if all is okay or 1 if the current probe or
    *   readback wait should be interrupted.
    */
   virtual int checkevents() ;
   /**
    *   Was an interrupt requested?
    */
   int isInterrupted() { return interrupted ; }
   /**
    *   Before a probe begins, call this to reset the interrupted flag.
    */
   void resetInterrupted() { interrupted = 0 ; }
   /**
    *   Call this to abandon the current probe.  The engine also sets
    *   it when a rule change, resize or reset arrives while busy.
    */
   void setInterrupted() { interrupted = 1 ; }
   /**
    *   Called by the selector between probe attempts.  It calls
    *   checkevents() and stashes the result.
    */
   int poll() ;
   /**
    *   Some routines should not be called during a poll() such as ones
    *   that would restart the engine.  This routine lets us know if we
    *   are called from the callback or not.
    */
   int isPolling() { return polling ; }
   /**
    *   Called after the selector switched backends; from and to are
    *   tier numbers (TIER_NONE when there was no previous backend).
    */
   virtual void tierchanged(int from, int to, const char *why) ;
   /**
    *   Called once when a bounded run has produced all of its rows, so
    *   the host can pick a new rule.
    */
   virtual void runcompleted(int ruleid) ;
private:
   int interrupted ;
   int polling ;
} ;
extern ecapoll default_poller ;
#endif
