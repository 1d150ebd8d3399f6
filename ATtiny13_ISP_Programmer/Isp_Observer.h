// Isp_Observer.h
//
// Progress and diagnostic events from the engine. The engine itself never
// prints; the sketch turns these into Serial output.

#ifndef ATTINY_ISP_OBSERVER_H
#define ATTINY_ISP_OBSERVER_H

#include <stdint.h>

#include "Isp_Commands.h"
#include "Target_Config.h"

// stages of a programming run, in order
enum IspStage {
    stageEntry,
    stageIdentity,
    stageFuses,
    stageProgramming,
    stageVerification,
};  // end of IspStage

const unsigned int NUM_STAGES = stageVerification + 1;

// one byte that did not read back as written
struct FlashMismatch
  {
  unsigned int address;
  uint8_t expected;
  uint8_t found;
  };  // end of FlashMismatch

class IspObserver
  {
  public:
    virtual ~IspObserver () {}

    virtual void onStageStarted (const IspStage) {}
    virtual void onStageFinished (const IspStage, const bool) {}

    // every 4 byte exchange with the target
    virtual void onCommand (const uint8_t [4], const IspResponse &) {}

    virtual void onFusesRead (const FuseSet &) {}
    virtual void onFuseWritten (const uint8_t, const uint8_t) {}
    virtual void onPageCommitted (const unsigned int) {}
    virtual void onMismatch (const FlashMismatch &) {}
  };  // end of class IspObserver

#endif // ATTINY_ISP_OBSERVER_H
