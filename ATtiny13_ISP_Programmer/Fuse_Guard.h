// Fuse_Guard.h
//
// The only code allowed to change fuses. Refuses anything that could
// leave the chip without a reset pin or serial programming.

#ifndef ATTINY_ISP_FUSE_GUARD_H
#define ATTINY_ISP_FUSE_GUARD_H

#include <stdint.h>

#include "Isp_Status.h"
#include "Programming_Session.h"
#include "Target_Config.h"

// what we know about one fuse byte
enum FuseState {
    fuseUnread,
    fuseRead,
    fuseVerifiedSafe,   // already correct (or safe to leave alone), not written
    fuseWritten,        // written and read back OK
    fuseWriteFailed,    // written, read back differently
};  // end of FuseState

// why the guard said no
enum FuseRefusal {
    refusalNone,
    refusalUnsafeTargetHigh,  // configured high fuse is not the safe value
    refusalBadClockSelect,    // configured low fuse does not select the internal RC
    refusalResetDisabled,     // chip already has RSTDISBL programmed
    refusalSpiDisabled,       // chip already has serial programming disabled
    refusalReadbackMismatch,  // low fuse did not stick
    refusalNotProgramming,    // session not active
};  // end of FuseRefusal

class FuseGuard
  {
  public:
    FuseGuard (ProgrammingSession & session)
      : session_ (session), config_ (session.config ()) { forget (); }

    // bring the low fuse to target.lowFuse; the high fuse is never written
    //  returns false (see failure () and refusal ()) if anything is unsafe or did not stick
    bool applyClockFuseConfig (const FuseConfig & target);

    // true if the wanted fuses pass the static checks (no hardware access)
    bool targetIsSafe (const FuseConfig & target, FuseRefusal & why) const;

    // true if the chip's high fuse still allows reset and ISP
    bool highFuseIsSafe (const uint8_t highFuse, FuseRefusal & why) const;

    FuseState lowState () const { return lowState_; }
    FuseState highState () const { return highState_; }
    const FuseSet & before () const { return before_; }
    const FuseSet & after () const { return after_; }
    IspStatus failure () const { return failure_; }
    FuseRefusal refusal () const { return refusal_; }

  private:
    void forget ();
    bool refuse (const IspStatus status, const FuseRefusal why);

    ProgrammingSession & session_;
    const TargetConfig & config_;
    FuseState lowState_;
    FuseState highState_;
    FuseSet before_;
    FuseSet after_;
    IspStatus failure_;
    FuseRefusal refusal_;
  };  // end of class FuseGuard

// decoded ATtiny13 fuse bits (0 = programmed, so "enabled" flags below are already inverted)
struct FuseMeaning
  {
  uint8_t clockSelect;      // CKSEL [1:0]
  uint8_t startUpTime;      // SUT [1:0]
  bool divideClockBy8;
  bool watchdogAlwaysOn;
  bool eepromSave;
  bool serialProgrammingEnabled;
  bool resetEnabled;
  bool debugWireEnabled;
  bool selfProgrammingEnabled;
  uint8_t brownOutLevel;    // BODLEVEL [1:0], 3 = disabled
  unsigned long clockKHz;   // 0 = external clock (unknown)
  };  // end of FuseMeaning

// see "Fuse Bytes" in the ATtiny13A datasheet
FuseMeaning describeFuses (const FuseSet & fuses);

#endif // ATTINY_ISP_FUSE_GUARD_H
