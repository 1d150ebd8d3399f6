// Fuse_Guard.cpp
//
// Fuse safety checks and the (low) fuse write
//
// Order matters: the configuration is checked before any command is sent,
// the chip's high fuse is checked before anything is written, and every
// write is read back.

#include <string.h>

#include "Fuse_Guard.h"

void FuseGuard::forget ()
  {
  lowState_ = fuseUnread;
  highState_ = fuseUnread;
  memset (&before_, 0, sizeof before_);
  memset (&after_, 0, sizeof after_);
  failure_ = ispOk;
  refusal_ = refusalNone;
  }  // end of FuseGuard::forget

bool FuseGuard::refuse (const IspStatus status, const FuseRefusal why)
  {
  failure_ = status;
  refusal_ = why;
  return false;
  }  // end of FuseGuard::refuse

bool FuseGuard::targetIsSafe (const FuseConfig & target, FuseRefusal & why) const
  {
  const uint8_t mustKeep = config_.highFuseResetBit | config_.highFuseSpiBit;

  if (target.highFuse != config_.safeHighFuse || (target.highFuse & mustKeep) != mustKeep)
    {
    why = refusalUnsafeTargetHigh;
    return false;
    }

  if ((target.lowFuse & config_.clockSelectMask) != config_.clockSelect)
    {
    why = refusalBadClockSelect;
    return false;
    }

  why = refusalNone;
  return true;
  }  // end of FuseGuard::targetIsSafe

bool FuseGuard::highFuseIsSafe (const uint8_t highFuse, FuseRefusal & why) const
  {
  if ((highFuse & config_.highFuseResetBit) == 0)
    {
    why = refusalResetDisabled;
    return false;
    }

  if ((highFuse & config_.highFuseSpiBit) == 0)
    {
    why = refusalSpiDisabled;
    return false;
    }

  why = refusalNone;
  return true;
  }  // end of FuseGuard::highFuseIsSafe

bool FuseGuard::applyClockFuseConfig (const FuseConfig & target)
  {
  forget ();

  FuseRefusal why;

  // never send anything for a configuration that could brick the chip
  if (!targetIsSafe (target, why))
    return refuse (fuseSafetyAbort, why);

  if (!session_.isActive ())
    return refuse (notInProgrammingMode, refusalNotProgramming);

  before_ = session_.readFuses ();
  after_ = before_;
  lowState_ = fuseRead;
  highState_ = fuseRead;

  if (session_.observer ())
    session_.observer ()->onFusesRead (before_);

  // already damaged? don't touch it, don't make it worse
  if (!highFuseIsSafe (before_.highFuse, why))
    return refuse (fuseSafetyAbort, why);

  // high fuse is left as it is, even if it differs from target
  highState_ = fuseVerifiedSafe;

  if (before_.lowFuse == target.lowFuse)
    {
    lowState_ = fuseVerifiedSafe;
    return true;
    }

  if (!session_.writeCommand (progamEnable, writeLowFuseByte, 0, target.lowFuse))
    return refuse (notInProgrammingMode, refusalNotProgramming);

  if (session_.observer ())
    session_.observer ()->onFuseWritten (writeLowFuseByte, target.lowFuse);

  session_.delayMillis (config_.fuseWriteDelayMs);

  // verify the write
  after_.lowFuse = session_.readFuse (lowFuse);
  if (after_.lowFuse != target.lowFuse)
    {
    lowState_ = fuseWriteFailed;
    return refuse (fuseWriteVerifyFailed, refusalReadbackMismatch);
    }

  lowState_ = fuseWritten;
  return true;
  }  // end of FuseGuard::applyClockFuseConfig

FuseMeaning describeFuses (const FuseSet & fuses)
  {
  FuseMeaning m;

  const uint8_t low = fuses.lowFuse;
  const uint8_t high = fuses.highFuse;

  m.clockSelect              =  low & 0x03;
  m.startUpTime              = (low >> 2) & 0x03;
  m.divideClockBy8           = (low & 0x10) == 0;
  m.watchdogAlwaysOn         = (low & 0x20) == 0;
  m.eepromSave               = (low & 0x40) == 0;
  m.serialProgrammingEnabled = (low & 0x80) == 0;

  m.resetEnabled             = (high & 0x01) != 0;
  m.brownOutLevel            = (high >> 1) & 0x03;
  m.debugWireEnabled         = (high & 0x08) == 0;
  m.selfProgrammingEnabled   = (high & 0x10) == 0;

  switch (m.clockSelect)
    {
    case 0x02: m.clockKHz = 9600; break;  // calibrated internal oscillator
    case 0x01: m.clockKHz = 4800; break;  // calibrated internal oscillator
    case 0x03: m.clockKHz = 128;  break;  // internal 128 KHz oscillator
    default:   m.clockKHz = 0;    break;  // external clock
    }  // end of switch

  if (m.divideClockBy8)
    m.clockKHz /= 8;

  return m;
  }  // end of describeFuses
