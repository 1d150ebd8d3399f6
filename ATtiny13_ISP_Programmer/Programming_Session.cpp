// Programming_Session.cpp
//
// Entering / leaving serial programming mode, and the 4 byte command framing

#include "Programming_Session.h"

ProgrammingSession::ProgrammingSession (IspLink & link,
                                        const TargetConfig & config,
                                        IspObserver * observer)
  : link_ (link), config_ (config), observer_ (observer),
    spi_ (link, config.sckDelayMicros), active_ (false), resetAsserted_ (false)
  {
  spi_.begin ();
  link_.setReset (false);
  link_.delayMillis (config_.powerUpDelayMs);
  }  // end of ProgrammingSession::ProgrammingSession

ProgrammingSession::~ProgrammingSession ()
  {
  end ();
  }  // end of ProgrammingSession::~ProgrammingSession

// put chip into programming mode
bool ProgrammingSession::begin ()
  {
  if (active_)
    return true;

  // SCK must be low while reset is asserted
  spi_.begin ();
  link_.setReset (true);
  resetAsserted_ = true;
  link_.delayMillis (config_.resetSettleMs);

  // we are in sync if we get back programAcknowledge on the third byte
  IspResponse response = sendCommand (progamEnable, programAcknowledge, 0, 0);
  active_ = response.r3 == programAcknowledge;
  return active_;
  }  // end of ProgrammingSession::begin

void ProgrammingSession::end ()
  {
  active_ = false;
  if (!resetAsserted_)
    return;

  link_.setReset (false);
  resetAsserted_ = false;
  link_.delayMillis (config_.releaseDelayMs);
  }  // end of ProgrammingSession::end

IspResponse ProgrammingSession::sendCommand (const uint8_t b1, const uint8_t b2, const uint8_t b3, const uint8_t b4)
  {
  IspResponse response;
  response.r1 = spi_.transfer (b1);
  response.r2 = spi_.transfer (b2);
  response.r3 = spi_.transfer (b3);
  response.r4 = spi_.transfer (b4);

  if (observer_)
    {
    const uint8_t command [4] = { b1, b2, b3, b4 };
    observer_->onCommand (command, response);
    }

  return response;
  }  // end of ProgrammingSession::sendCommand

uint8_t ProgrammingSession::program (const uint8_t b1, const uint8_t b2, const uint8_t b3, const uint8_t b4)
  {
  return sendCommand (b1, b2, b3, b4).r4;
  }  // end of ProgrammingSession::program

bool ProgrammingSession::writeCommand (const uint8_t b1, const uint8_t b2, const uint8_t b3, const uint8_t b4)
  {
  if (!active_)
    return false;

  sendCommand (b1, b2, b3, b4);
  return true;
  }  // end of ProgrammingSession::writeCommand

void ProgrammingSession::readSignature (uint8_t sig [3])
  {
  for (uint8_t i = 0; i < 3; i++)
    sig [i] = program (readSignatureByte, 0, i);
  }  // end of ProgrammingSession::readSignature

uint8_t ProgrammingSession::readFuse (const uint8_t which)
  {
  switch (which)
    {
    case lowFuse:   return program (readLowFuseByte, readLowFuseByteArg2);
    case highFuse:  return program (readHighFuseByte, readHighFuseByteArg2);
    case lockByte:  return program (readLockByte, readLockByteArg2);
    }  // end of switch

  return 0;
  }  // end of ProgrammingSession::readFuse

FuseSet ProgrammingSession::readFuses ()
  {
  FuseSet fuses;
  fuses.lowFuse  = readFuse (lowFuse);
  fuses.highFuse = readFuse (highFuse);
  fuses.lockBits = readFuse (lockByte);
  return fuses;
  }  // end of ProgrammingSession::readFuses
