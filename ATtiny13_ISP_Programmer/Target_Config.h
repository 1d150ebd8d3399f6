// Target_Config.h
//
// Geometry, signature, fuse safety rules and timing for the target chip

#ifndef ATTINY_ISP_TARGET_CONFIG_H
#define ATTINY_ISP_TARGET_CONFIG_H

#include <stdint.h>

// structure to hold signature and other relevant data about the target
struct TargetConfig
  {
  uint8_t sig [3];              // chip signature
  char desc [14];               // part name
  unsigned int flashSize;       // how big the flash is (bytes)
  unsigned int pageSize;        // flash programming page size (bytes)
  unsigned int wordsPerPage;    // pageSize / 2

  // fuse safety rules
  uint8_t safeHighFuse;         // the only high fuse value we will ever ask for
  uint8_t highFuseResetBit;     // must stay 1 (unprogrammed) or reset pin is gone
  uint8_t highFuseSpiBit;       // must stay 1 or serial programming is gone
  uint8_t clockSelectMask;      // CKSEL bits in the low fuse
  uint8_t clockSelect;          // CKSEL value for the internal RC oscillator

  // timing
  unsigned int sckDelayMicros;      // between SCK edges
  unsigned long powerUpDelayMs;     // after lines first set up
  unsigned long resetSettleMs;      // after reset asserted, before programming enable
  unsigned long fuseWriteDelayMs;
  unsigned long eraseDelayMs;
  unsigned long pageWriteDelayMs;
  unsigned long releaseDelayMs;     // after reset released
  };  // end of TargetConfig

// fuse values we want the target to end up with
struct FuseConfig
  {
  uint8_t lowFuse;
  uint8_t highFuse;
  };  // end of FuseConfig

// fuse and lock bytes as read from the target
struct FuseSet
  {
  uint8_t lowFuse;
  uint8_t highFuse;
  uint8_t lockBits;
  };  // end of FuseSet

extern const TargetConfig ATTINY13A_CONFIG;

// 9.6 MHz internal RC, no divide by 8
extern const FuseConfig ATTINY13A_9_6MHZ_FUSES;

// as shipped: 9.6 MHz / 8 = 1.2 MHz
extern const FuseConfig ATTINY13A_FACTORY_FUSES;

#endif // ATTINY_ISP_TARGET_CONFIG_H
