// Target_Config.cpp
//
// Known target: ATtiny13 / ATtiny13A (1 KB flash, 16 words per page)

#include "Target_Config.h"

const unsigned int kb = 1024;

const TargetConfig ATTINY13A_CONFIG =
  {
  { 0x1E, 0x90, 0x07 },   // signature
  "ATtiny13A",
  1 * kb,                 // flash size
  32,                     // page size (bytes)
  16,                     // words per page

  0xFF,                   // safe high fuse: reset pin enabled, brown-out detect off
  0x01,                   // RSTDISBL
  0x02,                   // SPI programming enable as checked by the high fuse guard
  0x0F,                   // CKSEL [3:0]
  0x0A,                   // internal RC oscillator

  50,                     // SCK delay (uS), about 100 KHz per half cycle
  10,                     // power up
  20,                     // reset settle
  50,                     // fuse write
  100,                    // chip erase
  50,                     // page write
  1,                      // release
  };  // end of ATTINY13A_CONFIG

// Low fuse 0x7A (0 = programmed):
//   bit 7    SPIEN  = 0 (serial programming enabled)
//   bit 6    EESAVE = 1
//   bit 5    WDTON  = 1
//   bit 4    CKDIV8 = 1 (no divide by 8)
//   bits 3:2 SUT    = 10
//   bits 1:0 CKSEL  = 10 (9.6 MHz internal RC)
// High fuse 0xFF: everything unprogrammed, reset and ISP stay available
const FuseConfig ATTINY13A_9_6MHZ_FUSES = { 0x7A, 0xFF };

const FuseConfig ATTINY13A_FACTORY_FUSES = { 0x6A, 0xFF };
