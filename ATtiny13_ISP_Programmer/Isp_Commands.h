// Isp_Commands.h
//
// Serial programming instruction set (see "Serial Programming Instruction Set"
// in the ATtiny13A datasheet). Every instruction is four bytes.

#ifndef ATTINY_ISP_COMMANDS_H
#define ATTINY_ISP_COMMANDS_H

#include <stdint.h>

// programming commands to send via SPI to the chip
enum {
    progamEnable = 0xAC,

      // writes are preceded by progamEnable
      chipErase = 0x80,
      writeLowFuseByte = 0xA0,
      writeHighFuseByte = 0xA8,

    programAcknowledge = 0x53,

    readSignatureByte = 0x30,

    readLowFuseByte = 0x50,       readLowFuseByteArg2 = 0x00,
    readHighFuseByte = 0x58,      readHighFuseByteArg2 = 0x08,
    readLockByte = 0x58,          readLockByteArg2 = 0x00,

    readProgramMemory = 0x20,
    writeProgramMemory = 0x4C,
    loadProgramMemory = 0x40,

    highByteSelect = 0x08,  // OR into read/load program memory for the odd byte of a word
};  // end of enum

// the four bytes clocked back while a command is sent
//  the target echoes the previous byte, so the payload surfaces in r3 and r4
struct IspResponse
  {
  uint8_t r1;
  uint8_t r2;
  uint8_t r3;
  uint8_t r4;
  };  // end of IspResponse

#endif // ATTINY_ISP_COMMANDS_H
