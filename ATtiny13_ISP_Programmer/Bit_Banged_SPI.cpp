// Bit_Banged_SPI.cpp
//
// Mode 0 transfer: MOSI set while SCK is low, MISO sampled after the rising edge.

#include "Bit_Banged_SPI.h"

void BitBangedSPI::begin ()
  {
  link_.setClock (false);
  link_.setDataOut (false);
  }  // end of BitBangedSPI::begin

uint8_t BitBangedSPI::transfer (uint8_t c)
  {
  uint8_t result = 0;

  for (uint8_t bit = 0; bit < 8; bit++)
    {
    // write MOSI while clock is low
    link_.setDataOut ((c & 0x80) != 0);
    c <<= 1;
    link_.delayMicros (delayMicroseconds_);

    // clock high, target samples MOSI
    link_.setClock (true);
    link_.delayMicros (delayMicroseconds_);

    // read MISO
    result = (result << 1) | (link_.readDataIn () ? 1 : 0);

    // clock low
    link_.setClock (false);
    link_.delayMicros (delayMicroseconds_);
    }  // end of for each bit

  return result;
  }  // end of BitBangedSPI::transfer
