// Bit_Banged_SPI.h
//
// Software clocked SPI transfer over an IspLink

#ifndef ATTINY_ISP_BIT_BANGED_SPI_H
#define ATTINY_ISP_BIT_BANGED_SPI_H

#include <stdint.h>

#include "Isp_Link.h"

class BitBangedSPI
  {
  public:
    BitBangedSPI (IspLink & link, const unsigned int delayMicroseconds)
      : link_ (link), delayMicroseconds_ (delayMicroseconds) {}

    // SCK and MOSI low, ready for the first bit
    void begin ();

    // clock one byte out on MOSI and one in from MISO, MSB first
    uint8_t transfer (uint8_t c);

  private:
    IspLink & link_;
    const unsigned int delayMicroseconds_;
  };  // end of class BitBangedSPI

#endif // ATTINY_ISP_BIT_BANGED_SPI_H
