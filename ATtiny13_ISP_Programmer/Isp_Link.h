// Isp_Link.h
//
// The four ISP signal lines and the delays the engine needs.
// The sketch implements this with digitalWrite / delayMicroseconds,
// the unit tests with a simulated target.

#ifndef ATTINY_ISP_LINK_H
#define ATTINY_ISP_LINK_H

class IspLink
  {
  public:
    virtual ~IspLink () {}

    virtual void setClock (const bool high) = 0;      // SCK
    virtual void setDataOut (const bool high) = 0;    // MOSI
    virtual bool readDataIn () = 0;                   // MISO

    // asserted means /RESET driven low (target held in reset)
    virtual void setReset (const bool asserted) = 0;

    virtual void delayMicros (const unsigned int us) = 0;
    virtual void delayMillis (const unsigned long ms) = 0;
  };  // end of class IspLink

#endif // ATTINY_ISP_LINK_H
