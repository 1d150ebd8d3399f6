// Programming_Session.h
//
// Owns the ISP link for the duration of one programming run.
// While the session exists nothing else drives the lines; when it is
// destroyed the target is always let out of reset.

#ifndef ATTINY_ISP_PROGRAMMING_SESSION_H
#define ATTINY_ISP_PROGRAMMING_SESSION_H

#include <stddef.h>
#include <stdint.h>

#include "Bit_Banged_SPI.h"
#include "Isp_Commands.h"
#include "Isp_Link.h"
#include "Isp_Observer.h"
#include "Target_Config.h"

// which byte readFuse fetches
enum {
      lowFuse,
      highFuse,
      lockByte,
};

class ProgrammingSession
  {
  public:
    ProgrammingSession (IspLink & link,
                        const TargetConfig & config,
                        IspObserver * observer = NULL);
    ~ProgrammingSession ();

    // assert reset and send programming enable
    //  returns false if the target did not echo programAcknowledge
    bool begin ();

    // release reset; safe to call more than once
    void end ();

    bool isActive () const { return active_; }
    bool inReset () const { return resetAsserted_; }
    const TargetConfig & config () const { return config_; }
    IspObserver * observer () const { return observer_; }

    // one 4 byte instruction, all four response bytes returned
    IspResponse sendCommand (const uint8_t b1, const uint8_t b2, const uint8_t b3, const uint8_t b4);

    // instruction whose result (if any) comes back on the 4th transfer
    uint8_t program (const uint8_t b1, const uint8_t b2 = 0, const uint8_t b3 = 0, const uint8_t b4 = 0);

    // instruction that changes the target (erase, fuse, page load/commit)
    //  refused (returns false, nothing sent) unless in programming mode
    bool writeCommand (const uint8_t b1, const uint8_t b2, const uint8_t b3, const uint8_t b4);

    void readSignature (uint8_t sig [3]);
    uint8_t readFuse (const uint8_t which);
    FuseSet readFuses ();

    void delayMillis (const unsigned long ms) { link_.delayMillis (ms); }

  private:
    // not copyable, there is only one link
    ProgrammingSession (const ProgrammingSession &);
    ProgrammingSession & operator= (const ProgrammingSession &);

    IspLink & link_;
    const TargetConfig & config_;
    IspObserver * observer_;
    BitBangedSPI spi_;
    bool active_;
    bool resetAsserted_;
  };  // end of class ProgrammingSession

#endif // ATTINY_ISP_PROGRAMMING_SESSION_H
