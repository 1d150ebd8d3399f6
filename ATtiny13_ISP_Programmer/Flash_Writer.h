// Flash_Writer.h
//
// Chip erase, page load / commit, and read back verification

#ifndef ATTINY_ISP_FLASH_WRITER_H
#define ATTINY_ISP_FLASH_WRITER_H

#include <stdint.h>

#include "Hex_Decoder.h"
#include "Isp_Observer.h"
#include "Programming_Session.h"

// we stop comparing after this many errors
const unsigned int MAX_REPORTED_MISMATCHES = 20;

// largest page we can buffer (ATtiny13 uses 32)
const unsigned int MAX_PAGE_SIZE = 64;

struct VerifyResult
  {
  unsigned int bytesChecked;
  unsigned int errors;          // stops at MAX_REPORTED_MISMATCHES
  bool stoppedEarly;            // hit the limit, rest of image not compared
  FlashMismatch mismatches [MAX_REPORTED_MISMATCHES];
  };  // end of VerifyResult

class FlashWriter
  {
  public:
    FlashWriter (ProgrammingSession & session)
      : session_ (session), config_ (session.config ()), pagesWritten_ (0) {}

    // whole flash to 0xFF
    bool eraseMemory ();

    // fill the target's page buffer; words past length are padded with 0xFF
    bool loadPage (const uint8_t * pData, const unsigned int length);

    // write the page buffer to the page starting at byte address addr
    bool commitPage (const unsigned int addr);

    // load and commit every page holding at least one byte of the image
    //  pages with no data are left as erased
    bool writeImage (const MemoryImage & image);

    // copy one page out of the image, 0xFF where it has no data
    void buildPage (const MemoryImage & image, const unsigned int pageStart, uint8_t * page) const;

    uint8_t readFlash (const unsigned int addr);

    // compare every byte present in the image with the chip
    //  returns true if they all match
    bool verifyImage (const MemoryImage & image, VerifyResult & result);

    // compare one byte with the chip, recording a mismatch in result
    //  returns false (and reads nothing) once MAX_REPORTED_MISMATCHES have been found
    bool verifyByte (const unsigned int addr, const uint8_t expected, VerifyResult & result);

    unsigned int pagesWritten () const { return pagesWritten_; }
    const TargetConfig & config () const { return config_; }

  private:
    ProgrammingSession & session_;
    const TargetConfig & config_;
    unsigned int pagesWritten_;
  };  // end of class FlashWriter

void clearVerifyResult (VerifyResult & result);

// Writes a decoded file as it streams past: bytes are gathered into one page
// buffer, which is loaded and committed when data for a later page turns up
// (or on flush). The data must come page by page in ascending order
// (see ImageStats::ascending).
class PageStream : public HexSink
  {
  public:
    explicit PageStream (FlashWriter & writer)
      : writer_ (writer), config_ (writer.config ()), failed_ (false) { clear (); }

    void clear ();
    bool storeByte (const unsigned long address, const uint8_t value);

    // commit the page in progress, if any
    bool flush ();

    // a load or commit was refused
    bool failed () const { return failed_; }

  private:
    FlashWriter & writer_;
    const TargetConfig & config_;
    uint8_t page_ [MAX_PAGE_SIZE];
    unsigned int pageStart_;
    bool pageHasData_;
    bool failed_;
  };  // end of class PageStream

// compares a decoded file with the chip as it streams past
class VerifyStream : public HexSink
  {
  public:
    VerifyStream (FlashWriter & writer, VerifyResult & result)
      : writer_ (writer), result_ (result) { clearVerifyResult (result_); }

    bool storeByte (const unsigned long address, const uint8_t value)
      {
      writer_.verifyByte (address, value, result_);
      return true;
      }

  private:
    FlashWriter & writer_;
    VerifyResult & result_;
  };  // end of class VerifyStream

#endif // ATTINY_ISP_FLASH_WRITER_H
