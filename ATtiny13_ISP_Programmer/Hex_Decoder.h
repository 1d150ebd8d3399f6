// Hex_Decoder.h
//
// Intel hex text to a sparse byte image

#ifndef ATTINY_ISP_HEX_DECODER_H
#define ATTINY_ISP_HEX_DECODER_H

#include <stdint.h>
#include <string.h>

// largest image we can hold (whole ATtiny13 flash)
const unsigned int IMAGE_CAPACITY = 1024;

// largest record: length, 2 x address, type, 32 data bytes, sumcheck ... with some slack
const int MAX_HEX_RECORD = 40;

// longest line read from a HexSource (including the terminator)
const unsigned int MAX_HEX_LINE = 80;

// where decoded data bytes go
class HexSink
  {
  public:
    virtual ~HexSink () {}

    // called when decoding starts over
    virtual void clear () {}

    // returns false if the byte cannot be taken (address out of range, write refused)
    virtual bool storeByte (const unsigned long address, const uint8_t value) = 0;
  };  // end of class HexSink

// a hex file that can be read from the start more than once
class HexSource
  {
  public:
    virtual ~HexSource () {}

    // back to the first line; false if the file cannot be opened
    virtual bool rewind () = 0;

    // next line into buffer, '\0' terminated, without the line ending
    //  returns false at end of file
    //  lineTooLong is set (and true returned) if the line did not fit in size
    virtual bool readLine (char * buffer, const unsigned int size, bool & lineTooLong) = 0;
  };  // end of class HexSource

// byte address -> value, plus a bit saying if the address was in the file
class MemoryImage : public HexSink
  {
  public:
    MemoryImage () { clear (); }

    void clear ();
    bool storeByte (const unsigned long address, const uint8_t value) { return set (address, value); }

    // returns false if address is beyond IMAGE_CAPACITY
    bool set (const unsigned long address, const uint8_t value);

    bool has (const unsigned long address) const
      {
      return address < IMAGE_CAPACITY && (present_ [address >> 3] & (1 << (address & 7))) != 0;
      }

    // 0xFF (erased value) if not present
    uint8_t get (const unsigned long address) const
      {
      return has (address) ? data_ [address] : 0xFF;
      }

    unsigned int size () const { return count_; }
    bool empty () const { return count_ == 0; }

    // only meaningful if not empty
    unsigned int lowestAddress () const { return lowest_; }
    unsigned int highestAddress () const { return highest_; }

    // true if any address in [start, start + length) is present
    bool hasDataIn (const unsigned int start, const unsigned int length) const;

  private:
    uint8_t data_ [IMAGE_CAPACITY];
    uint8_t present_ [IMAGE_CAPACITY / 8];
    unsigned int count_;
    unsigned int lowest_;
    unsigned int highest_;
  };  // end of class MemoryImage

// size and range of a file without keeping its contents, and whether its
// data arrives page by page in ascending order (needed to write it as it streams)
class ImageStats : public HexSink
  {
  public:
    explicit ImageStats (const unsigned int pageSize) : pageSize_ (pageSize) { clear (); }

    void clear ();
    bool storeByte (const unsigned long address, const uint8_t value);

    unsigned int size () const { return count_; }   // data bytes (repeats counted again)
    bool empty () const { return count_ == 0; }
    unsigned long lowestAddress () const { return lowest_; }
    unsigned long highestAddress () const { return highest_; }
    bool ascending () const { return ascending_; }

  private:
    const unsigned int pageSize_;
    unsigned int count_;
    unsigned long lowest_;
    unsigned long highest_;
    unsigned long lastPage_;
    bool ascending_;
  };  // end of class ImageStats

// types of record in .hex file
enum {
    hexDataRecord,  // 00
    hexEndOfFile,   // 01
    hexExtendedSegmentAddressRecord, // 02
    hexStartSegmentAddressRecord,  // 03
    hexExtendedLinearAddressRecord, // 04
    hexStartLinearAddressRecord // 05
};

// why a line (or the whole file) was rejected
enum HexError {
    hexOk,
    hexInvalidDigits,   // non-hex character inside a field, or odd number of digits
    hexLineTooShort,    // fewer than length / address / type / sumcheck
    hexLineTooLong,     // more than MAX_HEX_RECORD bytes
    hexBadLength,       // length field disagrees with the data on the line
    hexBadSumcheck,
    hexOutOfRange,      // data beyond IMAGE_CAPACITY
    hexTooLargeForFlash,  // data beyond the target's flash
    hexNoData,          // no data records at all
    hexNotAscending,    // a page comes back after a later one (cannot stream it)
    hexCannotRead,      // file could not be opened
};  // end of HexError

/*
Line format:

  :nnaaaatt(data)ss

  Where:
  :      = a colon

  (All of below in hex format)

  nn     = length of data part
  aaaa   = address (eg. where to write data)
  tt     = record type
           00 = data
           01 = end of file
           02 .. 05 = address records (ignored, 16 bit addresses only)
  (data) = variable length data
  ss     = sumcheck

  Lines not starting with a colon are skipped.
*/

class HexDecoder
  {
  public:
    explicit HexDecoder (HexSink & sink);

    // forget everything, clear the sink
    void reset ();

    // checking the sumcheck is optional, off by default
    void setChecksumRequired (const bool required) { checkSums_ = required; }

    // decode one line (terminated by '\0', CR or LF)
    //  returns hexOk or the reason the line is malformed
    HexError processLine (const char * pLine);

    // call after the last line: hexNoData if nothing was decoded
    HexError finish ();

    // decode a whole file held in memory (lines separated by LF or CR LF)
    //  the sink is cleared first; stops at the end of file record
    HexError decode (const char * text);

    // same, reading the file a line at a time from the start
    HexError decode (HexSource & source);

    bool gotEndOfFile () const { return gotEndOfFile_; }
    unsigned int lineCount () const { return lineCount_; }       // lines seen (including skipped)
    unsigned int skippedLines () const { return skippedLines_; }
    unsigned int dataBytes () const { return dataBytes_; }
    unsigned int errorLine () const { return errorLine_; }       // 1-based, 0 if none
    HexError error () const { return error_; }

  private:
    HexError noteError (const HexError error);

    HexSink & sink_;
    bool checkSums_;
    bool gotEndOfFile_;
    unsigned int lineCount_;
    unsigned int skippedLines_;
    unsigned int dataBytes_;
    unsigned int errorLine_;
    HexError error_;
  };  // end of class HexDecoder

// convert two hex characters into a byte
//    returns true if error, false if OK
bool hexConv (const char * (& pStr), uint8_t & b);

#endif // ATTINY_ISP_HEX_DECODER_H
