// Hex_Decoder.cpp
//
// Interpreting Intel hex records into a MemoryImage (or any other HexSink)

#include <ctype.h>

#include "Hex_Decoder.h"

void MemoryImage::clear ()
  {
  memset (data_, 0xFF, sizeof data_);
  memset (present_, 0, sizeof present_);
  count_ = 0;
  lowest_ = 0;
  highest_ = 0;
  }  // end of MemoryImage::clear

bool MemoryImage::set (const unsigned long address, const uint8_t value)
  {
  if (address >= IMAGE_CAPACITY)
    return false;

  if (!has (address))
    {
    present_ [address >> 3] |= 1 << (address & 7);
    if (count_ == 0 || address < lowest_)
      lowest_ = address;
    if (count_ == 0 || address > highest_)
      highest_ = address;
    count_++;
    }

  data_ [address] = value;
  return true;
  }  // end of MemoryImage::set

bool MemoryImage::hasDataIn (const unsigned int start, const unsigned int length) const
  {
  for (unsigned long address = start; address < (unsigned long) start + length; address++)
    if (has (address))
      return true;
  return false;
  }  // end of MemoryImage::hasDataIn

void ImageStats::clear ()
  {
  count_ = 0;
  lowest_ = 0;
  highest_ = 0;
  lastPage_ = 0;
  ascending_ = true;
  }  // end of ImageStats::clear

bool ImageStats::storeByte (const unsigned long address, const uint8_t)
  {
  const unsigned long page = address / pageSize_;

  if (count_ == 0 || address < lowest_)
    lowest_ = address;
  if (count_ == 0 || address > highest_)
    highest_ = address;

  // an earlier page after a later one: that page was already committed
  if (count_ != 0 && page < lastPage_)
    ascending_ = false;
  if (count_ == 0 || page > lastPage_)
    lastPage_ = page;

  count_++;
  return true;
  }  // end of ImageStats::storeByte

bool hexConv (const char * (& pStr), uint8_t & b)
  {

  const unsigned char c1 = pStr [0];
  const unsigned char c2 = c1 ? pStr [1] : 0;

  if (!isxdigit (c1) || !isxdigit (c2))
    return true;

  pStr += 2;

  b = toupper (c1) - '0';
  if (b > 9)
    b -= 7;

  // high-order nybble
  b <<= 4;

  uint8_t b1 = toupper (c2) - '0';
  if (b1 > 9)
    b1 -= 7;

  b |= b1;

  return false;  // OK
  }  // end of hexConv

HexDecoder::HexDecoder (HexSink & sink)
  : sink_ (sink), checkSums_ (false)
  {
  reset ();
  }  // end of HexDecoder::HexDecoder

void HexDecoder::reset ()
  {
  sink_.clear ();
  gotEndOfFile_ = false;
  lineCount_ = 0;
  skippedLines_ = 0;
  dataBytes_ = 0;
  errorLine_ = 0;
  error_ = hexOk;
  }  // end of HexDecoder::reset

HexError HexDecoder::processLine (const char * pLine)
  {
  lineCount_++;

  // everything after the end of file record is ignored
  if (gotEndOfFile_)
    return hexOk;

  // not a record (blank line, comment, etc.)
  if (*pLine++ != ':')
    {
    skippedLines_++;
    return hexOk;
    }

  uint8_t hexBuffer [MAX_HEX_RECORD];
  int bytesInLine = 0;
  HexError result = hexOk;

  // convert entire line from ASCII into binary
  while (isxdigit ((unsigned char) *pLine))
    {
    // can't fit?
    if (bytesInLine >= MAX_HEX_RECORD)
      {
      result = hexLineTooLong;
      break;
      }

    if (hexConv (pLine, hexBuffer [bytesInLine++]))
      {
      result = hexInvalidDigits;
      break;
      }
    }  // end of while

  if (result == hexOk && bytesInLine < 5)
    result = hexLineTooShort;

  // the data length should be the number of bytes, less
  //   length / address (2) / record type / sumcheck
  if (result == hexOk && hexBuffer [0] != (bytesInLine - 5))
    result = hexBadLength;

  if (result == hexOk && checkSums_)
    {
    uint8_t sumCheck = 0;
    for (int i = 0; i < (bytesInLine - 1); i++)
      sumCheck += hexBuffer [i];

    // 2's complement
    sumCheck = ~sumCheck + 1;

    if (sumCheck != hexBuffer [bytesInLine - 1])
      result = hexBadSumcheck;
    }

  if (result == hexOk)
    {
    const uint8_t len = hexBuffer [0];
    const unsigned long addr = ((unsigned long) hexBuffer [1] << 8) | hexBuffer [2];

    switch (hexBuffer [3])
      {
      // stuff to be written to memory
      case hexDataRecord:
        for (uint8_t i = 0; i < len; i++)
          {
          if (!sink_.storeByte (addr + i, hexBuffer [4 + i]))
            {
            result = hexOutOfRange;
            break;
            }
          dataBytes_++;
          }
        break;

      // end of data
      case hexEndOfFile:
        gotEndOfFile_ = true;
        break;

      // only 16 bit addresses on this chip, ignore the rest
      default:
        break;
      }  // end of switch on record type
    }

  return noteError (result);
  }  // end of HexDecoder::processLine

// remember the first error and the line it was on
HexError HexDecoder::noteError (const HexError error)
  {
  if (error != hexOk && error_ == hexOk)
    {
    error_ = error;
    errorLine_ = lineCount_;
    }

  return error;
  }  // end of HexDecoder::noteError

HexError HexDecoder::finish ()
  {
  if (error_ == hexOk && dataBytes_ == 0)
    error_ = hexNoData;
  return error_;
  }  // end of HexDecoder::finish

HexError HexDecoder::decode (const char * text)
  {
  reset ();

  while (*text && !gotEndOfFile_)
    {
    if (processLine (text) != hexOk)
      return error_;

    // on to the next line
    while (*text && *text != '\n')
      text++;
    if (*text == '\n')
      text++;
    }  // end of while each line

  return finish ();
  }  // end of HexDecoder::decode

HexError HexDecoder::decode (HexSource & source)
  {
  reset ();

  if (!source.rewind ())
    return noteError (hexCannotRead);

  char buffer [MAX_HEX_LINE];
  bool lineTooLong;

  while (!gotEndOfFile_ && source.readLine (buffer, sizeof buffer, lineTooLong))
    {
    if (lineTooLong)
      {
      lineCount_++;
      return noteError (hexLineTooLong);
      }

    if (processLine (buffer) != hexOk)
      return error_;
    }  // end of while each line

  return finish ();
  }  // end of HexDecoder::decode
