// Flash_Writer.cpp
//
// Flash is written a page at a time: both bytes of each word are loaded
// into the chip's page buffer, then one instruction commits the page.

#include <string.h>

#include "Flash_Writer.h"

bool FlashWriter::eraseMemory ()
  {
  if (!session_.writeCommand (progamEnable, chipErase, 0, 0))
    return false;

  session_.delayMillis (config_.eraseDelayMs);
  return true;
  }  // end of FlashWriter::eraseMemory

bool FlashWriter::loadPage (const uint8_t * pData, const unsigned int length)
  {
  for (unsigned int word = 0; word < config_.wordsPerPage; word++)
    {
    const unsigned int i = word * 2;
    const uint8_t low  = i < length ? pData [i] : 0xFF;
    const uint8_t high = (i + 1) < length ? pData [i + 1] : 0xFF;

    if (!session_.writeCommand (loadProgramMemory, 0, word, low))
      return false;
    if (!session_.writeCommand (loadProgramMemory | highByteSelect, 0, word, high))
      return false;
    }  // end of for each word

  return true;
  }  // end of FlashWriter::loadPage

// commit page to flash memory
bool FlashWriter::commitPage (const unsigned int addr)
  {
  const unsigned int wordAddr = addr >> 1;  // turn into word address

  if (!session_.writeCommand (writeProgramMemory, (wordAddr >> 8) & 0xFF, wordAddr & 0xFF, 0))
    return false;

  session_.delayMillis (config_.pageWriteDelayMs);
  pagesWritten_++;

  if (session_.observer ())
    session_.observer ()->onPageCommitted (addr);
  return true;
  }  // end of FlashWriter::commitPage

void FlashWriter::buildPage (const MemoryImage & image, const unsigned int pageStart, uint8_t * page) const
  {
  for (unsigned int i = 0; i < config_.pageSize; i++)
    page [i] = image.get (pageStart + i);
  }  // end of FlashWriter::buildPage

bool FlashWriter::writeImage (const MemoryImage & image)
  {
  uint8_t page [MAX_PAGE_SIZE];

  if (config_.pageSize > sizeof page)
    return false;

  pagesWritten_ = 0;

  for (unsigned int pageStart = 0; pageStart < config_.flashSize; pageStart += config_.pageSize)
    {
    // only program pages that have data
    if (!image.hasDataIn (pageStart, config_.pageSize))
      continue;

    buildPage (image, pageStart, page);

    if (!loadPage (page, config_.pageSize))
      return false;
    if (!commitPage (pageStart))
      return false;
    }  // end of for each page

  return true;
  }  // end of FlashWriter::writeImage

// read a byte from flash memory
uint8_t FlashWriter::readFlash (const unsigned int addr)
  {
  const uint8_t high = (addr & 1) ? highByteSelect : 0;  // set if high byte wanted
  const unsigned int wordAddr = addr >> 1;  // turn into word address

  return session_.program (readProgramMemory | high, (wordAddr >> 8) & 0xFF, wordAddr & 0xFF);
  }  // end of FlashWriter::readFlash

void clearVerifyResult (VerifyResult & result)
  {
  memset (&result, 0, sizeof result);
  }  // end of clearVerifyResult

bool FlashWriter::verifyByte (const unsigned int addr, const uint8_t expected, VerifyResult & result)
  {
  // rest of the image is not compared
  if (result.stoppedEarly)
    return false;

  const uint8_t found = readFlash (addr);
  result.bytesChecked++;

  if (found == expected)
    return true;

  FlashMismatch & mismatch = result.mismatches [result.errors++];
  mismatch.address = addr;
  mismatch.expected = expected;
  mismatch.found = found;

  if (session_.observer ())
    session_.observer ()->onMismatch (mismatch);

  if (result.errors >= MAX_REPORTED_MISMATCHES)
    {
    result.stoppedEarly = true;
    return false;
    }

  return true;
  }  // end of FlashWriter::verifyByte

bool FlashWriter::verifyImage (const MemoryImage & image, VerifyResult & result)
  {
  clearVerifyResult (result);

  for (unsigned int addr = 0; addr < IMAGE_CAPACITY; addr++)
    if (image.has (addr) && !verifyByte (addr, image.get (addr), result))
      break;

  return result.errors == 0;
  }  // end of FlashWriter::verifyImage

void PageStream::clear ()
  {
  memset (page_, 0xFF, sizeof page_);
  pageStart_ = 0;
  pageHasData_ = false;
  }  // end of PageStream::clear

bool PageStream::storeByte (const unsigned long address, const uint8_t value)
  {
  if (failed_ || address >= config_.flashSize || config_.pageSize > sizeof page_)
    return false;

  const unsigned int pageStart = address - (address % config_.pageSize);

  // moved on to another page, write out the one we have
  if (pageHasData_ && pageStart != pageStart_)
    if (!flush ())
      return false;

  pageStart_ = pageStart;
  pageHasData_ = true;
  page_ [address - pageStart] = value;
  return true;
  }  // end of PageStream::storeByte

bool PageStream::flush ()
  {
  if (failed_)
    return false;
  if (!pageHasData_)
    return true;

  if (!writer_.loadPage (page_, config_.pageSize) || !writer_.commitPage (pageStart_))
    {
    failed_ = true;
    return false;
    }

  clear ();
  return true;
  }  // end of PageStream::flush
