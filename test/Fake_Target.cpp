// Fake_Target.cpp

#include <string.h>

#include "Fake_Target.h"

const unsigned int FakeTarget::FLASH_SIZE;
const unsigned int FakeTarget::PAGE_SIZE;

FakeTarget::FakeTarget ()
  : lowFuse (0x6A), highFuse (0xFF), lockBits (0x3F),
    acknowledgeEnable (true), fuseWritesStick (true),
    totalMicros (0), resetAsserted (false), programming (false), clock (false),
    mosi_ (false), miso_ (true), inByte_ (0), outByte_ (0xFF), bitCount_ (0), bytePos_ (0)
  {
  signature [0] = 0x1E;
  signature [1] = 0x90;
  signature [2] = 0x07;
  memset (flash, 0xFF, sizeof flash);
  memset (pageBuffer, 0xFF, sizeof pageBuffer);
  memset (cmd_, 0, sizeof cmd_);
  }  // end of FakeTarget::FakeTarget

void FakeTarget::setDataOut (const bool high)
  {
  mosi_ = high;
  }

bool FakeTarget::readDataIn ()
  {
  return miso_;
  }

void FakeTarget::delayMicros (const unsigned int us)
  {
  totalMicros += us;
  }

void FakeTarget::delayMillis (const unsigned long ms)
  {
  millisDelays.push_back (ms);
  }

void FakeTarget::setReset (const bool asserted)
  {
  resetHistory.push_back (asserted);

  // entering reset starts the serial interface from scratch
  if (asserted && !resetAsserted)
    {
    bitCount_ = 0;
    bytePos_ = 0;
    inByte_ = 0;
    }

  resetAsserted = asserted;
  programming = false;
  }  // end of FakeTarget::setReset

void FakeTarget::setClock (const bool high)
  {
  const bool rising = high && !clock;
  clock = high;

  if (!rising || !resetAsserted)
    {
    if (!resetAsserted)
      miso_ = true;   // pulled up, target not listening
    return;
    }

  if (bitCount_ == 0)
    outByte_ = responseFor (bytePos_);

  miso_ = (outByte_ >> (7 - bitCount_)) & 1;
  inByte_ = (inByte_ << 1) | (mosi_ ? 1 : 0);

  if (++bitCount_ < 8)
    return;

  cmd_ [bytePos_++] = inByte_;
  bitCount_ = 0;
  inByte_ = 0;

  if (bytePos_ == 4)
    {
    execute ();
    bytePos_ = 0;
    }
  }  // end of FakeTarget::setClock

uint8_t FakeTarget::responseFor (const unsigned int position) const
  {
  // out of sync: nothing sensible comes back
  if (!programming && !acknowledgeEnable)
    return 0x00;

  switch (position)
    {
    case 0:  return 0x00;
    case 1:  return cmd_ [0];
    case 2:  return cmd_ [1];
    default: return programming ? readResult () : cmd_ [2];
    }
  }  // end of FakeTarget::responseFor

uint8_t FakeTarget::readResult () const
  {
  switch (cmd_ [0])
    {
    case 0x30:
      return cmd_ [2] < 3 ? signature [cmd_ [2]] : 0xFF;

    case 0x50:
      return cmd_ [1] == 0x00 ? lowFuse : 0xFF;

    case 0x58:
      return cmd_ [1] == 0x08 ? highFuse : lockBits;

    case 0x20:
    case 0x28:
      {
      const unsigned int word = (cmd_ [1] << 8) | cmd_ [2];
      const unsigned int addr = ((word * 2) + (cmd_ [0] == 0x28 ? 1 : 0)) % FLASH_SIZE;
      std::map<unsigned int, uint8_t>::const_iterator corrupt = corruptCells.find (addr);
      if (corrupt != corruptCells.end ())
        return corrupt->second;
      return flash [addr];
      }

    default:
      return cmd_ [2];
    }
  }  // end of FakeTarget::readResult

void FakeTarget::execute ()
  {
  Command command = { { cmd_ [0], cmd_ [1], cmd_ [2], cmd_ [3] } };
  commands.push_back (command);

  if (cmd_ [0] == 0xAC && cmd_ [1] == 0x53)
    {
    if (acknowledgeEnable)
      programming = true;
    return;
    }

  if (!programming)
    return;

  switch (cmd_ [0])
    {
    case 0xAC:
      if (cmd_ [1] == 0x80)
        memset (flash, 0xFF, sizeof flash);
      else if (cmd_ [1] == 0xA0 && fuseWritesStick)
        lowFuse = cmd_ [3];
      else if (cmd_ [1] == 0xA8 && fuseWritesStick)
        highFuse = cmd_ [3];
      break;

    case 0x40:
      pageBuffer [(cmd_ [2] % (PAGE_SIZE / 2)) * 2] = cmd_ [3];
      break;

    case 0x48:
      pageBuffer [(cmd_ [2] % (PAGE_SIZE / 2)) * 2 + 1] = cmd_ [3];
      break;

    case 0x4C:
      {
      const unsigned int word = (cmd_ [1] << 8) | cmd_ [2];
      const unsigned int page = ((word * 2) % FLASH_SIZE) & ~(PAGE_SIZE - 1);
      memcpy (&flash [page], pageBuffer, PAGE_SIZE);
      memset (pageBuffer, 0xFF, sizeof pageBuffer);
      committedPages.push_back (page);
      }
      break;
    }
  }  // end of FakeTarget::execute

unsigned int FakeTarget::countCommands (const uint8_t b1, const uint8_t b2) const
  {
  unsigned int count = 0;
  for (size_t i = 0; i < commands.size (); i++)
    if (commands [i][0] == b1 && commands [i][1] == b2)
      count++;
  return count;
  }

unsigned int FakeTarget::countOpcode (const uint8_t b1) const
  {
  unsigned int count = 0;
  for (size_t i = 0; i < commands.size (); i++)
    if (commands [i][0] == b1)
      count++;
  return count;
  }

unsigned int FakeTarget::writeCount () const
  {
  return countCommands (0xAC, 0x80)
       + countCommands (0xAC, 0xA0)
       + countCommands (0xAC, 0xA8)
       + countOpcode (0x40)
       + countOpcode (0x48)
       + countOpcode (0x4C);
  }
