// Isp_Programmer.h
//
// One complete run: decode, enter programming mode, check signature,
// fuses, erase, write, verify, leave programming mode.

#ifndef ATTINY_ISP_PROGRAMMER_H
#define ATTINY_ISP_PROGRAMMER_H

#include <stddef.h>
#include <stdint.h>

#include "Flash_Writer.h"
#include "Fuse_Guard.h"
#include "Hex_Decoder.h"
#include "Isp_Link.h"
#include "Isp_Observer.h"
#include "Isp_Status.h"
#include "Target_Config.h"

enum StageResult {
    stageNotRun,
    stagePassed,
    stageFailed,
};  // end of StageResult

// everything the caller needs to know about a run
struct SessionReport
  {
  IspStatus status;
  bool success;
  StageResult stages [NUM_STAGES];

  // decoding
  HexError hexError;
  unsigned int hexErrorLine;
  bool gotEndOfFile;
  unsigned int skippedLines;
  unsigned int imageBytes;
  unsigned int lowestAddress;
  unsigned int highestAddress;

  // chip
  uint8_t signature [3];
  FuseSet fusesBefore;
  FuseSet fusesAfter;
  FuseRefusal fuseRefusal;

  // flash
  unsigned int pagesWritten;
  VerifyResult verify;
  };  // end of SessionReport

class IspProgrammer
  {
  public:
    IspProgrammer (IspLink & link, const TargetConfig & config, IspObserver * observer = NULL)
      : link_ (link), config_ (config), observer_ (observer), checkSums_ (false) {}

    void setChecksumRequired (const bool required) { checkSums_ = required; }

    // decode hexText and program it
    //  returns true if every stage passed; details in report
    bool runProgrammingSession (const char * hexText, const FuseConfig & fuses, SessionReport & report);

    // program an already decoded image
    bool runProgrammingSession (const MemoryImage & image, const FuseConfig & fuses, SessionReport & report);

    // program a file without holding it in memory: it is read three times
    //  (check, write, verify), each page being committed as its data goes past
    bool runProgrammingSession (HexSource & source, const FuseConfig & fuses, SessionReport & report);

  private:
    bool fail (SessionReport & report, const IspStatus status) const;
    bool decodeFailed (SessionReport & report, const HexDecoder & decoder) const;
    bool tooLargeForFlash (SessionReport & report, const unsigned long highestAddress) const;
    bool prepareTarget (ProgrammingSession & session, const FuseConfig & fuses, SessionReport & report) const;
    void stageStarted (const IspStage stage) const;
    bool stageFinished (SessionReport & report, const IspStage stage, const bool ok) const;

    IspLink & link_;
    const TargetConfig & config_;
    IspObserver * observer_;
    bool checkSums_;
  };  // end of class IspProgrammer

void clearReport (SessionReport & report);

#endif // ATTINY_ISP_PROGRAMMER_H
