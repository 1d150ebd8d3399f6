// Isp_Programmer.cpp
//
// Sequencing of a programming run. The ProgrammingSession lives on the
// stack of runProgrammingSession so every return path releases the target.
//
// A MemoryImage needs 1 KB of RAM, more than an Uno can spare next to SdFat,
// so the sketch uses the HexSource form which streams the file instead.

#include <string.h>

#include "Isp_Programmer.h"
#include "Programming_Session.h"

void clearReport (SessionReport & report)
  {
  memset (&report, 0, sizeof report);
  report.status = ispOk;
  report.hexError = hexOk;
  report.fuseRefusal = refusalNone;
  for (unsigned int i = 0; i < NUM_STAGES; i++)
    report.stages [i] = stageNotRun;
  }  // end of clearReport

bool IspProgrammer::fail (SessionReport & report, const IspStatus status) const
  {
  report.status = status;
  report.success = false;
  return false;
  }  // end of IspProgrammer::fail

void IspProgrammer::stageStarted (const IspStage stage) const
  {
  if (observer_)
    observer_->onStageStarted (stage);
  }  // end of IspProgrammer::stageStarted

bool IspProgrammer::decodeFailed (SessionReport & report, const HexDecoder & decoder) const
  {
  report.hexError = decoder.error ();
  report.hexErrorLine = decoder.errorLine ();
  return fail (report, decodeError);
  }  // end of IspProgrammer::decodeFailed

// check file would fit into device memory
bool IspProgrammer::tooLargeForFlash (SessionReport & report, const unsigned long highestAddress) const
  {
  if (highestAddress < config_.flashSize)
    return false;

  report.hexError = hexTooLargeForFlash;
  fail (report, decodeError);
  return true;
  }  // end of IspProgrammer::tooLargeForFlash

bool IspProgrammer::stageFinished (SessionReport & report, const IspStage stage, const bool ok) const
  {
  report.stages [stage] = ok ? stagePassed : stageFailed;
  if (observer_)
    observer_->onStageFinished (stage, ok);
  return ok;
  }  // end of IspProgrammer::stageFinished

bool IspProgrammer::runProgrammingSession (const char * hexText, const FuseConfig & fuses, SessionReport & report)
  {
  clearReport (report);

  MemoryImage image;
  HexDecoder decoder (image);
  decoder.setChecksumRequired (checkSums_);

  // nothing to program? don't go near the chip
  if (decoder.decode (hexText) != hexOk)
    return decodeFailed (report, decoder);

  const bool ok = runProgrammingSession (image, fuses, report);
  report.gotEndOfFile = decoder.gotEndOfFile ();
  report.skippedLines = decoder.skippedLines ();
  return ok;
  }  // end of IspProgrammer::runProgrammingSession

bool IspProgrammer::runProgrammingSession (const MemoryImage & image, const FuseConfig & fuses, SessionReport & report)
  {
  clearReport (report);

  if (image.empty ())
    {
    report.hexError = hexNoData;
    return fail (report, decodeError);
    }

  report.imageBytes = image.size ();
  report.lowestAddress = image.lowestAddress ();
  report.highestAddress = image.highestAddress ();
  report.gotEndOfFile = true;   // already decoded, nothing to warn about

  if (tooLargeForFlash (report, image.highestAddress ()))
    return false;

  ProgrammingSession session (link_, config_, observer_);
  if (!prepareTarget (session, fuses, report))
    return false;

  stageStarted (stageProgramming);
  FlashWriter writer (session);
  const bool written = writer.eraseMemory () && writer.writeImage (image);
  report.pagesWritten = writer.pagesWritten ();
  if (!stageFinished (report, stageProgramming, written))
    return fail (report, notInProgrammingMode);

  stageStarted (stageVerification);
  if (!stageFinished (report, stageVerification, writer.verifyImage (image, report.verify)))
    return fail (report, flashVerifyMismatch);

  report.status = ispOk;
  report.success = true;
  return true;
  }  // end of IspProgrammer::runProgrammingSession

bool IspProgrammer::runProgrammingSession (HexSource & source, const FuseConfig & fuses, SessionReport & report)
  {
  clearReport (report);

  // first pass: whole file checked before going near the chip
  ImageStats stats (config_.pageSize);
  HexDecoder checker (stats);
  checker.setChecksumRequired (checkSums_);
  if (checker.decode (source) != hexOk)
    return decodeFailed (report, checker);

  report.gotEndOfFile = checker.gotEndOfFile ();
  report.skippedLines = checker.skippedLines ();
  report.imageBytes = stats.size ();
  report.lowestAddress = stats.lowestAddress ();
  report.highestAddress = stats.highestAddress ();

  if (tooLargeForFlash (report, stats.highestAddress ()))
    return false;

  // pages are committed as they go past, so each must come in one piece
  if (!stats.ascending ())
    {
    report.hexError = hexNotAscending;
    return fail (report, decodeError);
    }

  ProgrammingSession session (link_, config_, observer_);
  if (!prepareTarget (session, fuses, report))
    return false;

  // second pass: write
  stageStarted (stageProgramming);
  FlashWriter writer (session);
  PageStream pages (writer);
  HexDecoder writing (pages);
  writing.setChecksumRequired (checkSums_);

  bool written = writer.eraseMemory ();
  const HexError writeError = written ? writing.decode (source) : hexOk;
  written = written && writeError == hexOk && pages.flush ();
  report.pagesWritten = writer.pagesWritten ();
  if (!stageFinished (report, stageProgramming, written))
    {
    // file changed (or vanished) since the first pass
    if (writeError != hexOk && !pages.failed ())
      return decodeFailed (report, writing);
    return fail (report, notInProgrammingMode);
    }

  // third pass: compare
  stageStarted (stageVerification);
  VerifyStream compare (writer, report.verify);
  HexDecoder verifier (compare);
  verifier.setChecksumRequired (checkSums_);
  if (verifier.decode (source) != hexOk)
    {
    stageFinished (report, stageVerification, false);
    return decodeFailed (report, verifier);
    }

  if (!stageFinished (report, stageVerification, report.verify.errors == 0))
    return fail (report, flashVerifyMismatch);

  report.status = ispOk;
  report.success = true;
  return true;
  }  // end of IspProgrammer::runProgrammingSession

// programming mode, signature, fuses
bool IspProgrammer::prepareTarget (ProgrammingSession & session, const FuseConfig & fuses, SessionReport & report) const
  {
  stageStarted (stageEntry);
  if (!stageFinished (report, stageEntry, session.begin ()))
    return fail (report, entryFailed);

  stageStarted (stageIdentity);
  session.readSignature (report.signature);
  if (!stageFinished (report, stageIdentity,
                      memcmp (report.signature, config_.sig, sizeof report.signature) == 0))
    return fail (report, wrongDevice);

  stageStarted (stageFuses);
  FuseGuard guard (session);
  const bool fusesOk = guard.applyClockFuseConfig (fuses);
  report.fusesBefore = guard.before ();
  report.fusesAfter = guard.after ();
  report.fuseRefusal = guard.refusal ();
  if (!stageFinished (report, stageFuses, fusesOk))
    return fail (report, guard.failure ());

  return true;
  }  // end of IspProgrammer::prepareTarget
