// General_Stuff.h
//
// Declarations shared by the .ino files of this sketch

#include "Isp_Programmer.h"

// stringification for Arduino IDE version
#define xstr(s) str(s)
#define str(s) #s

// ISP lines driven with digitalWrite / digitalRead
class ArduinoIspLink : public IspLink
  {
  public:
    ArduinoIspLink (const byte sckPin, const byte mosiPin, const byte misoPin, const byte resetPin)
      : sckPin_ (sckPin), mosiPin_ (mosiPin), misoPin_ (misoPin), resetPin_ (resetPin) {}

    // make SCK, MOSI, RESET outputs
    void begin ();
    // everything back to inputs so the target can run
    void release ();

    void setClock (const bool high);
    void setDataOut (const bool high);
    bool readDataIn ();
    void setReset (const bool asserted);
    void delayMicros (const unsigned int us);
    void delayMillis (const unsigned long ms);

  private:
    const byte sckPin_;
    const byte mosiPin_;
    const byte misoPin_;
    const byte resetPin_;
  };  // end of class ArduinoIspLink

// engine events to the serial monitor
class SerialObserver : public IspObserver
  {
  public:
    SerialObserver () : traceCommands_ (false), progressBarCount_ (0) {}

    void setTraceCommands (const bool trace) { traceCommands_ = trace; }

    void onStageStarted (const IspStage stage);
    void onStageFinished (const IspStage stage, const bool ok);
    void onCommand (const uint8_t command [4], const IspResponse & response);
    void onFusesRead (const FuseSet & fuses);
    void onFuseWritten (const uint8_t instruction, const uint8_t value);
    void onPageCommitted (const unsigned int address);
    void onMismatch (const FlashMismatch & mismatch);

  private:
    bool traceCommands_;
    unsigned int progressBarCount_;
  };  // end of class SerialObserver

#if SD_CARD_ACTIVE
// firmware file on the SD card, reopened for each pass
class SdHexSource : public HexSource
  {
  public:
    explicit SdHexSource (const char * fName) : fName_ (fName) {}

    bool rewind ();
    bool readLine (char * buffer, const unsigned int size, bool & lineTooLong);

  private:
    const char * fName_;
    ifstream sdin_;
  };  // end of class SdHexSource
#endif // SD_CARD_ACTIVE

// hex file held in program memory
class ProgmemHexSource : public HexSource
  {
  public:
    explicit ProgmemHexSource (const char * text) : text_ (text), pos_ (0) {}

    bool rewind () { pos_ = 0; return true; }
    bool readLine (char * buffer, const unsigned int size, bool & lineTooLong);

  private:
    const char * text_;   // PROGMEM
    unsigned int pos_;
  };  // end of class ProgmemHexSource

// printable names (kept in flash)
const __FlashStringHelper * statusName (const IspStatus status);
const __FlashStringHelper * stageName (const IspStage stage);
const __FlashStringHelper * hexErrorName (const HexError error);
const __FlashStringHelper * refusalName (const FuseRefusal refusal);

void showHex (const byte b, const boolean newline = false, const boolean show0x = true);
void showYesNo (const boolean b, const boolean newline = false);
void showFuseMeanings (const FuseSet & fuses);
void showReport (const SessionReport & report);
void blink (const int whichLED1,
            const int whichLED2,
            const byte times = 1,
            const unsigned long repeat = 1,
            const unsigned long interval = 200);
void ShowMessage (const byte which);
void initFile ();
