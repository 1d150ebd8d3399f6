// Isp_Status.h
//
// Outcome codes shared by the programming engine and the sketch

#ifndef ATTINY_ISP_STATUS_H
#define ATTINY_ISP_STATUS_H

// overall result of a programming run (or of one engine operation)
enum IspStatus {
    ispOk,
    decodeError,            // hex image malformed, empty or too big (nothing touched)
    entryFailed,            // target did not acknowledge programming enable
    wrongDevice,            // signature does not match the target configuration
    fuseSafetyAbort,        // guard refused a fuse change that could brick the chip
    fuseWriteVerifyFailed,  // fuse read back differently after writing it
    flashVerifyMismatch,    // one or more flash bytes differ after programming
    notInProgrammingMode,   // write attempted without an active session
};  // end of IspStatus

#endif // ATTINY_ISP_STATUS_H
