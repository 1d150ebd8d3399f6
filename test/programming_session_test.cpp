// programming_session_test.cpp

#include <gtest/gtest.h>

#include <vector>

#include "Fake_Target.h"
#include "Programming_Session.h"

namespace {

class CommandLog : public IspObserver
  {
  public:
    void onCommand (const uint8_t command [4], const IspResponse & response) override
      {
      Command c = { { command [0], command [1], command [2], command [3] } };
      commands.push_back (c);
      responses.push_back (response);
      }

    std::vector<Command> commands;
    std::vector<IspResponse> responses;
  };

}  // namespace

TEST (ProgrammingSession, EntersProgrammingMode)
  {
  FakeTarget target;
  ProgrammingSession session (target, ATTINY13A_CONFIG);

  ASSERT_TRUE (session.begin ());
  EXPECT_TRUE (session.isActive ());
  EXPECT_TRUE (session.inReset ());
  EXPECT_TRUE (target.programming);

  ASSERT_EQ (1u, target.commands.size ());
  const Command enable = { { 0xAC, 0x53, 0x00, 0x00 } };
  EXPECT_EQ (enable, target.commands [0]);
  }

TEST (ProgrammingSession, ResetAssertedAfterLinesReleased)
  {
  FakeTarget target;
  ProgrammingSession session (target, ATTINY13A_CONFIG);
  session.begin ();

  ASSERT_EQ (2u, target.resetHistory.size ());
  EXPECT_FALSE (target.resetHistory [0]);
  EXPECT_TRUE (target.resetHistory [1]);
  EXPECT_TRUE (target.resetAsserted);
  EXPECT_FALSE (target.clock);
  }

TEST (ProgrammingSession, NoAcknowledgeMeansNotActive)
  {
  FakeTarget target;
  target.acknowledgeEnable = false;
  ProgrammingSession session (target, ATTINY13A_CONFIG);

  EXPECT_FALSE (session.begin ());
  EXPECT_FALSE (session.isActive ());
  }

TEST (ProgrammingSession, EchoSurfacesInThirdByte)
  {
  FakeTarget target;
  CommandLog log;
  ProgrammingSession session (target, ATTINY13A_CONFIG, &log);
  session.begin ();

  ASSERT_EQ (1u, log.responses.size ());
  EXPECT_EQ (0xAC, log.responses [0].r2);
  EXPECT_EQ (0x53, log.responses [0].r3);
  }

TEST (ProgrammingSession, ReadsSignatureAndFuses)
  {
  FakeTarget target;
  ProgrammingSession session (target, ATTINY13A_CONFIG);
  ASSERT_TRUE (session.begin ());

  uint8_t sig [3] = { 0, 0, 0 };
  session.readSignature (sig);
  EXPECT_EQ (0x1E, sig [0]);
  EXPECT_EQ (0x90, sig [1]);
  EXPECT_EQ (0x07, sig [2]);

  const FuseSet fuses = session.readFuses ();
  EXPECT_EQ (0x6A, fuses.lowFuse);
  EXPECT_EQ (0xFF, fuses.highFuse);
  EXPECT_EQ (0x3F, fuses.lockBits);

  EXPECT_EQ (3u, target.countOpcode (0x30));
  EXPECT_EQ (1u, target.countCommands (0x50, 0x00));
  EXPECT_EQ (1u, target.countCommands (0x58, 0x08));
  EXPECT_EQ (1u, target.countCommands (0x58, 0x00));
  }

TEST (ProgrammingSession, WritesRefusedOutsideProgrammingMode)
  {
  FakeTarget target;
  ProgrammingSession session (target, ATTINY13A_CONFIG);

  EXPECT_FALSE (session.writeCommand (0xAC, 0x80, 0x00, 0x00));
  EXPECT_TRUE (target.commands.empty ());

  target.acknowledgeEnable = false;
  session.begin ();
  EXPECT_FALSE (session.writeCommand (0xAC, 0x80, 0x00, 0x00));
  EXPECT_EQ (0u, target.writeCount ());
  }

TEST (ProgrammingSession, EndReleasesResetOnce)
  {
  FakeTarget target;
  ProgrammingSession session (target, ATTINY13A_CONFIG);
  session.begin ();

  session.end ();
  session.end ();

  EXPECT_FALSE (target.resetAsserted);
  EXPECT_FALSE (session.isActive ());
  EXPECT_FALSE (session.inReset ());
  ASSERT_EQ (3u, target.resetHistory.size ());
  EXPECT_FALSE (target.resetHistory.back ());
  }

TEST (ProgrammingSession, DestructorReleasesTarget)
  {
  FakeTarget target;
  {
    ProgrammingSession session (target, ATTINY13A_CONFIG);
    ASSERT_TRUE (session.begin ());
    EXPECT_TRUE (target.resetAsserted);
  }
  EXPECT_FALSE (target.resetAsserted);
  EXPECT_FALSE (target.programming);
  }

TEST (ProgrammingSession, FailedEntryStillReleased)
  {
  FakeTarget target;
  target.acknowledgeEnable = false;
  {
    ProgrammingSession session (target, ATTINY13A_CONFIG);
    session.begin ();
  }
  EXPECT_FALSE (target.resetAsserted);
  }
