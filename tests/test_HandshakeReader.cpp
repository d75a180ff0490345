#include <gtest/gtest.h>
#include <chrono>
#include <memory>
#include <string>

#include <unistd.h>

#include "core/Errors.h"
#include "process/HandshakeReader.h"

using namespace std::chrono_literals;

static ErrorKind parseErrorKind(const std::string& line) {
  try {
    HandshakeReader::parseHandshake(line);
  } catch (const SupervisorError& e) {
    return e.kind();
  }
  ADD_FAILURE() << "expected SupervisorError for: " << line;
  return ErrorKind::Io;
}

TEST(HandshakeParse, AcceptsFullMessage) {
  auto msg = HandshakeReader::parseHandshake(
      R"({"type":"server_listening","url":"ws://127.0.0.1:4321/ws","port":4321,"cwd":"/work"})");
  EXPECT_EQ(msg.type, "server_listening");
  EXPECT_EQ(msg.url, "ws://127.0.0.1:4321/ws");
  EXPECT_EQ(msg.port, 4321);
  EXPECT_EQ(msg.cwd, "/work");
}

TEST(HandshakeParse, OnlyUrlIsRequired) {
  auto msg = HandshakeReader::parseHandshake("  {\"url\":\"ws://localhost:1\"}\r\n");
  EXPECT_EQ(msg.url, "ws://localhost:1");
  EXPECT_EQ(msg.port, 0);
  EXPECT_TRUE(msg.type.empty());
}

TEST(HandshakeParse, RejectsBadLines) {
  EXPECT_EQ(parseErrorKind("Listening on port 3000"), ErrorKind::Protocol);
  EXPECT_EQ(parseErrorKind(""), ErrorKind::Protocol);
  EXPECT_EQ(parseErrorKind("[1,2]"), ErrorKind::Protocol);
  EXPECT_EQ(parseErrorKind(R"({"type":"server_listening","port":1})"), ErrorKind::Protocol);
  EXPECT_EQ(parseErrorKind(R"({"url":42})"), ErrorKind::Protocol);
  EXPECT_EQ(parseErrorKind(R"({"url":"ws://x","port":70000})"), ErrorKind::Protocol);
  EXPECT_EQ(parseErrorKind(R"({"url":"ws://x","port":"80"})"), ErrorKind::Protocol);
}

TEST(HandshakeParse, ErrorMessageHasPrefix) {
  try {
    HandshakeReader::parseHandshake("nope");
    FAIL() << "expected SupervisorError";
  } catch (const SupervisorError& e) {
    EXPECT_EQ(std::string(e.what()).rfind("Failed to parse server startup JSON", 0), 0u) << e.what();
  }
}

// Owns a pair of pipes standing in for a child's stdout and stderr.
class HandshakeReaderTest : public ::testing::Test {
protected:
  int outPipe[2] = {-1, -1};
  int errPipe[2] = {-1, -1};
  std::unique_ptr<HandshakeReader> reader;

  void SetUp() override {
    ASSERT_EQ(::pipe(outPipe), 0);
    ASSERT_EQ(::pipe(errPipe), 0);
    reader = std::make_unique<HandshakeReader>(outPipe[0], errPipe[0], "test-server");
  }

  void TearDown() override {
    reader.reset();
    closeWriters();
    for (int fd : {outPipe[0], errPipe[0]}) {
      if (fd >= 0) ::close(fd);
    }
  }

  void writeStdout(const std::string& s) {
    ASSERT_EQ(::write(outPipe[1], s.data(), s.size()), static_cast<ssize_t>(s.size()));
  }

  void closeWriters() {
    for (int* fd : {&outPipe[1], &errPipe[1]}) {
      if (*fd >= 0) {
        ::close(*fd);
        *fd = -1;
      }
    }
  }
};

TEST_F(HandshakeReaderTest, DeliversFirstLine) {
  writeStdout("{\"url\":\"ws://127.0.0.1:9\"}\nlater output\n");
  EXPECT_EQ(reader->awaitFirstLine(2000ms), "{\"url\":\"ws://127.0.0.1:9\"}");
}

TEST_F(HandshakeReaderTest, AssemblesLineFromSeveralWrites) {
  writeStdout("{\"url\":");
  writeStdout("\"ws://a\"}\r\n");
  EXPECT_EQ(reader->awaitFirstLine(2000ms), "{\"url\":\"ws://a\"}");
}

TEST_F(HandshakeReaderTest, TimesOutWithoutOutput) {
  auto start = std::chrono::steady_clock::now();
  try {
    reader->awaitFirstLine(150ms);
    FAIL() << "expected SupervisorError";
  } catch (const SupervisorError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::StartupTimeout);
    EXPECT_NE(std::string(e.what()).find("timed out"), std::string::npos);
  }
  EXPECT_GE(std::chrono::steady_clock::now() - start, 150ms);
}

TEST_F(HandshakeReaderTest, ClosedStdoutIsProcessError) {
  closeWriters();
  try {
    reader->awaitFirstLine(2000ms);
    FAIL() << "expected SupervisorError";
  } catch (const SupervisorError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::Process);
    EXPECT_NE(std::string(e.what()).find("Failed to read server startup line"), std::string::npos) << e.what();
  }
}

TEST_F(HandshakeReaderTest, UnterminatedLineBeforeEofIsDelivered) {
  writeStdout("{\"url\":\"ws://tail\"}");
  closeWriters();
  EXPECT_EQ(reader->awaitFirstLine(2000ms), "{\"url\":\"ws://tail\"}");
}

TEST_F(HandshakeReaderTest, SecondAwaitIsProcessError) {
  writeStdout("{\"url\":\"ws://once\"}\n");
  reader->awaitFirstLine(2000ms);
  EXPECT_THROW(reader->awaitFirstLine(100ms), SupervisorError);
}

TEST_F(HandshakeReaderTest, StopReturnsWhileWritersStayOpen) {
  auto start = std::chrono::steady_clock::now();
  reader->stop();
  reader->stop();
  EXPECT_LT(std::chrono::steady_clock::now() - start, 1000ms);
}

TEST_F(HandshakeReaderTest, OverlongOutputWithoutNewlineIsCut) {
  // Larger than the pipe buffer; the write completes as the reader drains it.
  writeStdout(std::string(HandshakeReader::kMaxLineBytes + 10, 'x'));
  std::string line = reader->awaitFirstLine(2000ms);
  EXPECT_EQ(line.size(), HandshakeReader::kMaxLineBytes);
  EXPECT_EQ(line.find_first_not_of('x'), std::string::npos);
}
