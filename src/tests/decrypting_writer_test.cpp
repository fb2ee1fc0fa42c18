#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <algorithm>
#include <memory>
#include <string>
#include <vector>
#include "crypto/decrypting_writer.hpp"
#include "crypto/position.hpp"
#include "io/sink.hpp"
#include "test_utils.hpp"

using namespace encstream::crypto;
using encstream::io::MemorySink;
using ::testing::_;

namespace {

// Records the calls the writer makes, backed by a real MemorySink
class MockSink : public encstream::io::Sink {
public:
  MockSink() {
    ON_CALL(*this, write(_, _)).WillByDefault([this](const uint8_t* data, std::size_t size) {
      return memory_.write(data, size);
    });
    ON_CALL(*this, tell()).WillByDefault([this]() { return memory_.tell(); });
    ON_CALL(*this, seek(_)).WillByDefault([this](uint64_t position) { memory_.seek(position); });
    ON_CALL(*this, truncate(_)).WillByDefault([this](uint64_t size) { memory_.truncate(size); });
  }

  MOCK_METHOD(std::size_t, write, (const uint8_t* data, std::size_t size), (override));
  MOCK_METHOD(uint64_t, tell, (), (const, override));
  MOCK_METHOD(void, seek, (uint64_t position), (override));
  MOCK_METHOD(void, truncate, (uint64_t size), (override));
  MOCK_METHOD(void, flush, (), (override));

  MemorySink memory_;
};

} // namespace

class DecryptingWriterTest : public ::testing::TestWithParam<std::size_t> {
protected:
  std::vector<uint8_t> key = test_key();
  std::string plaintext;
  std::vector<uint8_t> ciphertext;

  MemorySink* sink = nullptr;
  std::unique_ptr<DecryptingWriter> writer;

  void SetUp() override {
    plaintext = make_payload(GetParam());
    ciphertext = encrypt_string(plaintext, key);
    reset_writer();
  }

  void reset_writer() {
    auto memory_sink = std::make_unique<MemorySink>();
    sink = memory_sink.get();
    writer = std::make_unique<DecryptingWriter>(std::move(memory_sink), key);
  }

  // Writes data in chunks cycling through pattern, checking tell() as it goes
  void write_in_chunks(const std::vector<uint8_t>& data, const std::vector<std::size_t>& pattern) {
    std::size_t offset = 0;
    for (std::size_t i = 0; offset < data.size(); ++i) {
      const std::size_t n = std::min(pattern[i % pattern.size()], data.size() - offset);
      ASSERT_EQ(writer->write(data.data() + offset, n), n);
      offset += n;
      ASSERT_EQ(writer->tell(), offset) << "after chunk " << i;
    }
  }

  void expect_round_trip() {
    writer->end_stream();
    EXPECT_TRUE(writer->complete());
    EXPECT_TRUE(writer->closed());
    EXPECT_EQ(sink->str(), plaintext);
  }

  void expect_rolled_back() {
    EXPECT_EQ(writer->state(), DecryptingWriter::State::Failed);
    EXPECT_TRUE(writer->closed());
    EXPECT_TRUE(sink->data().empty());
    EXPECT_EQ(sink->tell(), 0u);
  }

  // Byte range of ciphertext block index
  std::pair<std::size_t, std::size_t> block_range(uint64_t index) const {
    const auto start = static_cast<std::size_t>(position::cipher_block_offset(index));
    const auto size = static_cast<std::size_t>(position::cipher_block_size(index, plaintext.size()));
    return {start, start + size};
  }
};

TEST_P(DecryptingWriterTest, RoundTripSingleWrite) {
  EXPECT_EQ(writer->write(ciphertext), ciphertext.size());
  if (GetParam() % BLOCK_SIZE == 0) {
    // A full final block is recognised without end_stream()
    EXPECT_TRUE(writer->complete());
  } else {
    // A short final block waits in the buffer for end_stream()
    EXPECT_EQ(writer->state(), DecryptingWriter::State::Streaming);
    EXPECT_EQ(writer->buffered(), position::cipher_block_size(position::last_block_index(GetParam()),
                                                              GetParam()));
  }
  expect_round_trip();
}

TEST_P(DecryptingWriterTest, RoundTripSmallChunks) {
  write_in_chunks(ciphertext, {4096});
  expect_round_trip();
}

TEST_P(DecryptingWriterTest, RoundTripIrregularChunks) {
  write_in_chunks(ciphertext, {1, 7, 23, 1000, 65537, OUTPUT_BLOCK_SIZE - 1, OUTPUT_BLOCK_SIZE + 3, 3});
  expect_round_trip();
}

TEST_P(DecryptingWriterTest, TellAfterCompletion) {
  writer->write(ciphertext);
  writer->end_stream();
  EXPECT_EQ(writer->tell(), ciphertext.size());
}

TEST_P(DecryptingWriterTest, BufferStaysBelowOneBlock) {
  // Everything but the last byte, in one call
  writer->write(ciphertext.data(), ciphertext.size() - 1);
  EXPECT_LT(writer->buffered(), OUTPUT_BLOCK_SIZE);
  EXPECT_EQ(writer->buffered(), position::cipher_block_size(position::last_block_index(plaintext.size()),
                                                            plaintext.size()) - 1);
  EXPECT_EQ(writer->state(), DecryptingWriter::State::Streaming);
}

TEST_P(DecryptingWriterTest, TamperedByteIsDetected) {
  const std::vector<std::size_t> positions = {HEADER_SIZE, ciphertext.size() / 2, ciphertext.size() - 1};

  for (std::size_t position : positions) {
    reset_writer();
    std::vector<uint8_t> tampered = ciphertext;
    tampered[position] ^= 0x01;

    EXPECT_THROW({
      writer->write(tampered);
      writer->end_stream();
    }, AuthenticationError) << "tampered at " << position;
    expect_rolled_back();
  }
}

TEST_P(DecryptingWriterTest, TamperedFileNonceIsDetected) {
  ciphertext[10] ^= 0x80;
  EXPECT_THROW({
    writer->write(ciphertext);
    writer->end_stream();
  }, AuthenticationError);
  expect_rolled_back();
}

TEST_P(DecryptingWriterTest, DroppedFinalBlockIsDetected) {
  const auto last = block_range(position::last_block_index(plaintext.size()));
  writer->write(ciphertext.data(), last.first);

  EXPECT_THROW(writer->end_stream(), IncompleteStreamError);
  expect_rolled_back();
}

TEST_P(DecryptingWriterTest, TruncatedFinalBlockIsDetected) {
  writer->write(ciphertext.data(), ciphertext.size() - 10);

  EXPECT_THROW(writer->end_stream(), AuthenticationError);
  expect_rolled_back();
}

TEST_P(DecryptingWriterTest, WrongKeyIsDetected) {
  auto memory_sink = std::make_unique<MemorySink>();
  sink = memory_sink.get();
  writer = std::make_unique<DecryptingWriter>(std::move(memory_sink),
                                              std::vector<uint8_t>(Aead::KEY_SIZE, 0x24));
  EXPECT_THROW({
    writer->write(ciphertext);
    writer->end_stream();
  }, AuthenticationError);
  expect_rolled_back();
}

INSTANTIATE_TEST_SUITE_P(
  Lengths, DecryptingWriterTest,
  ::testing::Values(1, 1u << 19, BLOCK_SIZE - 1, BLOCK_SIZE, BLOCK_SIZE + 1,
                    5 * BLOCK_SIZE - 1, 5 * BLOCK_SIZE, 5 * BLOCK_SIZE + 1, 5 * BLOCK_SIZE + 147));


// ---- Multi-block streams ----

class DecryptingWriterBlocksTest : public DecryptingWriterTest {};

TEST_P(DecryptingWriterBlocksTest, ReorderedBlocksAreDetected) {
  std::vector<uint8_t> reordered(ciphertext.begin(), ciphertext.begin() + HEADER_SIZE);
  const auto first = block_range(0);
  const auto second = block_range(1);
  reordered.insert(reordered.end(), ciphertext.begin() + second.first, ciphertext.begin() + second.second);
  reordered.insert(reordered.end(), ciphertext.begin() + first.first, ciphertext.begin() + first.second);
  reordered.insert(reordered.end(), ciphertext.begin() + second.second, ciphertext.end());

  EXPECT_THROW({
    writer->write(reordered);
    writer->end_stream();
  }, AuthenticationError);
  expect_rolled_back();
}

TEST_P(DecryptingWriterBlocksTest, FailureRollsBackEarlierBlocks) {
  const auto second = block_range(1);
  writer->write(ciphertext.data(), second.first);
  // The first block is already verified and written
  EXPECT_EQ(sink->data().size(), BLOCK_SIZE);

  std::vector<uint8_t> rest(ciphertext.begin() + second.first, ciphertext.end());
  rest[5] ^= 0x10;
  EXPECT_THROW({
    writer->write(rest);
    writer->end_stream();
  }, AuthenticationError);
  expect_rolled_back();
}

TEST_P(DecryptingWriterBlocksTest, BlocksFromAnotherStreamAreRejected) {
  // Same key and length, different file nonce
  std::vector<uint8_t> spliced = ciphertext;
  const auto other = encrypt_string(plaintext, key);
  const auto second = block_range(1);
  std::copy(other.begin() + second.first, other.begin() + second.second,
            spliced.begin() + second.first);

  EXPECT_THROW({
    writer->write(spliced);
    writer->end_stream();
  }, AuthenticationError);
  expect_rolled_back();
}

TEST_P(DecryptingWriterBlocksTest, TruncationAtBlockBoundaryIsDetected) {
  // Every full non-final block decrypts as a regular block, so the stream
  // only looks incomplete at end_stream()
  const auto second = block_range(1);
  writer->write(ciphertext.data(), second.first);
  EXPECT_EQ(writer->state(), DecryptingWriter::State::Streaming);

  EXPECT_THROW(writer->end_stream(), IncompleteStreamError);
  expect_rolled_back();
}

INSTANTIATE_TEST_SUITE_P(
  Lengths, DecryptingWriterBlocksTest,
  ::testing::Values(BLOCK_SIZE + 1, 3 * BLOCK_SIZE, 5 * BLOCK_SIZE + 147));


// ---- Header handling and lifecycle ----

class DecryptingWriterStateTest : public ::testing::Test {
protected:
  std::vector<uint8_t> key = test_key();
  MemorySink* sink = nullptr;
  std::unique_ptr<DecryptingWriter> writer;

  void SetUp() override {
    auto memory_sink = std::make_unique<MemorySink>();
    sink = memory_sink.get();
    writer = std::make_unique<DecryptingWriter>(std::move(memory_sink), key);
  }
};

TEST_F(DecryptingWriterStateTest, HeaderSplitAcrossWrites) {
  const std::string text = "split header";
  const auto ciphertext = encrypt_string(text, key);

  writer->write(ciphertext.data(), 10);
  EXPECT_EQ(writer->state(), DecryptingWriter::State::AwaitingHeader);
  EXPECT_EQ(writer->tell(), 10u);

  writer->write(ciphertext.data() + 10, HEADER_SIZE - 10);
  EXPECT_EQ(writer->state(), DecryptingWriter::State::Streaming);
  EXPECT_EQ(writer->tell(), HEADER_SIZE);

  writer->write(ciphertext.data() + HEADER_SIZE, ciphertext.size() - HEADER_SIZE);
  writer->end_stream();
  EXPECT_EQ(sink->str(), text);
}

TEST_F(DecryptingWriterStateTest, MalformedHeaderFails) {
  auto ciphertext = encrypt_string("payload", key);
  ciphertext[0] = 0x07;

  EXPECT_THROW(writer->write(ciphertext), MalformedHeaderError);
  EXPECT_EQ(writer->state(), DecryptingWriter::State::Failed);
  EXPECT_TRUE(writer->closed());
  EXPECT_TRUE(sink->data().empty());
}

TEST_F(DecryptingWriterStateTest, EmptyStreamIsIncomplete) {
  EXPECT_THROW(writer->end_stream(), IncompleteStreamError);
  EXPECT_EQ(writer->state(), DecryptingWriter::State::Failed);
}

TEST_F(DecryptingWriterStateTest, PartialHeaderIsIncomplete) {
  const auto ciphertext = encrypt_string("payload", key);
  writer->write(ciphertext.data(), HEADER_SIZE - 1);
  EXPECT_THROW(writer->end_stream(), IncompleteStreamError);
}

TEST_F(DecryptingWriterStateTest, HeaderOnlyIsIncomplete) {
  const auto ciphertext = encrypt_string("payload", key);
  writer->write(ciphertext.data(), HEADER_SIZE);
  EXPECT_THROW(writer->end_stream(), IncompleteStreamError);
}

TEST_F(DecryptingWriterStateTest, TrailingDataAfterFinalBlock) {
  // An exact multiple ends on a full final block, so the extra bytes
  // cannot be mistaken for part of it
  auto ciphertext = encrypt_string(make_payload(BLOCK_SIZE), key);
  ciphertext.push_back(0x00);

  EXPECT_THROW(writer->write(ciphertext), TrailingDataError);
  EXPECT_EQ(writer->state(), DecryptingWriter::State::Failed);
  EXPECT_TRUE(sink->data().empty());
}

TEST_F(DecryptingWriterStateTest, WriteAfterCompletionIsRejected) {
  const auto ciphertext = encrypt_string(make_payload(BLOCK_SIZE), key);
  writer->write(ciphertext);
  ASSERT_TRUE(writer->complete());

  const std::vector<uint8_t> extra(4, 0x00);
  EXPECT_THROW(writer->write(extra), ClosedStreamError);
  // The verified plaintext is kept
  EXPECT_EQ(sink->data().size(), BLOCK_SIZE);
}

TEST_F(DecryptingWriterStateTest, ClosedWriterRejectsOperations) {
  const auto ciphertext = encrypt_string("closing time", key);
  writer->write(ciphertext);
  writer->end_stream();

  EXPECT_NO_THROW(writer->end_stream());
  EXPECT_NO_THROW(writer->close());
  EXPECT_THROW(writer->write(ciphertext), ClosedStreamError);
  EXPECT_THROW(writer->flush(), ClosedStreamError);
}

TEST_F(DecryptingWriterStateTest, FailedWriterRejectsOperations) {
  auto ciphertext = encrypt_string("doomed", key);
  ciphertext.back() ^= 0x01;
  writer->write(ciphertext);
  EXPECT_THROW(writer->end_stream(), AuthenticationError);

  EXPECT_THROW(writer->write(ciphertext), ClosedStreamError);
  EXPECT_THROW(writer->end_stream(), ClosedStreamError);
}

TEST_F(DecryptingWriterStateTest, ReleaseSinkHandsBackPlaintext) {
  const auto ciphertext = encrypt_string("released", key);
  writer->write(ciphertext);
  writer->end_stream();

  std::unique_ptr<encstream::io::Sink> released = writer->release_sink();
  ASSERT_TRUE(released != nullptr);
  EXPECT_EQ(static_cast<MemorySink&>(*released).str(), "released");
  EXPECT_THROW(writer->write(ciphertext), ClosedStreamError);
  EXPECT_THROW(writer->tell(), ClosedStreamError);
}

TEST_F(DecryptingWriterStateTest, NullSinkRejected) {
  EXPECT_THROW(DecryptingWriter(nullptr, key), InvalidInputError);
}

TEST_F(DecryptingWriterStateTest, StateNames) {
  EXPECT_STREQ(to_string(DecryptingWriter::State::AwaitingHeader), "AwaitingHeader");
  EXPECT_STREQ(to_string(DecryptingWriter::State::Streaming), "Streaming");
  EXPECT_STREQ(to_string(DecryptingWriter::State::Complete), "Complete");
  EXPECT_STREQ(to_string(DecryptingWriter::State::Failed), "Failed");
}


// ---- Sink interaction ----

TEST(DecryptingWriterSinkTest, RollbackRewindsThenTruncates) {
  const auto key = test_key();
  auto ciphertext = encrypt_string(make_payload(BLOCK_SIZE + 1), key);
  ciphertext.back() ^= 0x01;

  auto mock = std::make_unique<::testing::NiceMock<MockSink>>();
  MockSink* sink = mock.get();
  {
    ::testing::InSequence sequence;
    EXPECT_CALL(*sink, write(_, BLOCK_SIZE));
    EXPECT_CALL(*sink, seek(0));
    EXPECT_CALL(*sink, truncate(0));
    EXPECT_CALL(*sink, flush());
  }

  DecryptingWriter writer(std::move(mock), key);
  writer.write(ciphertext);
  EXPECT_THROW(writer.end_stream(), AuthenticationError);
  EXPECT_TRUE(sink->memory_.data().empty());
}

TEST(DecryptingWriterSinkTest, CompletionFlushesOnce) {
  const auto key = test_key();
  const auto ciphertext = encrypt_string("flushed exactly once", key);

  auto mock = std::make_unique<::testing::NiceMock<MockSink>>();
  MockSink* sink = mock.get();
  EXPECT_CALL(*sink, seek(_)).Times(0);
  EXPECT_CALL(*sink, truncate(_)).Times(0);
  EXPECT_CALL(*sink, flush()).Times(1);

  {
    DecryptingWriter writer(std::move(mock), key);
    writer.write(ciphertext);
    writer.end_stream();
    EXPECT_EQ(static_cast<MockSink&>(writer.sink()).memory_.str(), "flushed exactly once");
  }
}

TEST(DecryptingWriterSinkTest, CapacityExceededWithoutRollback) {
  const auto key = test_key();
  const auto ciphertext = encrypt_string(make_payload(2 * BLOCK_SIZE), key);

  // The sink already holds every block the 31-bit counter can address
  auto mock = std::make_unique<::testing::NiceMock<MockSink>>();
  MockSink* sink = mock.get();
  ON_CALL(*sink, tell()).WillByDefault(::testing::Return(uint64_t{MAX_COUNTER} * BLOCK_SIZE));
  EXPECT_CALL(*sink, write(_, _)).Times(0);
  EXPECT_CALL(*sink, seek(_)).Times(0);
  EXPECT_CALL(*sink, truncate(_)).Times(0);

  DecryptingWriter writer(std::move(mock), key);
  EXPECT_THROW(writer.write(ciphertext.data(), HEADER_SIZE + OUTPUT_BLOCK_SIZE), CapacityExceededError);
  EXPECT_EQ(writer.state(), DecryptingWriter::State::Failed);
  EXPECT_TRUE(writer.closed());
}

TEST(DecryptingWriterSinkTest, ShortSinkWriteFails) {
  const auto key = test_key();
  const auto ciphertext = encrypt_string("lost in the sink", key);

  auto mock = std::make_unique<::testing::NiceMock<MockSink>>();
  MockSink* sink = mock.get();
  EXPECT_CALL(*sink, write(_, _)).WillOnce([sink](const uint8_t* data, std::size_t size) {
    return sink->memory_.write(data, size - 1);
  });
  {
    ::testing::InSequence sequence;
    EXPECT_CALL(*sink, seek(0));
    EXPECT_CALL(*sink, truncate(0));
  }

  DecryptingWriter writer(std::move(mock), key);
  writer.write(ciphertext);
  EXPECT_THROW(writer.end_stream(), encstream::io::IoError);
  EXPECT_EQ(writer.state(), DecryptingWriter::State::Failed);
  EXPECT_TRUE(sink->memory_.data().empty());
}
