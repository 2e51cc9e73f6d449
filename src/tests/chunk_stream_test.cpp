#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <filesystem>
#include <limits>
#include <stdexcept>
#include "stream/chunk_stream.hpp"
#include "store/file_bucket.hpp"
#include "error/blob_error.hpp"
#include "crypto/digest.hpp"
#include "mock_bucket_backend.hpp"
#include "test_utils.hpp"

using namespace gridsync;
using gridsync::stream::ChunkReader;
using gridsync::stream::ChunkStreamer;
using gridsync::stream::ChunkWriter;
using ::testing::_;
using ::testing::AnyNumber;
using ::testing::DoDefault;
using ::testing::NiceMock;
using ::testing::Throw;

class ChunkStreamTest : public ::testing::Test {
protected:
  static constexpr uint32_t CHUNK_SIZE = 4;

  std::filesystem::path test_dir;
  std::shared_ptr<store::FileBucket> bucket;
  std::unique_ptr<ChunkStreamer> streamer;

  static void SetUpTestSuite() { init_logging(); }

  void SetUp() override {
    test_dir = make_test_dir("chunk_stream_test");
    bucket = std::make_shared<store::FileBucket>(test_dir, "testdb", "fs");
    streamer = std::make_unique<ChunkStreamer>(bucket, CHUNK_SIZE);
  }

  void TearDown() override {
    streamer.reset();
    bucket.reset();
    std::filesystem::remove_all(test_dir);
  }

  types::ObjectId write_object(const std::string& name, const types::Bytes& data) {
    auto writer = streamer->open_write(name);
    writer->write(data);
    return writer->close();
  }

  static std::vector<types::Bytes> drain(ChunkReader& reader) {
    std::vector<types::Bytes> chunks;
    while (auto chunk = reader.next()) {
      chunks.push_back(std::move(*chunk));
    }
    return chunks;
  }
};

TEST_F(ChunkStreamTest, SplitsContentIntoOrderedChunks) {
  auto id = write_object("ten.bin", to_bytes("0123456789"));

  auto record = streamer->index().describe(id);
  EXPECT_EQ(record.name, "ten.bin");
  EXPECT_EQ(record.length, 10u);
  EXPECT_EQ(record.chunk_size, CHUNK_SIZE);
  EXPECT_EQ(record.chunk_count, 3u);
  EXPECT_EQ(record.checksum, crypto::Sha256::hex_digest("0123456789"));
  EXPECT_EQ(bucket->count_chunks(id), 3u);

  auto reader = streamer->open_read(id);
  auto chunks = drain(*reader);
  ASSERT_EQ(chunks.size(), 3u);
  EXPECT_EQ(chunks[0], to_bytes("0123"));
  EXPECT_EQ(chunks[1], to_bytes("4567"));
  EXPECT_EQ(chunks[2], to_bytes("89"));
  EXPECT_TRUE(reader->done());
  EXPECT_EQ(reader->bytes_read(), 10u);
}

TEST_F(ChunkStreamTest, ExactMultipleOfChunkSize) {
  auto id = write_object("eight.bin", to_bytes("abcdefgh"));
  EXPECT_EQ(streamer->index().describe(id).chunk_count, 2u);

  auto reader = streamer->open_read(id);
  EXPECT_EQ(drain(*reader).size(), 2u);
}

TEST_F(ChunkStreamTest, ManySmallWritesAreRechunked) {
  auto writer = streamer->open_write("pieces.txt");
  for (char c : std::string("abcdefghijk")) {
    uint8_t byte = static_cast<uint8_t>(c);
    writer->write(&byte, 1);
  }
  EXPECT_EQ(writer->bytes_written(), 8u);  // two full chunks flushed, three bytes buffered
  auto id = writer->close();

  auto reader = streamer->open_read(id);
  auto chunks = drain(*reader);
  ASSERT_EQ(chunks.size(), 3u);
  EXPECT_EQ(chunks[2], to_bytes("ijk"));
}

TEST_F(ChunkStreamTest, EmptyObjectHasNoChunks) {
  auto id = write_object("empty", {});

  auto record = streamer->index().describe(id);
  EXPECT_EQ(record.length, 0u);
  EXPECT_EQ(record.chunk_count, 0u);

  auto reader = streamer->open_read(id);
  EXPECT_FALSE(reader->next().has_value());
  EXPECT_TRUE(reader->done());
}

TEST_F(ChunkStreamTest, ReaderIsNotRestartable) {
  auto id = write_object("once.txt", to_bytes("hello"));
  auto reader = streamer->open_read(id);
  EXPECT_EQ(drain(*reader).size(), 2u);
  EXPECT_FALSE(reader->next().has_value());

  // A fresh open starts from the beginning
  auto again = streamer->open_read(id);
  EXPECT_EQ(drain(*again).size(), 2u);
}

TEST_F(ChunkStreamTest, OpenReadUnknownIdIsNotFound) {
  EXPECT_THROW(streamer->open_read(types::ObjectId::generate()), NotFoundError);
}

TEST_F(ChunkStreamTest, RecordInvisibleUntilClose) {
  auto writer = streamer->open_write("pending.txt");
  writer->write(to_bytes("0123456789"));

  EXPECT_FALSE(streamer->index().exists("pending.txt"));
  EXPECT_THROW(streamer->index().describe(writer->id()), NotFoundError);

  auto id = writer->close();
  EXPECT_EQ(streamer->index().resolve("pending.txt"), id);
  EXPECT_EQ(writer->state(), ChunkWriter::State::Closed);
}

TEST_F(ChunkStreamTest, AbortDiscardsChunks) {
  auto writer = streamer->open_write("aborted.txt");
  writer->write(to_bytes("0123456789"));
  auto id = writer->id();
  ASSERT_EQ(bucket->count_chunks(id), 2u);

  writer->abort();
  EXPECT_EQ(writer->state(), ChunkWriter::State::Aborted);
  EXPECT_EQ(bucket->count_chunks(id), 0u);
  EXPECT_FALSE(streamer->index().exists("aborted.txt"));

  EXPECT_THROW(writer->write(to_bytes("more")), std::logic_error);
  EXPECT_THROW(writer->close(), std::logic_error);
}

TEST_F(ChunkStreamTest, DestroyedWriterPublishesNothing) {
  types::ObjectId id;
  {
    auto writer = streamer->open_write("dropped.txt");
    writer->write(to_bytes("0123456789"));
    id = writer->id();
  }

  EXPECT_FALSE(streamer->index().exists("dropped.txt"));
  EXPECT_EQ(bucket->count_chunks(id), 0u);
}

TEST_F(ChunkStreamTest, WriteAfterCloseIsLogicError) {
  auto writer = streamer->open_write("closed.txt");
  writer->close();
  EXPECT_THROW(writer->write(to_bytes("x")), std::logic_error);
  EXPECT_THROW(writer->close(), std::logic_error);
}

TEST_F(ChunkStreamTest, MissingChunkIsRemoteError) {
  auto id = write_object("holey.bin", to_bytes("0123456789"));
  auto record = streamer->index().describe(id);

  // Republish the record under a new id whose chunks were never written
  record.id = types::ObjectId::generate();
  bucket->insert_record(record);
  bucket->insert_chunk(record.id, 0, to_bytes("0123"));

  auto reader = streamer->open_read(record.id);
  ASSERT_TRUE(reader->next().has_value());
  EXPECT_THROW(reader->next(), RemoteError);
}

TEST_F(ChunkStreamTest, WrongSizedChunkIsRemoteError) {
  auto id = write_object("resized.bin", to_bytes("0123456789"));
  bucket->insert_chunk(id, 1, to_bytes("45"));

  auto reader = streamer->open_read(id);
  ASSERT_TRUE(reader->next().has_value());
  EXPECT_THROW(reader->next(), RemoteError);
}

TEST_F(ChunkStreamTest, ChecksumMismatchIsRemoteError) {
  auto id = write_object("tampered.bin", to_bytes("0123456789"));
  bucket->insert_chunk(id, 1, to_bytes("XXXX"));

  auto reader = streamer->open_read(id);
  ASSERT_TRUE(reader->next().has_value());
  ASSERT_TRUE(reader->next().has_value());
  ASSERT_TRUE(reader->next().has_value());
  EXPECT_THROW(reader->next(), RemoteError);
  EXPECT_FALSE(reader->done());
}

TEST_F(ChunkStreamTest, WriteBeyondMaximumChunkCountFails) {
  ChunkStreamer tiny_chunks(bucket, 1);
  auto writer = tiny_chunks.open_write("too_big.bin");
  writer->write(to_bytes("ab"));
  auto id = writer->id();

  // Rejected from the size alone, before any byte is read
  uint8_t byte = 0;
  size_t oversized = static_cast<size_t>(std::numeric_limits<uint32_t>::max());
  EXPECT_THROW(writer->write(&byte, oversized), RemoteError);

  EXPECT_EQ(writer->state(), ChunkWriter::State::Failed);
  EXPECT_EQ(bucket->count_chunks(id), 0u);
  EXPECT_FALSE(tiny_chunks.index().exists("too_big.bin"));
}

TEST_F(ChunkStreamTest, RejectsZeroChunkSize) {
  EXPECT_THROW(ChunkStreamer(bucket, 0), std::invalid_argument);
}


//==============================================
// FAULT INJECTION
//==============================================

class ChunkStreamFaultTest : public ChunkStreamTest {
protected:
  std::shared_ptr<NiceMock<MockBucketBackend>> mock;
  std::unique_ptr<ChunkStreamer> faulty_streamer;

  void SetUp() override {
    ChunkStreamTest::SetUp();
    mock = std::make_shared<NiceMock<MockBucketBackend>>(bucket);
    faulty_streamer = std::make_unique<ChunkStreamer>(mock, CHUNK_SIZE);
  }

  void TearDown() override {
    faulty_streamer.reset();
    mock.reset();
    ChunkStreamTest::TearDown();
  }
};

TEST_F(ChunkStreamFaultTest, FailedChunkInsertPublishesNothing) {
  EXPECT_CALL(*mock, insert_chunk(_, _, _)).Times(AnyNumber());
  EXPECT_CALL(*mock, insert_chunk(_, 2u, _)).WillOnce(Throw(RemoteError("injected chunk failure")));
  EXPECT_CALL(*mock, insert_record(_)).Times(0);

  auto writer = faulty_streamer->open_write("partial.bin");
  auto id = writer->id();
  EXPECT_THROW(writer->write(make_content(20)), RemoteError);

  EXPECT_EQ(writer->state(), ChunkWriter::State::Failed);
  EXPECT_THROW(writer->close(), std::logic_error);
  EXPECT_THROW(faulty_streamer->index().resolve("partial.bin"), NotFoundError);
  EXPECT_EQ(bucket->count_chunks(id), 0u);
}

TEST_F(ChunkStreamFaultTest, FailedUploadKeepsPriorRecord) {
  auto previous = write_object("config.json", to_bytes("{\"v\":1}"));

  EXPECT_CALL(*mock, insert_chunk(_, _, _)).Times(AnyNumber());
  EXPECT_CALL(*mock, insert_chunk(_, 1u, _)).WillOnce(Throw(RemoteError("injected chunk failure")));

  auto writer = faulty_streamer->open_write("config.json");
  EXPECT_THROW(writer->write(to_bytes("{\"v\":2,\"extra\":true}")), RemoteError);

  EXPECT_EQ(faulty_streamer->index().resolve("config.json"), previous);
  EXPECT_EQ(faulty_streamer->index().revisions("config.json").size(), 1u);
}

TEST_F(ChunkStreamFaultTest, FailedPublishDiscardsChunks) {
  EXPECT_CALL(*mock, insert_record(_)).WillOnce(Throw(RemoteError("injected publish failure")));
  EXPECT_CALL(*mock, delete_chunks(_)).Times(1);

  auto writer = faulty_streamer->open_write("unpublished.bin");
  writer->write(to_bytes("0123456789"));
  auto id = writer->id();
  EXPECT_THROW(writer->close(), RemoteError);

  EXPECT_EQ(writer->state(), ChunkWriter::State::Failed);
  EXPECT_FALSE(faulty_streamer->index().exists("unpublished.bin"));
  EXPECT_EQ(bucket->count_chunks(id), 0u);
}

TEST_F(ChunkStreamFaultTest, CleanupFailureDoesNotMaskOriginalError) {
  EXPECT_CALL(*mock, insert_chunk(_, _, _)).WillOnce(Throw(RemoteError("injected chunk failure")));
  EXPECT_CALL(*mock, delete_chunks(_)).WillOnce(Throw(RemoteError("injected cleanup failure")));

  auto writer = faulty_streamer->open_write("doubly_broken.bin");
  try {
    writer->write(to_bytes("0123"));
    FAIL() << "Expected RemoteError";
  } catch (const RemoteError& e) {
    EXPECT_NE(std::string(e.what()).find("injected chunk failure"), std::string::npos);
  }
}

TEST_F(ChunkStreamFaultTest, RemoteReadFailurePropagates) {
  auto id = write_object("remote.bin", to_bytes("0123456789"));

  EXPECT_CALL(*mock, find_chunk(_, _)).Times(AnyNumber());
  EXPECT_CALL(*mock, find_chunk(_, 1u)).WillOnce(Throw(RemoteError("injected read failure")));

  auto reader = faulty_streamer->open_read(id);
  ASSERT_TRUE(reader->next().has_value());
  EXPECT_THROW(reader->next(), RemoteError);
}

TEST_F(ChunkStreamFaultTest, ExistsPropagatesBackendFailure) {
  EXPECT_CALL(*mock, find_records(_))
      .WillOnce(Throw(RemoteError("injected listing failure")))
      .WillRepeatedly(DoDefault());

  EXPECT_THROW(faulty_streamer->index().exists("x"), RemoteError);
  // A healthy backend answers false for an absent name
  EXPECT_FALSE(faulty_streamer->index().exists("x"));
}
