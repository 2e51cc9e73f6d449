#include <gtest/gtest.h>
#include <algorithm>
#include <filesystem>
#include <sstream>
#include <streambuf>
#include <thread>
#include <vector>
#include "client/blob_client.hpp"
#include "store/file_bucket.hpp"
#include "error/blob_error.hpp"
#include "test_utils.hpp"

using namespace gridsync;
using gridsync::client::BlobClient;

namespace {

// Hands out a few bytes, then reports a device error
class FailingStreamBuf : public std::streambuf {
public:
  explicit FailingStreamBuf(std::string prefix) : prefix_(std::move(prefix)) {
    setg(prefix_.data(), prefix_.data(), prefix_.data() + prefix_.size());
  }

protected:
  int_type underflow() override { throw std::ios_base::failure("simulated device error"); }

private:
  std::string prefix_;
};

// Accepts a few bytes, then refuses everything
class FullDiskStreamBuf : public std::streambuf {
public:
  explicit FullDiskStreamBuf(std::streamsize capacity) : capacity_(capacity) {}

protected:
  std::streamsize xsputn(const char*, std::streamsize count) override {
    std::streamsize accepted = std::min(count, capacity_);
    capacity_ -= accepted;
    return accepted;
  }
  int_type overflow(int_type) override { return traits_type::eof(); }

private:
  std::streamsize capacity_;
};

} // namespace

class BlobClientTest : public ::testing::Test {
protected:
  std::filesystem::path test_dir;
  std::shared_ptr<store::FileBucket> bucket;
  std::unique_ptr<BlobClient> client;

  static void SetUpTestSuite() { init_logging(); }

  void SetUp() override {
    test_dir = make_test_dir("blob_client_test");
    bucket = std::make_shared<store::FileBucket>(test_dir, "testdb", "fs");
    client = std::make_unique<BlobClient>(bucket, 8);
  }

  void TearDown() override {
    client.reset();
    bucket.reset();
    std::filesystem::remove_all(test_dir);
  }
};

TEST_F(BlobClientTest, WriteThenReadByName) {
  auto id = client->write_bytes("a.txt", to_bytes("hello"));

  EXPECT_EQ(client->read_bytes("a.txt"), to_bytes("hello"));
  EXPECT_EQ(client->id("a.txt"), id);
  EXPECT_TRUE(client->exists("a.txt"));
  EXPECT_FALSE(client->exists("b.txt"));
}

TEST_F(BlobClientTest, ExistsOnlyAfterWrite) {
  EXPECT_FALSE(client->exists("later.bin"));
  client->write_bytes("later.bin", to_bytes("x"));
  EXPECT_TRUE(client->exists("later.bin"));
}

TEST_F(BlobClientTest, EmptyContentRoundTrip) {
  auto id = client->write_bytes("empty", {});

  EXPECT_TRUE(client->read_bytes("empty").empty());
  EXPECT_EQ(client->read_text(id), "");
  EXPECT_EQ(client->describe(id).length, 0u);
}

TEST_F(BlobClientTest, ReadByIdentifier) {
  auto content = make_content(100);
  auto id = client->write_bytes("by_id.bin", content);

  EXPECT_EQ(client->read_bytes(id), content);
  EXPECT_EQ(client->describe(id).chunk_count, 13u);
}

TEST_F(BlobClientTest, UnknownNameIsNotFound) {
  EXPECT_THROW(client->id("missing"), NotFoundError);
  EXPECT_THROW(client->read_bytes("missing"), NotFoundError);
  EXPECT_THROW(client->read_text("missing"), NotFoundError);
}

TEST_F(BlobClientTest, UnknownIdentifierIsNotFound) {
  EXPECT_THROW(client->read_bytes(types::ObjectId::generate()), NotFoundError);
  EXPECT_THROW(client->describe(types::ObjectId::generate()), NotFoundError);
}

TEST_F(BlobClientTest, ReadTextDecodesUtf8) {
  std::string text = "gr\xc3\xbc\xc3\x9f dich, \xe4\xb8\x96\xe7\x95\x8c";
  auto id = client->write_text("greeting.txt", text);

  EXPECT_EQ(client->read_text("greeting.txt"), text);
  EXPECT_EQ(client->read_text(id), text);
}

TEST_F(BlobClientTest, ReadTextRejectsInvalidUtf8) {
  client->write_bytes("binary.bin", types::Bytes{0xff, 0xfe});

  EXPECT_THROW(client->read_text("binary.bin"), DecodeError);
  // The raw bytes are still readable
  EXPECT_EQ(client->read_bytes("binary.bin"), (types::Bytes{0xff, 0xfe}));
}

TEST_F(BlobClientTest, ReadTextRejectsTruncatedSequence) {
  client->write_bytes("cut.txt", to_bytes("abc\xe4\xb8"));
  EXPECT_THROW(client->read_text("cut.txt"), DecodeError);
}

TEST_F(BlobClientTest, OverwriteResolvesToNewest) {
  auto first = client->write_text("notes.txt", "first draft");
  auto second = client->write_text("notes.txt", "second draft");

  EXPECT_NE(first, second);
  EXPECT_EQ(client->id("notes.txt"), second);
  EXPECT_EQ(client->read_text("notes.txt"), "second draft");

  // The previous revision stays addressable by identifier
  EXPECT_EQ(client->read_text(first), "first draft");
  EXPECT_EQ(client->index().revisions("notes.txt").size(), 2u);
}

TEST_F(BlobClientTest, ClientsSharingBackendSeeEachOthersWrites) {
  BlobClient other(bucket, 16);

  client->write_text("shared.txt", "from first");
  EXPECT_EQ(other.read_text("shared.txt"), "from first");

  other.write_text("shared.txt", "from second");
  EXPECT_EQ(client->read_text("shared.txt"), "from second");
}

TEST_F(BlobClientTest, StreamRoundTrip) {
  auto content = make_content(1000, 7);
  std::string as_text(content.begin(), content.end());
  std::istringstream input(as_text);

  auto id = client->upload_from_stream("streamed.bin", input);
  EXPECT_EQ(client->describe(id).length, 1000u);

  std::ostringstream output;
  EXPECT_EQ(client->download_to_stream(id, output), 1000u);
  EXPECT_EQ(output.str(), as_text);
}

TEST_F(BlobClientTest, FailingInputStreamPublishesNothing) {
  FailingStreamBuf buf("0123456789abcdef0123");
  std::istream input(&buf);

  EXPECT_THROW(client->upload_from_stream("broken.bin", input), LocalIOError);
  EXPECT_FALSE(client->exists("broken.bin"));
}

TEST_F(BlobClientTest, FailingOutputStreamIsLocalIOError) {
  auto id = client->write_bytes("big.bin", make_content(64));

  FullDiskStreamBuf buf(10);
  std::ostream output(&buf);
  EXPECT_THROW(client->download_to_stream(id, output), LocalIOError);
}

TEST_F(BlobClientTest, BadStreamsAreRejectedUpFront) {
  std::istringstream input("data");
  input.setstate(std::ios::failbit);
  EXPECT_THROW(client->upload_from_stream("never.bin", input), LocalIOError);

  auto id = client->write_text("present.txt", "data");
  std::ostringstream output;
  output.setstate(std::ios::badbit);
  EXPECT_THROW(client->download_to_stream(id, output), LocalIOError);
}

TEST_F(BlobClientTest, ConcurrentWritersToDistinctNames) {
  constexpr int WRITERS = 8;
  std::vector<std::thread> threads;
  for (int i = 0; i < WRITERS; ++i) {
    threads.emplace_back([this, i]() {
      client->write_bytes("file_" + std::to_string(i), make_content(50 + i, i));
    });
  }
  for (auto& t : threads) {
    t.join();
  }

  for (int i = 0; i < WRITERS; ++i) {
    EXPECT_EQ(client->read_bytes("file_" + std::to_string(i)), make_content(50 + i, i));
  }
}

TEST_F(BlobClientTest, ConcurrentWritersToSameNameLeaveOneWinner) {
  constexpr int WRITERS = 6;
  std::vector<std::thread> threads;
  for (int i = 0; i < WRITERS; ++i) {
    threads.emplace_back([this, i]() {
      client->write_text("contended.txt", "writer " + std::to_string(i));
    });
  }
  for (auto& t : threads) {
    t.join();
  }

  auto winner = client->read_text("contended.txt");
  EXPECT_EQ(winner.rfind("writer ", 0), 0u);
  EXPECT_EQ(client->index().revisions("contended.txt").size(), static_cast<size_t>(WRITERS));
}

TEST_F(BlobClientTest, ConstructFromConfig) {
  config::BucketConfig config;
  config.connection_string = "file://" + (test_dir / "configured").string();
  config.database = "db";
  config.bucket = "photos";
  config.chunk_size = 32;

  BlobClient configured(config);
  EXPECT_EQ(configured.chunk_size(), 32u);

  auto id = configured.write_text("cat.jpg", "meow");
  EXPECT_EQ(configured.read_text(id), "meow");
  EXPECT_TRUE(std::filesystem::exists(test_dir / "configured" / "db" / "photos.files"));
}

TEST_F(BlobClientTest, InvalidConfigIsRejected) {
  config::BucketConfig config;
  config.connection_string = "mongodb://localhost";
  EXPECT_THROW(BlobClient{config}, ConfigError);
}
