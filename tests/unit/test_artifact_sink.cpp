#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <iterator>
#include <ndcapture/artifact_sink.hpp>
#include <stdexcept>

using namespace ndcapture;

namespace fs = std::filesystem;

class DirectoryArtifactSinkTest : public ::testing::Test
{
   protected:
    void SetUp() override
    {
        dir_ = fs::temp_directory_path() / "ndcapture_test_sink";
        fs::remove_all(dir_);
    }

    void TearDown() override { fs::remove_all(dir_); }

    static std::vector<uint8_t> read_file(const fs::path& p)
    {
        std::ifstream in(p, std::ios::binary);
        return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    }

    fs::path dir_;
};

TEST_F(DirectoryArtifactSinkTest, DeliverCreatesDirectoryAndFile)
{
    DirectoryArtifactSink sink(dir_ / "nested");
    Blob                  blob{{1, 2, 3, 4, 5}, "video/mp4"};
    sink.deliver_segment(blob, "ndcapture-1700000000000-part1.mp4");

    fs::path out = dir_ / "nested" / "ndcapture-1700000000000-part1.mp4";
    ASSERT_TRUE(fs::exists(out));
    EXPECT_EQ(read_file(out), blob.bytes);
}

TEST_F(DirectoryArtifactSinkTest, SaveOverwrites)
{
    DirectoryArtifactSink sink(dir_);
    sink.save(Blob{{9, 9, 9, 9}, "video/mp4"}, "clip.mp4");
    fs::path out = sink.save(Blob{{7}, "video/mp4"}, "clip.mp4");
    EXPECT_EQ(out, dir_ / "clip.mp4");
    EXPECT_EQ(read_file(out), std::vector<uint8_t>{7});
}

TEST_F(DirectoryArtifactSinkTest, EmptyBlobWritesEmptyFile)
{
    DirectoryArtifactSink sink(dir_);
    fs::path              out = sink.save(Blob{}, "empty.webm");
    EXPECT_TRUE(fs::exists(out));
    EXPECT_EQ(fs::file_size(out), 0u);
}

TEST(DirectoryArtifactSink, UnwritableDirectoryThrows)
{
    DirectoryArtifactSink sink("/dev/null/impossible");
    EXPECT_THROW(sink.deliver_segment(Blob{{1}, "video/mp4"}, "part1.mp4"), std::runtime_error);
}
