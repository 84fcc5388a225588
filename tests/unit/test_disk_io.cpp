#include <gtest/gtest.h>
#include "disk_io.hpp"
#include <cerrno>
#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

// Every case runs against the io_uring path and the pread/pwrite fallback
class DiskFileTest : public ::testing::TestWithParam<bool> {
protected:
    const std::string dir = "/tmp/lanshare_disk_test";

    void SetUp() override {
        std::filesystem::create_directories(dir);
        if (GetParam()) {
            ring = DiskFile::make_ring(8);
            if (!ring) GTEST_SKIP() << "io_uring not available";
        }
    }

    void TearDown() override {
        std::filesystem::remove_all(dir);
    }

    std::string read_all(const std::string& path) {
        std::ifstream in(path, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), {});
    }

    std::unique_ptr<RingManager> ring;
};

TEST_P(DiskFileTest, UsesRingWhenGiven) {
    DiskFile file(ring.get());
    EXPECT_EQ(file.uses_ring(), GetParam());
}

TEST_P(DiskFileTest, WriteThenRead) {
    std::string path = dir + "/notes.pdf";
    std::vector<char> data(2048);
    for (size_t i = 0; i < data.size(); i++) data[i] = static_cast<char>(i * 7);

    {
        DiskFile out(ring.get());
        ASSERT_EQ(out.open_write(path), 0);
        EXPECT_TRUE(out.is_open());
        EXPECT_EQ(out.write_at(data.data(), 1000, 0), 1000);
        EXPECT_EQ(out.write_at(data.data() + 1000, 1048, 1000), 1048);
        EXPECT_EQ(out.size(), 2048);
    }  // Destructor closes

    DiskFile in(ring.get());
    ASSERT_EQ(in.open_read(path), 0);
    EXPECT_EQ(in.size(), 2048);

    std::vector<char> back(2048);
    EXPECT_EQ(in.read_at(back.data(), 1024, 0), 1024);
    EXPECT_EQ(in.read_at(back.data() + 1024, 1024, 1024), 1024);
    EXPECT_EQ(back, data);

    // At EOF
    char extra[16];
    EXPECT_EQ(in.read_at(extra, sizeof(extra), 2048), 0);
    in.close();
    EXPECT_FALSE(in.is_open());
}

TEST_P(DiskFileTest, ShortReadNearEnd) {
    std::string path = dir + "/short.bin";
    {
        std::ofstream out(path, std::ios::binary);
        out << "0123456789";
    }

    DiskFile in(ring.get());
    ASSERT_EQ(in.open_read(path), 0);
    char buf[8192];
    EXPECT_EQ(in.read_at(buf, sizeof(buf), 4), 6);
    EXPECT_EQ(std::string(buf, 6), "456789");
}

TEST_P(DiskFileTest, OpenWriteTruncates) {
    std::string path = dir + "/slides.pdf";
    {
        std::ofstream out(path, std::ios::binary);
        out << std::string(4096, 'o');
    }

    DiskFile out(ring.get());
    ASSERT_EQ(out.open_write(path), 0);
    EXPECT_EQ(out.write_at("new", 3, 0), 3);
    out.close();

    EXPECT_EQ(read_all(path), "new");

    struct stat st;
    ASSERT_EQ(stat(path.c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 0600, 0600u);
    EXPECT_EQ(st.st_mode & 0111, 0u);
}

TEST_P(DiskFileTest, ReopenClosesPrevious) {
    std::string a = dir + "/a.txt";
    std::string b = dir + "/b.txt";
    {
        std::ofstream out_a(a);
        out_a << "AAAA";
        std::ofstream out_b(b);
        out_b << "BB";
    }

    DiskFile f(ring.get());
    ASSERT_EQ(f.open_read(a), 0);
    ASSERT_EQ(f.open_read(b), 0);
    EXPECT_EQ(f.size(), 2);
}

TEST_P(DiskFileTest, OpenReadRefusesSymlink) {
    std::string target = dir + "/real.txt";
    {
        std::ofstream out(target, std::ios::binary);
        out << "abc";
    }
    std::filesystem::create_symlink(target, dir + "/link.txt");

    DiskFile f(ring.get());
    EXPECT_EQ(f.open_read(dir + "/link.txt"), -ELOOP);
    EXPECT_FALSE(f.is_open());
    EXPECT_EQ(f.open_read(target), 0);
}

INSTANTIATE_TEST_SUITE_P(IoPaths, DiskFileTest, ::testing::Values(false, true),
                         [](const ::testing::TestParamInfo<bool>& info) {
                             return info.param ? std::string("Ring") : std::string("Sync");
                         });
