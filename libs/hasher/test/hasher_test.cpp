#include "fidx/hasher.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include <unistd.h>

using namespace fidx::hasher;

namespace fs = std::filesystem;

namespace {

fs::path unique_test_root() {
    static int counter = 0;
    const auto root = fs::temp_directory_path() / "fidx-hasher-tests" /
        (std::to_string(::getpid()) + "-" + std::to_string(counter++));
    fs::remove_all(root);
    fs::create_directories(root);
    return root;
}

void write_text_file(const fs::path& path, const std::string& text) {
    std::ofstream out(path, std::ios::binary);
    ASSERT_TRUE(out.is_open());
    out << text;
}

} // namespace

TEST(Hasher, EmptyStream) {
    std::istringstream s("");
    EXPECT_EQ(sha256_hex(s),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(Hasher, KnownVector) {
    std::istringstream s("abc");
    EXPECT_EQ(sha256_hex(s),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(Hasher, SpansMultipleChunks) {
    // Larger than one read chunk so the digest is fed in several updates.
    std::string data(chunk_size * 3 + 17, 'x');
    std::istringstream a(data);
    std::istringstream b(data);
    auto first = sha256_hex(a);
    EXPECT_EQ(first.size(), 64u);
    EXPECT_EQ(first, sha256_hex(b));

    data.back() = 'y';
    std::istringstream c(data);
    EXPECT_NE(first, sha256_hex(c));
}

TEST(Hasher, IdenticalFilesHaveIdenticalSignatures) {
    auto root = unique_test_root();
    write_text_file(root / "one.txt", "same content\n");
    write_text_file(root / "two.txt", "same content\n");
    write_text_file(root / "three.txt", "other content\n");

    EXPECT_EQ(hash_file(root / "one.txt"), hash_file(root / "two.txt"));
    EXPECT_NE(hash_file(root / "one.txt"), hash_file(root / "three.txt"));
}

TEST(Hasher, MissingFileThrows) {
    auto root = unique_test_root();
    EXPECT_THROW(hash_file(root / "does-not-exist"), std::runtime_error);
}

TEST(Hasher, HexIsLowercase) {
    const uint8_t bytes[] = {0x00, 0xde, 0xad, 0xBE, 0xef};
    EXPECT_EQ(to_hex(bytes, sizeof(bytes)), "00deadbeef");
}
