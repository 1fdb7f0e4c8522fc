// ═══════════════════════════════════════════════════════════════════
//  test_crypto.cpp — Tests for operation id digests
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include <gqlir/crypto.h>

using namespace gqlir::crypto;

TEST(CryptoHashTest, SHA256) {
    auto hash = sha256("hello");
    EXPECT_EQ(hash, "2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824");
}

TEST(CryptoHashTest, SHA256Empty) {
    auto hash = sha256("");
    EXPECT_EQ(hash, "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(CryptoHashTest, SHA256KnownVector) {
    EXPECT_EQ(sha256("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(CryptoHashTest, HashesEmbeddedNulBytes) {
    std::string withNul("a\0b", 3);
    EXPECT_NE(sha256(withNul), sha256("a"));
    EXPECT_NE(sha256(withNul), sha256("ab"));
}

TEST(CryptoHexTest, LowercaseDigits) {
    const unsigned char bytes[] = {0x00, 0x0f, 0xab, 0xff};
    EXPECT_EQ(toHex(bytes, sizeof(bytes)), "000fabff");
    EXPECT_EQ(toHex(bytes, 0), "");
}

TEST(OperationIdTest, IsSha256OfSource) {
    std::string source = "query Q {\n  a\n}";
    auto id = operationId(source);
    EXPECT_EQ(id, sha256(source));
    EXPECT_EQ(id.size(), 64u);
    EXPECT_EQ(id.find_first_not_of("0123456789abcdef"), std::string::npos);
}

TEST(OperationIdTest, SensitiveToEveryByte) {
    EXPECT_NE(operationId("query Q {\n  a\n}"), operationId("query Q {\n  a\n} "));
}
