#include <gtest/gtest.h>
#include "crypto/aes_cipher.hpp"
#include "crypto/byte_order.hpp"
#include "crypto/digest.hpp"
#include "test_utils.hpp"

using namespace deepzoom::crypto;
using deepzoom::test::to_bytes;

//==============================================
// BYTE ORDER
//==============================================

TEST(ByteOrderTest, ReadsBothEndiannesses) {
    const uint8_t data[] = {0x12, 0x34, 0x56, 0x78};
    EXPECT_EQ(ByteOrder::readBigU32(data), 0x12345678u);
    EXPECT_EQ(ByteOrder::readLittleU32(data), 0x78563412u);
}

TEST(ByteOrderTest, AppendMatchesRead) {
    std::vector<uint8_t> out;
    ByteOrder::appendBigU32(out, 0x0A0B0C0D);
    ByteOrder::appendLittleU32(out, 0x0A0B0C0D);

    ASSERT_EQ(out.size(), 8u);
    EXPECT_EQ(out[0], 0x0A);
    EXPECT_EQ(out[4], 0x0D);
    EXPECT_EQ(ByteOrder::readBigU32(out.data()), 0x0A0B0C0Du);
    EXPECT_EQ(ByteOrder::readLittleU32(out.data() + 4), 0x0A0B0C0Du);
}

//==============================================
// DIGESTS AND ENCODING
//==============================================

TEST(DigestTest, HmacSha1KnownAnswer) {
    // RFC 2202 test case 2
    EXPECT_EQ(to_hex(hmac_sha1(to_bytes("Jefe"), "what do ya want for nothing?")),
              "effcdf6ae5eb2fa2d27416d5f184df9c259a7c79");
}

TEST(DigestTest, HmacSha256KnownAnswer) {
    // RFC 4231 test case 2
    EXPECT_EQ(to_hex(hmac_sha256(to_bytes("Jefe"), "what do ya want for nothing?")),
              "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
}

TEST(DigestTest, Sha256KnownAnswer) {
    EXPECT_EQ(to_hex(sha256(std::string("abc"))),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(to_hex(sha256(Bytes())),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(DigestTest, HexRoundTrip) {
    const Bytes bytes = {0x00, 0x7b, 0x2b, 0xff};
    EXPECT_EQ(to_hex(bytes), "007b2bff");
    EXPECT_EQ(from_hex("007B2BFF"), bytes);
}

TEST(DigestTest, FromHexRejectsMalformedInput) {
    EXPECT_THROW(from_hex("abc"), std::invalid_argument);
    EXPECT_THROW(from_hex("zz"), std::invalid_argument);
}

TEST(DigestTest, Base64UsesStandardAlphabetWithPadding) {
    EXPECT_EQ(base64_encode(to_bytes("foobar")), "Zm9vYmFy");
    EXPECT_EQ(base64_encode(to_bytes("fo")), "Zm8=");
    EXPECT_EQ(base64_encode(Bytes()), "");
    EXPECT_EQ(base64_encode(Bytes{0xfb, 0xff}), "+/8=");
}

//==============================================
// AES
//==============================================

class AesCipherTest : public ::testing::Test {
protected:
    // NIST SP 800-38A F.2.1
    const Bytes key = from_hex("2b7e151628aed2a6abf7158809cf4f3c");
    const Bytes iv = from_hex("000102030405060708090a0b0c0d0e0f");
};

TEST_F(AesCipherTest, EncryptKnownAnswer) {
    AesCipher cipher(key, iv);
    const Bytes ciphertext = cipher.encrypt(from_hex("6bc1bee22e409f96e93d7e117393172a"));
    EXPECT_EQ(to_hex(ciphertext), "7649abac8119b246cee98e9b12e9197d");
}

TEST_F(AesCipherTest, DecryptInvertsEncrypt) {
    AesCipher cipher(key, iv);
    Bytes plaintext(64);
    for (size_t i = 0; i < plaintext.size(); ++i) {
        plaintext[i] = static_cast<uint8_t>(i * 7);
    }

    const Bytes ciphertext = cipher.encrypt(plaintext);
    EXPECT_EQ(ciphertext.size(), plaintext.size());
    EXPECT_EQ(cipher.decrypt(ciphertext), plaintext);
}

TEST_F(AesCipherTest, RejectsUnalignedInput) {
    AesCipher cipher(key, iv);
    EXPECT_THROW(cipher.encrypt(Bytes(15)), EncryptionError);
    EXPECT_THROW(cipher.decrypt(Bytes(17)), DecryptionError);
}

TEST_F(AesCipherTest, RejectsInvalidKeyMaterial) {
    EXPECT_THROW(AesCipher(Bytes(8), iv), InitializationError);
    EXPECT_THROW(AesCipher(key, Bytes(12)), InitializationError);
}

TEST_F(AesCipherTest, ErrorsReportFailedOperation) {
    AesCipher cipher(key, iv);
    try {
        cipher.decrypt(Bytes(17));
        FAIL() << "Expected DecryptionError";
    } catch (const CryptoError& e) {
        EXPECT_EQ(e.operation(), CryptoOperation::DECRYPT);
        EXPECT_EQ(std::string(e.what()).rfind("Decryption error: ", 0), 0u);
    }
}
