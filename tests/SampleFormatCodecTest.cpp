#include <cstdint>
#include <cstring>
#include <vector>
#include <flex/player/Codec/SampleFormatCodec.hpp>
#include <gtest/gtest.h>

using flex::player::codec::SampleFormatCodec;
using flex::player::codec::SampleWidth;

namespace {

int32_t readInt32(const std::vector<uint8_t> &bytes, size_t index) {
  int32_t value;
  std::memcpy(&value, bytes.data() + index * sizeof(value), sizeof(value));
  return value;
}

int16_t readInt16(const std::vector<uint8_t> &bytes, size_t index) {
  int16_t value;
  std::memcpy(&value, bytes.data() + index * sizeof(value), sizeof(value));
  return value;
}

} // namespace

TEST(SampleFormatCodecTest, Int24SignExtension) {
  const uint8_t negativeLarge[] = {0xFF, 0xFF, 0x80};
  const uint8_t positive[] = {0x00, 0x00, 0x7F};
  const uint8_t minimum[] = {0x00, 0x00, 0x80};
  const uint8_t maximum[] = {0xFF, 0xFF, 0x7F};
  const uint8_t minusOne[] = {0xFF, 0xFF, 0xFF};
  const uint8_t zero[] = {0x00, 0x00, 0x00};

  EXPECT_EQ(SampleFormatCodec::decodeInt24(negativeLarge), -8323073);
  EXPECT_EQ(SampleFormatCodec::decodeInt24(positive), 8323072);
  EXPECT_EQ(SampleFormatCodec::decodeInt24(minimum), -8388608);
  EXPECT_EQ(SampleFormatCodec::decodeInt24(maximum), 8388607);
  EXPECT_EQ(SampleFormatCodec::decodeInt24(minusOne), -1);
  EXPECT_EQ(SampleFormatCodec::decodeInt24(zero), 0);
}

TEST(SampleFormatCodecTest, Int24BytesToFloatKeepsIntegerScale) {
  const std::vector<uint8_t> bytes = {0xFF, 0xFF, 0x80, 0x00, 0x00, 0x7F,
                                      0x01, 0x00, 0x00};

  const auto samples = SampleFormatCodec::bytesToFloat(bytes, 3);

  ASSERT_EQ(samples.size(), 3u);
  EXPECT_FLOAT_EQ(samples[0], -8323073.0f);
  EXPECT_FLOAT_EQ(samples[1], 8323072.0f);
  EXPECT_FLOAT_EQ(samples[2], 1.0f);
}

TEST(SampleFormatCodecTest, Int16LittleEndian) {
  const std::vector<uint8_t> bytes = {0x50, 0xFB, 0xB0, 0x04, 0x00, 0x80};

  const auto samples = SampleFormatCodec::bytesToFloat(bytes, 2);

  ASSERT_EQ(samples.size(), 3u);
  EXPECT_FLOAT_EQ(samples[0], -1200.0f);
  EXPECT_FLOAT_EQ(samples[1], 1200.0f);
  EXPECT_FLOAT_EQ(samples[2], -32768.0f);
}

TEST(SampleFormatCodecTest, Int8AndInt32Widths) {
  const std::vector<uint8_t> int8Bytes = {0x7F, 0x80, 0xFF};
  const auto int8Samples = SampleFormatCodec::bytesToFloat(int8Bytes, 1);
  ASSERT_EQ(int8Samples.size(), 3u);
  EXPECT_FLOAT_EQ(int8Samples[0], 127.0f);
  EXPECT_FLOAT_EQ(int8Samples[1], -128.0f);
  EXPECT_FLOAT_EQ(int8Samples[2], -1.0f);

  const std::vector<uint8_t> int32Bytes = {0x00, 0x01, 0x00, 0x00,
                                           0xFF, 0xFF, 0xFF, 0xFF};
  const auto int32Samples = SampleFormatCodec::bytesToFloat(int32Bytes, 4);
  ASSERT_EQ(int32Samples.size(), 2u);
  EXPECT_FLOAT_EQ(int32Samples[0], 256.0f);
  EXPECT_FLOAT_EQ(int32Samples[1], -1.0f);
}

TEST(SampleFormatCodecTest, UnknownWidthFallsBackTo16Bit) {
  EXPECT_EQ(SampleFormatCodec::resolveWidth(0), SampleWidth::INT16);
  EXPECT_EQ(SampleFormatCodec::resolveWidth(5), SampleWidth::INT16);
  EXPECT_EQ(SampleFormatCodec::outputWidth(7), 2u);

  const std::vector<uint8_t> bytes = {0x01, 0x00, 0xFF, 0xFF};
  const auto samples = SampleFormatCodec::bytesToFloat(bytes, 6);
  ASSERT_EQ(samples.size(), 2u);
  EXPECT_FLOAT_EQ(samples[0], 1.0f);
  EXPECT_FLOAT_EQ(samples[1], -1.0f);
}

TEST(SampleFormatCodecTest, OutputWidthPromotes24BitTo32Bit) {
  EXPECT_EQ(SampleFormatCodec::outputWidth(1), 1u);
  EXPECT_EQ(SampleFormatCodec::outputWidth(2), 2u);
  EXPECT_EQ(SampleFormatCodec::outputWidth(3), 4u);
  EXPECT_EQ(SampleFormatCodec::outputWidth(4), 4u);
}

TEST(SampleFormatCodecTest, Int24IsEncodedAsTopAlignedInt32) {
  const std::vector<float> samples = {8388607.0f, -8388608.0f, 1.0f, -1.0f};

  const auto bytes = SampleFormatCodec::floatToBytes(samples, 3);

  ASSERT_EQ(bytes.size(), samples.size() * 4);
  EXPECT_EQ(readInt32(bytes, 0), 8388607 * 256);
  EXPECT_EQ(readInt32(bytes, 1), -8388608 * 256);
  EXPECT_EQ(readInt32(bytes, 2), 256);
  EXPECT_EQ(readInt32(bytes, 3), -256);
}

TEST(SampleFormatCodecTest, Int24EncodingMatchesReferenceLayout) {
  // 0x123456 and -0x123456 encoded by hand as 3-byte little-endian
  const std::vector<uint8_t> reference = {0x56, 0x34, 0x12, 0xAA, 0xCB, 0xED};

  const auto samples = SampleFormatCodec::bytesToFloat(reference, 3);
  ASSERT_EQ(samples.size(), 2u);
  EXPECT_FLOAT_EQ(samples[0], static_cast<float>(0x123456));
  EXPECT_FLOAT_EQ(samples[1], static_cast<float>(-0x123456));

  const auto encoded = SampleFormatCodec::floatToBytes(samples, 3);
  ASSERT_EQ(encoded.size(), 8u);
  // The three source bytes end up in bytes 1..3 of each 32-bit word
  EXPECT_EQ(encoded[0], 0x00);
  EXPECT_EQ(encoded[1], 0x56);
  EXPECT_EQ(encoded[2], 0x34);
  EXPECT_EQ(encoded[3], 0x12);
  EXPECT_EQ(encoded[4], 0x00);
  EXPECT_EQ(encoded[5], 0xAA);
  EXPECT_EQ(encoded[6], 0xCB);
  EXPECT_EQ(encoded[7], 0xED);
}

TEST(SampleFormatCodecTest, Int16EncodingSaturatesAndTruncates) {
  const std::vector<float> samples = {40000.0f, -40000.0f, 1.9f, -1.9f,
                                      -1200.0f};

  const auto bytes = SampleFormatCodec::floatToBytes(samples, 2);

  ASSERT_EQ(bytes.size(), samples.size() * 2);
  EXPECT_EQ(readInt16(bytes, 0), 32767);
  EXPECT_EQ(readInt16(bytes, 1), -32768);
  EXPECT_EQ(readInt16(bytes, 2), 1);
  EXPECT_EQ(readInt16(bytes, 3), -1);
  EXPECT_EQ(readInt16(bytes, 4), -1200);
}

TEST(SampleFormatCodecTest, Int8AndInt32EncodingSaturate) {
  const auto int8Bytes =
      SampleFormatCodec::floatToBytes(std::vector<float>{200.0f, -200.0f}, 1);
  ASSERT_EQ(int8Bytes.size(), 2u);
  EXPECT_EQ(static_cast<int8_t>(int8Bytes[0]), 127);
  EXPECT_EQ(static_cast<int8_t>(int8Bytes[1]), -128);

  const auto int32Bytes =
      SampleFormatCodec::floatToBytes(std::vector<float>{5.0e9f, -5.0e9f}, 4);
  ASSERT_EQ(int32Bytes.size(), 8u);
  EXPECT_EQ(readInt32(int32Bytes, 0), 2147483647);
  EXPECT_EQ(readInt32(int32Bytes, 1), -2147483647 - 1);
}

TEST(SampleFormatCodecTest, RealTimeEncodeWritesIntoCallerBuffer) {
  const float samples[] = {100.0f, -100.0f};
  uint8_t output[8] = {};

  const size_t written = SampleFormatCodec::floatToBytes(samples, 2, 2, output);

  EXPECT_EQ(written, 4u);
  int16_t first;
  std::memcpy(&first, output, sizeof(first));
  EXPECT_EQ(first, 100);
  EXPECT_EQ(output[4], 0);
}

TEST(SampleFormatCodecTest, TrailingPartialSampleIsIgnored) {
  const std::vector<uint8_t> bytes = {0x01, 0x00, 0x02};
  EXPECT_EQ(SampleFormatCodec::bytesToFloat(bytes, 2).size(), 1u);
  EXPECT_TRUE(SampleFormatCodec::bytesToFloat(nullptr, 0, 2).empty());
}
