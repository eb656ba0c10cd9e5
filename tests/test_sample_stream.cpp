// Repository: V3CDash
// Component: V3C sample stream unit tests
// Copyright (c) 2025 V3CDash Contributors

#include <gtest/gtest.h>

#include <vector>

#include "SyntheticContainer.hpp"
#include "v3cdash/bitstream/V3cSampleStream.hpp"

namespace v3cdash::bitstream {
namespace {

using test::MakeUnit;

TEST(V3cSampleStreamTest, ParsesUnitsInContainerOrder) {
  test::SyntheticContainerSpec spec;
  spec.gof_count = 2;
  const auto bytes = test::MakeContainerBytes(spec);

  SampleStream stream;
  auto result = ParseSampleStream(bytes, &stream);
  ASSERT_TRUE(result.ok) << result.error;
  EXPECT_EQ(stream.precision_bytes, 1);

  const std::vector<V3cUnitType> expected = {
      V3cUnitType::kVps, V3cUnitType::kCad, V3cUnitType::kAd,  V3cUnitType::kOvd,
      V3cUnitType::kGvd, V3cUnitType::kAvd, V3cUnitType::kAd,  V3cUnitType::kOvd,
      V3cUnitType::kGvd, V3cUnitType::kAvd};
  ASSERT_EQ(stream.units.size(), expected.size());
  for (size_t i = 0; i < expected.size(); ++i) {
    EXPECT_EQ(stream.units[i].type, expected[i]) << "unit " << i;
  }
  EXPECT_EQ(stream.units[0].bytes, test::MakeContainerUnits(spec)[0].bytes);
}

TEST(V3cSampleStreamTest, SerializeRegeneratesIdenticalFraming) {
  const auto bytes = test::MakeContainerBytes(test::SyntheticContainerSpec{});
  SampleStream stream;
  ASSERT_TRUE(ParseSampleStream(bytes, &stream).ok);
  EXPECT_EQ(SerializeSampleStream(stream.units), bytes);
}

TEST(V3cSampleStreamTest, PrecisionCoversLargestUnit) {
  std::vector<V3cUnit> units = {MakeUnit(V3cUnitType::kVps, 1, 8),
                                MakeUnit(V3cUnitType::kAd, 2, 300)};
  EXPECT_EQ(MinimalPrecisionBytes(units), 2);

  const auto bytes = SerializeSampleStream(units);
  EXPECT_EQ(bytes[0], 0x20);  // precision_minus1 = 1 in bits 7..5

  SampleStream stream;
  ASSERT_TRUE(ParseSampleStream(bytes, &stream).ok);
  EXPECT_EQ(stream.precision_bytes, 2);
  ASSERT_EQ(stream.units.size(), 2u);
  EXPECT_EQ(stream.units[1].bytes.size(), 304u);
}

TEST(V3cSampleStreamTest, RejectsEmptyContainer) {
  SampleStream stream;
  EXPECT_FALSE(ParseSampleStream({}, &stream).ok);
}

TEST(V3cSampleStreamTest, RejectsHeaderWithoutUnits) {
  SampleStream stream;
  EXPECT_FALSE(ParseSampleStream({0x00}, &stream).ok);
}

TEST(V3cSampleStreamTest, RejectsTruncatedSizeField) {
  SampleStream stream;
  // Precision 2, one size byte left.
  EXPECT_FALSE(ParseSampleStream({0x20, 0x00}, &stream).ok);
}

TEST(V3cSampleStreamTest, RejectsZeroLengthUnit) {
  SampleStream stream;
  EXPECT_FALSE(ParseSampleStream({0x00, 0x00}, &stream).ok);
}

TEST(V3cSampleStreamTest, RejectsUnitShorterThanHeader) {
  SampleStream stream;
  auto result = ParseSampleStream({0x00, 0x03, 1 << 3, 0x00, 0x00}, &stream);
  EXPECT_FALSE(result.ok);
  EXPECT_NE(result.error.find("shorter than its 4-byte header"), std::string::npos)
      << result.error;
  EXPECT_TRUE(ParseSampleStream({0x00, 0x04, 1 << 3, 0x00, 0x00, 0x00}, &stream).ok);
}

TEST(V3cSampleStreamTest, RejectsUnitOverrunningFile) {
  SampleStream stream;
  auto result = ParseSampleStream({0x00, 0x08, 0x08, 0x00, 0x00}, &stream);
  EXPECT_FALSE(result.ok);
  EXPECT_NE(result.error.find("declares 8 bytes"), std::string::npos) << result.error;
}

TEST(V3cSampleStreamTest, RejectsReservedUnitType) {
  SampleStream stream;
  auto result = ParseSampleStream({0x00, 0x04, 7 << 3, 0x00, 0x00, 0x00}, &stream);
  EXPECT_FALSE(result.ok);
  EXPECT_NE(result.error.find("reserved unit type 7"), std::string::npos) << result.error;
}

TEST(V3cSampleStreamTest, ParameterUnitClassification) {
  EXPECT_TRUE(IsParameterUnit(V3cUnitType::kVps));
  EXPECT_TRUE(IsParameterUnit(V3cUnitType::kCad));
  EXPECT_FALSE(IsParameterUnit(V3cUnitType::kAd));
  EXPECT_FALSE(IsParameterUnit(V3cUnitType::kPvd));
}

}  // namespace
}  // namespace v3cdash::bitstream
