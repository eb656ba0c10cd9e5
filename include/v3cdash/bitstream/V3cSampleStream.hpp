// Repository: V3CDash
// Component: V3C Sample Stream
// Purpose: Parse and serialize V3C sample-stream containers (ISO/IEC 23090-5
//          Annex C framing). Unit payloads are opaque; only the 4-byte unit
//          header type field is interpreted.
// Copyright (c) 2025 V3CDash Contributors

#ifndef V3CDASH_BITSTREAM_V3C_SAMPLE_STREAM_HPP_
#define V3CDASH_BITSTREAM_V3C_SAMPLE_STREAM_HPP_

#include <cstdint>
#include <string>
#include <vector>

namespace v3cdash::bitstream {

enum class V3cUnitType : uint8_t {
  kVps = 0,  // V3C parameter set
  kAd = 1,   // atlas data
  kOvd = 2,  // occupancy video data
  kGvd = 3,  // geometry video data
  kAvd = 4,  // attribute video data
  kPvd = 5,  // packed video data
  kCad = 6,  // common atlas data
};

const char* V3cUnitTypeToString(V3cUnitType type);

// Parameter units go to the init segment.
inline bool IsParameterUnit(V3cUnitType type) {
  return type == V3cUnitType::kVps || type == V3cUnitType::kCad;
}

inline constexpr size_t kV3cUnitHeaderBytes = 4;

struct V3cUnit {
  V3cUnitType type = V3cUnitType::kVps;
  std::vector<uint8_t> bytes;  // header + payload, exactly as framed
};

struct SampleStream {
  int precision_bytes = 0;  // unit_size_precision_bytes as read from the header
  std::vector<V3cUnit> units;
};

struct ParseResult {
  bool ok;
  std::string error;

  static ParseResult Success() { return {true, ""}; }
  static ParseResult Failure(const std::string& error) { return {false, error}; }
};

// Parses a complete sample stream. On failure *out is left partially filled.
ParseResult ParseSampleStream(const std::vector<uint8_t>& data, SampleStream* out);

// Reads and parses a file.
ParseResult ReadSampleStreamFile(const std::string& path, SampleStream* out);

// Smallest precision (1..8 bytes) able to express every unit size.
int MinimalPrecisionBytes(const std::vector<V3cUnit>& units);

// Regenerates framing with MinimalPrecisionBytes(units).
std::vector<uint8_t> SerializeSampleStream(const std::vector<V3cUnit>& units);

// Whole-file helpers. Return false and fill *error on I/O failure.
bool ReadFileBytes(const std::string& path, std::vector<uint8_t>* out, std::string* error);
bool WriteFileBytes(const std::string& path, const std::vector<uint8_t>& data,
                    std::string* error);

}  // namespace v3cdash::bitstream

#endif  // V3CDASH_BITSTREAM_V3C_SAMPLE_STREAM_HPP_
