// Repository: V3CDash
// Component: V3C Sample Stream Implementation
// Copyright (c) 2025 V3CDash Contributors

#include "v3cdash/bitstream/V3cSampleStream.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>
#include <sstream>

namespace v3cdash::bitstream {

const char* V3cUnitTypeToString(V3cUnitType type) {
  switch (type) {
    case V3cUnitType::kVps:
      return "VPS";
    case V3cUnitType::kAd:
      return "AD";
    case V3cUnitType::kOvd:
      return "OVD";
    case V3cUnitType::kGvd:
      return "GVD";
    case V3cUnitType::kAvd:
      return "AVD";
    case V3cUnitType::kPvd:
      return "PVD";
    case V3cUnitType::kCad:
      return "CAD";
  }
  return "RESERVED";
}

ParseResult ParseSampleStream(const std::vector<uint8_t>& data, SampleStream* out) {
  out->units.clear();
  if (data.empty()) {
    return ParseResult::Failure("empty container");
  }

  // ssnh_unit_size_precision_bytes_minus1: u(3), then 5 reserved bits.
  const int precision = (data[0] >> 5) + 1;
  out->precision_bytes = precision;

  size_t pos = 1;
  while (pos < data.size()) {
    if (data.size() - pos < static_cast<size_t>(precision)) {
      std::ostringstream oss;
      oss << "truncated unit size field at offset " << pos;
      return ParseResult::Failure(oss.str());
    }
    uint64_t size = 0;
    for (int i = 0; i < precision; ++i) {
      size = (size << 8) | data[pos + i];
    }
    pos += precision;

    if (size == 0) {
      std::ostringstream oss;
      oss << "zero-length unit at offset " << pos;
      return ParseResult::Failure(oss.str());
    }
    if (size < kV3cUnitHeaderBytes) {
      std::ostringstream oss;
      oss << "unit at offset " << pos << " is " << size << " bytes, shorter than its "
          << kV3cUnitHeaderBytes << "-byte header";
      return ParseResult::Failure(oss.str());
    }
    if (size > data.size() - pos) {
      std::ostringstream oss;
      oss << "unit at offset " << pos << " declares " << size << " bytes, "
          << (data.size() - pos) << " remain";
      return ParseResult::Failure(oss.str());
    }

    const uint8_t raw_type = data[pos] >> 3;
    if (raw_type > static_cast<uint8_t>(V3cUnitType::kCad)) {
      std::ostringstream oss;
      oss << "reserved unit type " << static_cast<int>(raw_type) << " at offset " << pos;
      return ParseResult::Failure(oss.str());
    }

    V3cUnit unit;
    unit.type = static_cast<V3cUnitType>(raw_type);
    unit.bytes.assign(data.begin() + pos, data.begin() + pos + size);
    out->units.push_back(std::move(unit));
    pos += size;
  }

  if (out->units.empty()) {
    return ParseResult::Failure("container holds no units");
  }
  return ParseResult::Success();
}

ParseResult ReadSampleStreamFile(const std::string& path, SampleStream* out) {
  std::vector<uint8_t> data;
  std::string error;
  if (!ReadFileBytes(path, &data, &error)) {
    return ParseResult::Failure(error);
  }
  return ParseSampleStream(data, out);
}

int MinimalPrecisionBytes(const std::vector<V3cUnit>& units) {
  uint64_t largest = 0;
  for (const auto& unit : units) {
    if (unit.bytes.size() > largest) largest = unit.bytes.size();
  }
  int precision = 1;
  while (precision < 8 && (largest >> (8 * precision)) != 0) {
    ++precision;
  }
  return precision;
}

std::vector<uint8_t> SerializeSampleStream(const std::vector<V3cUnit>& units) {
  const int precision = MinimalPrecisionBytes(units);

  size_t total = 1;
  for (const auto& unit : units) total += precision + unit.bytes.size();

  std::vector<uint8_t> out;
  out.reserve(total);
  out.push_back(static_cast<uint8_t>((precision - 1) << 5));
  for (const auto& unit : units) {
    const uint64_t size = unit.bytes.size();
    for (int i = precision - 1; i >= 0; --i) {
      out.push_back(static_cast<uint8_t>((size >> (8 * i)) & 0xFF));
    }
    out.insert(out.end(), unit.bytes.begin(), unit.bytes.end());
  }
  return out;
}

bool ReadFileBytes(const std::string& path, std::vector<uint8_t>* out, std::string* error) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    *error = "cannot open " + path + ": " + std::strerror(errno);
    return false;
  }
  out->assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  if (in.bad()) {
    *error = "read error on " + path;
    return false;
  }
  return true;
}

bool WriteFileBytes(const std::string& path, const std::vector<uint8_t>& data,
                    std::string* error) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    *error = "cannot create " + path + ": " + std::strerror(errno);
    return false;
  }
  out.write(reinterpret_cast<const char*>(data.data()),
            static_cast<std::streamsize>(data.size()));
  out.flush();
  if (!out) {
    *error = "write error on " + path;
    return false;
  }
  return true;
}

}  // namespace v3cdash::bitstream
