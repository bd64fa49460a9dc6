// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * io_npz.cpp
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#include "geomancy/io/npz.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <array>
#include <cstring>
#include <fstream>
#include <optional>
#include <vector>

namespace geomancy {
namespace io {

namespace detail {

constexpr int kMetadataVersion = 1;
constexpr const char* kElevationEntry = "elevation.npy";
constexpr const char* kMetaEntry = "meta.npy";

// ─── CRC32 ──────────────────────────────────────────────────────────────────

constexpr std::array<uint32_t, 256> buildCrc32Table() {
  std::array<uint32_t, 256> table{};
  for (uint32_t i = 0; i < 256; ++i) {
    uint32_t c = i;
    for (int j = 0; j < 8; ++j) {
      c = (c & 1) ? (0xEDB88320u ^ (c >> 1)) : (c >> 1);
    }
    table[i] = c;
  }
  return table;
}

static constexpr auto crc32Table = buildCrc32Table();

uint32_t crc32(const std::vector<char>& buf) {
  uint32_t crc = 0xFFFFFFFFu;
  for (char ch : buf) {
    crc = crc32Table[(crc ^ static_cast<uint8_t>(ch)) & 0xFF] ^ (crc >> 8);
  }
  return crc ^ 0xFFFFFFFFu;
}

// ─── Little-endian helpers ──────────────────────────────────────────────────

template <typename T>
void writeLE(std::ostream& os, T v) {
  for (size_t i = 0; i < sizeof(T); ++i) {
    os.put(static_cast<char>((v >> (8 * i)) & 0xFF));
  }
}

template <typename T>
T readLE(std::istream& is) {
  uint8_t b[sizeof(T)] = {};
  is.read(reinterpret_cast<char*>(b), sizeof(T));
  T v = 0;
  for (size_t i = 0; i < sizeof(T); ++i) v |= static_cast<T>(b[i]) << (8 * i);
  return v;
}

// ─── ZIP (STORE) records ────────────────────────────────────────────────────

struct ZipEntry {
  std::string name;
  uint32_t crc = 0;
  uint32_t size = 0;
  uint32_t offset = 0;  // local header position
};

// Local and central headers share the body after their leading fields
void writeEntryHeader(std::ostream& os, const ZipEntry& e, bool central) {
  writeLE<uint32_t>(os, central ? 0x02014b50 : 0x04034b50);
  if (central) writeLE<uint16_t>(os, 20);  // version made by
  writeLE<uint16_t>(os, 20);               // version needed
  writeLE<uint16_t>(os, 0);                // flags
  writeLE<uint16_t>(os, 0);                // STORE
  writeLE<uint32_t>(os, 0);                // mod time + date
  writeLE<uint32_t>(os, e.crc);
  writeLE<uint32_t>(os, e.size);           // compressed
  writeLE<uint32_t>(os, e.size);           // uncompressed
  writeLE<uint16_t>(os, static_cast<uint16_t>(e.name.size()));
  writeLE<uint16_t>(os, 0);                // extra length
  if (central) {
    writeLE<uint16_t>(os, 0);  // comment length
    writeLE<uint16_t>(os, 0);  // disk number
    writeLE<uint16_t>(os, 0);  // internal attrs
    writeLE<uint32_t>(os, 0);  // external attrs
    writeLE<uint32_t>(os, e.offset);
  }
  os.write(e.name.data(), e.name.size());
}

void writeEndOfCentralDir(std::ostream& os, uint16_t count, uint32_t cd_size,
                          uint32_t cd_offset) {
  writeLE<uint32_t>(os, 0x06054b50);
  writeLE<uint32_t>(os, 0);  // disk numbers
  writeLE<uint16_t>(os, count);
  writeLE<uint16_t>(os, count);
  writeLE<uint32_t>(os, cd_size);
  writeLE<uint32_t>(os, cd_offset);
  writeLE<uint16_t>(os, 0);  // comment length
}

// ─── NumPy .npy format ──────────────────────────────────────────────────────

std::vector<char> buildNpy(const std::string& descr, bool fortran_order,
                           const std::string& shape, const char* payload,
                           size_t bytes) {
  std::string header = fmt::format(
      "{{'descr': '{}', 'fortran_order': {}, 'shape': {}, }}", descr,
      fortran_order ? "True" : "False", shape);

  // magic (6) + version (2) + header length (2), padded to 64 bytes
  constexpr size_t kPrefix = 10;
  const size_t padding = (64 - (kPrefix + header.size() + 1) % 64) % 64;
  header.append(padding, ' ');
  header.push_back('\n');
  const auto header_len = static_cast<uint16_t>(header.size());

  std::vector<char> buf = {'\x93', 'N', 'U', 'M', 'P', 'Y', '\x01', '\x00'};
  buf.reserve(kPrefix + header_len + bytes);
  buf.push_back(static_cast<char>(header_len & 0xFF));
  buf.push_back(static_cast<char>((header_len >> 8) & 0xFF));
  buf.insert(buf.end(), header.begin(), header.end());
  buf.insert(buf.end(), payload, payload + bytes);
  return buf;
}

struct NpyInfo {
  bool is_float_array = false;  // '<f4' with shape (r, c)
  bool fortran_order = false;
  bool is_string = false;       // '|S<n>' with shape ()
  int rows = 0;
  int cols = 0;
  size_t string_len = 0;
  size_t data_offset = 0;
};

std::optional<NpyInfo> parseNpyHeader(const std::vector<char>& buf) {
  static const char kMagic[] = {'\x93', 'N', 'U', 'M', 'P', 'Y'};
  if (buf.size() < 10 || std::memcmp(buf.data(), kMagic, 6) != 0) {
    return std::nullopt;
  }
  const uint16_t header_len =
      static_cast<uint8_t>(buf[8]) |
      (static_cast<uint16_t>(static_cast<uint8_t>(buf[9])) << 8);
  NpyInfo info;
  info.data_offset = 10 + header_len;
  if (info.data_offset > buf.size()) return std::nullopt;
  const std::string dict(buf.data() + 10, header_len);

  try {
    if (dict.find("'<f4'") != std::string::npos) {
      info.is_float_array = true;
      info.fortran_order = dict.find("'fortran_order': True") != std::string::npos;
      const auto open = dict.find('(', dict.find("'shape'"));
      const auto close = dict.find(')', open);
      if (open == std::string::npos || close == std::string::npos) {
        return std::nullopt;
      }
      const std::string shape = dict.substr(open + 1, close - open - 1);
      const auto comma = shape.find(',');
      if (comma == std::string::npos) return std::nullopt;
      info.rows = std::stoi(shape.substr(0, comma));
      info.cols = std::stoi(shape.substr(comma + 1));
    } else if (const auto s = dict.find("'|S"); s != std::string::npos) {
      info.is_string = true;
      info.string_len = std::stoul(dict.substr(s + 3));
    } else {
      return std::nullopt;
    }
  } catch (const std::exception&) {
    return std::nullopt;
  }
  return info;
}

// ─── Metadata ───────────────────────────────────────────────────────────────

std::string buildMetadataJson(const DemRaster& dem) {
  return fmt::format(
      "{{\"version\": {}, \"resolution\": {:.17g}, \"origin\": [{:.17g}, "
      "{:.17g}], \"size\": [{}, {}]}}",
      kMetadataVersion, dem.resolution(), dem.origin().x(), dem.origin().y(),
      dem.rows(), dem.cols());
}

// Numbers after "key": either a scalar or a [a, b, ...] list.
std::vector<double> jsonNumbers(const std::string& json,
                                const std::string& key) {
  std::vector<double> out;
  auto pos = json.find("\"" + key + "\"");
  if (pos == std::string::npos) return out;
  pos = json.find(':', pos);
  if (pos == std::string::npos) return out;
  ++pos;
  while (pos < json.size() && json[pos] == ' ') ++pos;
  const bool list = pos < json.size() && json[pos] == '[';
  const auto end = list ? json.find(']', pos) : json.find_first_of(",}", pos);
  if (end == std::string::npos) return out;
  std::string body = json.substr(list ? pos + 1 : pos, end - (list ? pos + 1 : pos));
  size_t start = 0;
  try {
    while (start < body.size()) {
      auto comma = body.find(',', start);
      if (comma == std::string::npos) comma = body.size();
      out.push_back(std::stod(body.substr(start, comma - start)));
      start = comma + 1;
    }
  } catch (const std::exception&) {
    out.clear();
  }
  return out;
}

}  // namespace detail

// ─── Save ───────────────────────────────────────────────────────────────────

bool saveNpz(const std::string& filename, const DemRaster& dem) {
  std::ofstream fs(filename, std::ios::binary);
  if (!fs.is_open()) {
    spdlog::error("[npz_io] Cannot create {}", filename);
    return false;
  }

  std::vector<detail::ZipEntry> entries;
  auto addEntry = [&](const std::string& name, const std::vector<char>& npy) {
    detail::ZipEntry e;
    e.name = name;
    e.crc = detail::crc32(npy);
    e.size = static_cast<uint32_t>(npy.size());
    e.offset = static_cast<uint32_t>(fs.tellp());
    detail::writeEntryHeader(fs, e, false);
    fs.write(npy.data(), npy.size());
    entries.push_back(std::move(e));
  };

  // Eigen::MatrixXf is column-major = Fortran order
  const auto& m = dem.data();
  addEntry(detail::kElevationEntry,
           detail::buildNpy("<f4", true,
                            fmt::format("({}, {})", m.rows(), m.cols()),
                            reinterpret_cast<const char*>(m.data()),
                            static_cast<size_t>(m.size()) * sizeof(float)));

  const std::string meta = detail::buildMetadataJson(dem);
  addEntry(detail::kMetaEntry,
           detail::buildNpy(fmt::format("|S{}", meta.size()), false, "()",
                            meta.data(), meta.size()));

  const auto cd_offset = static_cast<uint32_t>(fs.tellp());
  for (const auto& e : entries) detail::writeEntryHeader(fs, e, true);
  const auto cd_size = static_cast<uint32_t>(fs.tellp()) - cd_offset;
  detail::writeEndOfCentralDir(fs, static_cast<uint16_t>(entries.size()),
                               cd_size, cd_offset);

  if (fs.fail()) {
    spdlog::error("[npz_io] Write failed for {}", filename);
    return false;
  }
  return true;
}

// ─── Load ───────────────────────────────────────────────────────────────────

bool loadNpz(const std::string& filename, DemRaster& dem) {
  std::ifstream fs(filename, std::ios::binary);
  if (!fs.is_open()) {
    spdlog::error("[npz_io] Cannot open {}", filename);
    return false;
  }

  constexpr uint32_t kLocalSig = 0x04034b50;
  constexpr size_t kMaxEntries = 64;
  constexpr uint32_t kMaxEntrySize = 400'000'000;  // 400MB

  std::vector<char> elevation;
  std::vector<char> meta;
  for (size_t n = 0; n < kMaxEntries; ++n) {
    const auto sig = detail::readLE<uint32_t>(fs);
    if (fs.fail() || sig != kLocalSig) break;

    fs.ignore(14);  // version, flags, method, time, date, crc
    detail::readLE<uint32_t>(fs);  // compressed size == uncompressed (STORE)
    const auto size = detail::readLE<uint32_t>(fs);
    const auto name_len = detail::readLE<uint16_t>(fs);
    const auto extra_len = detail::readLE<uint16_t>(fs);
    if (fs.fail()) break;
    if (name_len > 4096 || size > kMaxEntrySize) {
      spdlog::error("[npz_io] Invalid entry (name_len={}, size={})", name_len,
                    size);
      return false;
    }

    std::string name(name_len, '\0');
    fs.read(&name[0], name_len);
    fs.ignore(extra_len);
    std::vector<char> data(size);
    fs.read(data.data(), size);
    if (fs.fail()) {
      spdlog::error("[npz_io] Truncated data for entry '{}'", name);
      return false;
    }

    if (name == detail::kElevationEntry) {
      elevation = std::move(data);
    } else if (name == detail::kMetaEntry) {
      meta = std::move(data);
    } else {
      spdlog::debug("[npz_io] Ignoring entry '{}'", name);
    }
  }

  if (meta.empty() || elevation.empty()) {
    spdlog::error("[npz_io] {} lacks {} or {}", filename, detail::kMetaEntry,
                  detail::kElevationEntry);
    return false;
  }

  const auto meta_info = detail::parseNpyHeader(meta);
  if (!meta_info || !meta_info->is_string ||
      meta_info->data_offset + meta_info->string_len > meta.size()) {
    spdlog::error("[npz_io] Invalid meta.npy");
    return false;
  }
  const std::string json(meta.data() + meta_info->data_offset,
                         meta_info->string_len);

  const auto version = detail::jsonNumbers(json, "version");
  if (!version.empty() &&
      static_cast<int>(version[0]) > detail::kMetadataVersion) {
    spdlog::error("[npz_io] Unsupported metadata version {} (max {})",
                  static_cast<int>(version[0]), detail::kMetadataVersion);
    return false;
  }
  const auto resolution = detail::jsonNumbers(json, "resolution");
  const auto origin = detail::jsonNumbers(json, "origin");
  const auto size = detail::jsonNumbers(json, "size");
  if (resolution.size() != 1 || origin.size() != 2 || size.size() != 2) {
    spdlog::error("[npz_io] Incomplete metadata in {}", filename);
    return false;
  }
  const int rows = static_cast<int>(size[0]);
  const int cols = static_cast<int>(size[1]);
  if (rows <= 0 || cols <= 0 || resolution[0] <= 0.0) {
    spdlog::error("[npz_io] Invalid raster dimensions ({}x{}, res={})", rows,
                  cols, resolution[0]);
    return false;
  }

  const auto info = detail::parseNpyHeader(elevation);
  if (!info || !info->is_float_array || info->rows != rows ||
      info->cols != cols) {
    spdlog::error("[npz_io] elevation.npy does not match metadata");
    return false;
  }
  const size_t bytes = static_cast<size_t>(rows) * cols * sizeof(float);
  if (info->data_offset + bytes > elevation.size()) {
    spdlog::error("[npz_io] Truncated elevation data");
    return false;
  }

  Eigen::MatrixXf matrix(rows, cols);
  if (info->fortran_order) {
    std::memcpy(matrix.data(), elevation.data() + info->data_offset, bytes);
  } else {
    Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor> rm(
        rows, cols);
    std::memcpy(rm.data(), elevation.data() + info->data_offset, bytes);
    matrix = rm;
  }
  dem = DemRaster(std::move(matrix), resolution[0],
                  Point2(origin[0], origin[1]));
  return true;
}

}  // namespace io
}  // namespace geomancy
