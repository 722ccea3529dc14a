#pragma once

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <vector>

#include "lendcore/events/notification.hpp"

namespace lendcore {
namespace events {

// On-disk record: [header:16][payload:kPayloadSize], all fields little-endian.
// header = magic:4 version:2 kind:2 payload_size:4 checksum:4
struct JournalRecordHeader {
  std::uint32_t magic{0x4c434556};  // 'LCEV'
  std::uint16_t version{1};
  std::uint16_t kind{0};
  std::uint32_t payload_size{0};
  std::uint32_t checksum{0};
};

class JournalWriter {
 public:
  // Creates missing parent directories. Throws std::runtime_error (including
  // std::filesystem::filesystem_error) when the journal cannot be opened.
  explicit JournalWriter(const std::filesystem::path& path,
                         std::size_t flush_threshold_bytes = 1 << 16);
  JournalWriter(const JournalWriter&) = delete;
  JournalWriter& operator=(const JournalWriter&) = delete;
  JournalWriter(JournalWriter&&) = delete;
  JournalWriter& operator=(JournalWriter&&) = delete;
  ~JournalWriter();

  void append(const Notification& notification);
  void flush();
  void sync();
  [[nodiscard]] std::uint64_t records_written() const noexcept { return records_written_; }

 private:
  std::FILE* file_{nullptr};
  std::vector<std::byte> buffer_{};
  std::size_t flush_threshold_;
  std::uint64_t records_written_{0};
};

class JournalReader {
 public:
  explicit JournalReader(const std::filesystem::path& path);
  JournalReader(const JournalReader&) = delete;
  JournalReader& operator=(const JournalReader&) = delete;
  JournalReader(JournalReader&&) = delete;
  JournalReader& operator=(JournalReader&&) = delete;
  ~JournalReader();

  // Returns false at a clean end of file; throws on a torn or corrupt record.
  bool next(Notification& out_notification);

 private:
  std::FILE* file_{nullptr};
  std::filesystem::path path_{};
};

}  // namespace events
}  // namespace lendcore
