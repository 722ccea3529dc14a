#include "lendcore/events/event_journal.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <span>
#include <stdexcept>
#include <string>
#include <system_error>

#include <unistd.h>

namespace lendcore {
namespace events {

namespace {
constexpr std::uint32_t kMagic = 0x4c434556;  // 'LCEV'
constexpr std::uint16_t kVersion = 1;
constexpr std::size_t kHeaderSize = 16;
// sequence, timestamp, account, counterparty, amount, seized: 8 bytes each;
// asset, collateral_asset, collateral_factor, supply_rate, borrow_rate: 4 bytes each
constexpr std::size_t kPayloadSize = 6 * 8 + 5 * 4;

std::uint32_t checksum32(std::span<const std::byte> data) noexcept {
  constexpr std::uint32_t kFnvPrime = 16777619u;
  std::uint32_t hash = 2166136261u;
  for (const auto& b : data) {
    hash ^= static_cast<std::uint8_t>(b);
    hash *= kFnvPrime;
  }
  return hash;
}

template <typename T>
void put_le(std::byte*& cursor, T value) {
  const auto raw = static_cast<std::uint64_t>(value);
  for (std::size_t i = 0; i < sizeof(T); ++i) {
    *cursor++ = static_cast<std::byte>((raw >> (8 * i)) & 0xff);
  }
}

template <typename T>
T get_le(const std::byte*& cursor) {
  std::uint64_t raw = 0;
  for (std::size_t i = 0; i < sizeof(T); ++i) {
    raw |= static_cast<std::uint64_t>(std::to_integer<std::uint8_t>(*cursor++)) << (8 * i);
  }
  return static_cast<T>(raw);
}

std::array<std::byte, kPayloadSize> encode_payload(const Notification& n) {
  std::array<std::byte, kPayloadSize> payload{};
  std::byte* cursor = payload.data();
  put_le(cursor, n.sequence);
  put_le(cursor, n.timestamp);
  put_le(cursor, n.account);
  put_le(cursor, n.counterparty);
  put_le(cursor, n.amount);
  put_le(cursor, n.seized);
  put_le(cursor, n.asset);
  put_le(cursor, n.collateral_asset);
  put_le(cursor, n.collateral_factor);
  put_le(cursor, n.supply_rate);
  put_le(cursor, n.borrow_rate);
  return payload;
}

Notification decode_payload(EventKind kind, const std::array<std::byte, kPayloadSize>& payload) {
  Notification n;
  n.kind = kind;
  const std::byte* cursor = payload.data();
  n.sequence = get_le<std::uint64_t>(cursor);
  n.timestamp = get_le<common::TimestampSec>(cursor);
  n.account = get_le<common::AccountId>(cursor);
  n.counterparty = get_le<common::AccountId>(cursor);
  n.amount = get_le<common::Amount>(cursor);
  n.seized = get_le<common::Amount>(cursor);
  n.asset = get_le<common::AssetId>(cursor);
  n.collateral_asset = get_le<common::AssetId>(cursor);
  n.collateral_factor = get_le<common::BasisPoints>(cursor);
  n.supply_rate = get_le<common::BasisPoints>(cursor);
  n.borrow_rate = get_le<common::BasisPoints>(cursor);
  return n;
}

}  // namespace

JournalWriter::JournalWriter(const std::filesystem::path& path, std::size_t flush_threshold_bytes)
    : buffer_(), flush_threshold_(flush_threshold_bytes) {
  buffer_.reserve(flush_threshold_bytes);
  // A bare file name has no parent to create.
  if (const auto parent = path.parent_path(); !parent.empty()) {
    std::filesystem::create_directories(parent);
  }
  file_ = std::fopen(path.c_str(), "ab");
  if (!file_) {
    throw std::runtime_error("failed to open event journal: " + path.string());
  }
}

JournalWriter::~JournalWriter() {
  if (file_) {
    // Best effort: a destructor cannot report a failed final write.
    if (!buffer_.empty()) {
      std::fwrite(buffer_.data(), 1, buffer_.size(), file_);
    }
    std::fclose(file_);
    file_ = nullptr;
  }
}

void JournalWriter::append(const Notification& notification) {
  if (!file_) {
    throw std::runtime_error("event journal not open");
  }

  const auto payload = encode_payload(notification);

  std::array<std::byte, kHeaderSize> header{};
  std::byte* cursor = header.data();
  put_le(cursor, kMagic);
  put_le(cursor, kVersion);
  put_le(cursor, static_cast<std::uint16_t>(notification.kind));
  put_le(cursor, static_cast<std::uint32_t>(payload.size()));
  put_le(cursor, checksum32(payload));

  buffer_.insert(buffer_.end(), header.begin(), header.end());
  buffer_.insert(buffer_.end(), payload.begin(), payload.end());
  ++records_written_;

  if (buffer_.size() >= flush_threshold_) {
    flush();
  }
}

void JournalWriter::flush() {
  if (!file_ || buffer_.empty()) {
    return;
  }

  const auto wrote = std::fwrite(buffer_.data(), 1, buffer_.size(), file_);
  if (wrote != buffer_.size()) {
    throw std::runtime_error("failed to write event journal buffer");
  }
  buffer_.clear();
  if (std::fflush(file_) != 0) {
    throw std::system_error(errno, std::system_category(), "fflush failed");
  }
}

void JournalWriter::sync() {
  flush();
  if (!file_) {
    return;
  }
  if (::fsync(fileno(file_)) != 0) {
    throw std::system_error(errno, std::system_category(), "fsync failed");
  }
}

JournalReader::JournalReader(const std::filesystem::path& path)
    : path_(path) {
  file_ = std::fopen(path.c_str(), "rb");
  if (!file_) {
    throw std::runtime_error("failed to open event journal for read: " + path.string());
  }
}

JournalReader::~JournalReader() {
  if (file_) {
    std::fclose(file_);
    file_ = nullptr;
  }
}

bool JournalReader::next(Notification& out_notification) {
  if (!file_) {
    return false;
  }

  std::array<std::byte, kHeaderSize> raw_header{};
  const auto read_header = std::fread(raw_header.data(), 1, raw_header.size(), file_);
  if (read_header == 0) {
    return false;
  }
  if (read_header != raw_header.size()) {
    throw std::runtime_error("truncated event journal header in " + path_.string());
  }

  const std::byte* cursor = raw_header.data();
  JournalRecordHeader header;
  header.magic = get_le<std::uint32_t>(cursor);
  header.version = get_le<std::uint16_t>(cursor);
  header.kind = get_le<std::uint16_t>(cursor);
  header.payload_size = get_le<std::uint32_t>(cursor);
  header.checksum = get_le<std::uint32_t>(cursor);

  if (header.magic != kMagic) {
    throw std::runtime_error("invalid event journal magic");
  }
  if (header.version != kVersion) {
    throw std::runtime_error("unsupported event journal version " + std::to_string(header.version));
  }
  if (header.payload_size != kPayloadSize) {
    throw std::runtime_error("unexpected event journal payload size " + std::to_string(header.payload_size));
  }
  if (!is_known_kind(header.kind)) {
    throw std::runtime_error("unknown event kind " + std::to_string(header.kind));
  }

  std::array<std::byte, kPayloadSize> payload{};
  if (std::fread(payload.data(), 1, payload.size(), file_) != payload.size()) {
    throw std::runtime_error("truncated event journal record");
  }
  if (header.checksum != checksum32(payload)) {
    throw std::runtime_error("event journal checksum mismatch");
  }

  out_notification = decode_payload(static_cast<EventKind>(header.kind), payload);
  return true;
}

}  // namespace events
}  // namespace lendcore
