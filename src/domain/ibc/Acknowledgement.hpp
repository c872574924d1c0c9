#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace shielded::recv::domain::ibc
{

// Non-empty acknowledgement payload text.
class StatusValue
{
 public:
  // Throws std::invalid_argument when empty.
  explicit StatusValue(std::string v);

  const std::string& as_str() const noexcept { return v_; }

  friend bool operator==(const StatusValue& a, const StatusValue& b) { return a.v_ == b.v_; }

 private:
  std::string v_;
};

class Acknowledgement;

// ICS-04 acknowledgement envelope: {"result": ...} or {"error": ...}.
class AcknowledgementStatus
{
 public:
  static AcknowledgementStatus success(StatusValue v) { return {true, std::move(v)}; }
  static AcknowledgementStatus error(StatusValue v) { return {false, std::move(v)}; }

  // ICS-20 success value, base64 of 0x01.
  static AcknowledgementStatus ics20_success() { return success(StatusValue{"AQ=="}); }

  // nullopt when the bytes are not an acknowledgement envelope.
  static std::optional<AcknowledgementStatus> decode(const Acknowledgement& ack);

  bool is_successful() const noexcept { return success_; }
  const StatusValue& value() const noexcept { return value_; }

  Acknowledgement to_acknowledgement() const;

 private:
  AcknowledgementStatus(bool success, StatusValue v) : success_(success), value_(std::move(v)) {}

  bool success_;
  StatusValue value_;
};

// Opaque acknowledgement bytes committed by the protocol engine.
class Acknowledgement
{
 public:
  // Throws std::invalid_argument when empty.
  explicit Acknowledgement(std::vector<std::uint8_t> bytes);

  // Implicit: a status can be returned wherever an acknowledgement is expected.
  Acknowledgement(const AcknowledgementStatus& status)  // NOLINT(google-explicit-constructor)
      : Acknowledgement(status.to_acknowledgement())
  {
  }

  const std::vector<std::uint8_t>& bytes() const noexcept { return bytes_; }
  std::string_view as_string() const noexcept
  {
    return {reinterpret_cast<const char*>(bytes_.data()), bytes_.size()};
  }

  bool is_success() const;

  friend bool operator==(const Acknowledgement& a, const Acknowledgement& b)
  {
    return a.bytes_ == b.bytes_;
  }

 private:
  std::vector<std::uint8_t> bytes_;
};

}  // namespace shielded::recv::domain::ibc
