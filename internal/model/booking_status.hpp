#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace slotkeeper::model {

enum class BookingStatus : std::uint8_t {
  kActive = 1,
  kCancelled = 2,
};

constexpr std::string_view ToString(BookingStatus status) {
  switch (status) {
    case BookingStatus::kActive:
      return "active";
    case BookingStatus::kCancelled:
    default:
      return "cancelled";
  }
}

constexpr std::optional<BookingStatus> BookingStatusFromString(std::string_view value) {
  if (value == "active") {
    return BookingStatus::kActive;
  }
  if (value == "cancelled") {
    return BookingStatus::kCancelled;
  }
  return std::nullopt;
}

} // namespace slotkeeper::model
