#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace eventlog::notify {

inline constexpr char kPayloadDelimiter = '_';

/*
  Decoded channel payload.

  Wire form is "{stream_id}_{position}". The split happens on the LAST
  delimiter, so stream ids may themselves contain '_'.
*/
struct RawNotification {
  std::string stream_id;
  uint64_t    position = 0;
};

// std::nullopt for payloads without a delimiter, with an empty stream id,
// or whose position is not a non-negative decimal integer.
std::optional<RawNotification> ParsePayload(std::string_view payload);

std::string FormatPayload(std::string_view stream_id, uint64_t position);

} // namespace eventlog::notify
