#include "wire.hpp"

#include <charconv>
#include <system_error>

namespace eventlog::notify {

std::optional<RawNotification> ParsePayload(std::string_view payload) {
  const auto split = payload.rfind(kPayloadDelimiter);
  if (split == std::string_view::npos || split == 0) {
    return std::nullopt;
  }

  const auto digits = payload.substr(split + 1);
  if (digits.empty()) {
    return std::nullopt;
  }

  // no sign, no whitespace, no hex
  for (char c : digits) {
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
  }

  uint64_t position = 0;
  const auto [end, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), position);
  if (ec != std::errc{} || end != digits.data() + digits.size()) {
    return std::nullopt;
  }

  return RawNotification{std::string(payload.substr(0, split)), position};
}

std::string FormatPayload(std::string_view stream_id, uint64_t position) {
  std::string out;
  out.reserve(stream_id.size() + 21);
  out.append(stream_id);
  out.push_back(kPayloadDelimiter);
  out.append(std::to_string(position));
  return out;
}

} // namespace eventlog::notify
