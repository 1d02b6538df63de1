#pragma once

namespace protocol {

// Bumped whenever a field is renamed or changes type in any encoded payload.
constexpr int kProtocolVersion = 1;

}  // namespace protocol
