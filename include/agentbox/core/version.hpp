#pragma once

namespace agentbox {

inline constexpr const char* kVersion = "0.4.0";
inline constexpr const char* kServiceName = "agentbox";

} // namespace agentbox
