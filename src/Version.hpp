#pragma once

namespace ads_mcp {

constexpr const char* kServerName = "google-ads-mcp";
constexpr const char* kServerVersion = "0.0.1";
constexpr const char* kProtocolVersion = "2024-11-05";

} // namespace ads_mcp
