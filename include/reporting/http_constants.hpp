#pragma once

#include <string>
#include <string_view>

namespace querywatch::http {

inline constexpr std::string_view kLibraryVersion = "1.0.0";

inline constexpr std::string_view kBearerPrefix = "Bearer ";
// std::string because cpp-httplib APIs require const std::string&
inline const std::string kAuthorizationHeader = "Authorization";
inline const std::string kProjectIdHeader = "X-PROJECT-ID";
inline const std::string kUserAgentHeader = "User-Agent";
inline constexpr const char* kJsonContentType = "application/json";

inline constexpr std::string_view kTruncationMarker = "\n-- [TRUNCATED]";

} // namespace querywatch::http
