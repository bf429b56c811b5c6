#pragma once

#ifndef TB_BUILD_VERSION
#define TB_BUILD_VERSION "0.0.0-dev"
#endif

namespace tb::version
{

inline constexpr char const kSemanticVersion[] = TB_BUILD_VERSION;
inline constexpr char const kDisplayVersion[] =
    "TorrentBridge " TB_BUILD_VERSION;
inline constexpr char const kUserAgentVersion[] =
    "TorrentBridge/" TB_BUILD_VERSION;

} // namespace tb::version
