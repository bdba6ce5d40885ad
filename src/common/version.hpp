#pragma once

#include <string_view>

#ifndef MATCHWIRE_VERSION
#error "MATCHWIRE_VERSION must be defined by the build"
#endif

namespace matchwire {

inline constexpr std::string_view kVersion = MATCHWIRE_VERSION;

} // namespace matchwire
