#pragma once

namespace matchwire::net {

bool EnsureCurlGlobalInit();

} // namespace matchwire::net
