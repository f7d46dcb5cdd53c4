#pragma once

#include "proxykeeper/proxy/Candidate.hpp"
#include "proxykeeper/util/TtlCache.hpp"

namespace proxykeeper::proxy {

// Probe outcome (true = passed) per candidate identity.
using ValidationCache = util::TtlCache<ProxyIdentity, bool, ProxyIdentityHash>;

} // namespace proxykeeper::proxy
