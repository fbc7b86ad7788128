#pragma once

#include <string>
#include <string_view>

namespace relaynorm::util {

/*
  Content digest for source document identity.

  64-bit FNV-1a, rendered as 16 lowercase hex characters. Used to
  detect that a re-ingested file is byte-identical, not as a
  cryptographic fingerprint.
*/
std::string ContentDigest(std::string_view bytes);

} // namespace relaynorm::util
