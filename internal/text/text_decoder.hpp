#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace relaynorm::text {

struct DecodedText {
  std::string text; // UTF-8
  std::string encoding;
};

/*
  TextDecoder

  Tries each configured encoding in order and returns the first clean
  decoding. A decoding is clean when every byte sequence is valid and
  defined for the encoding and no control characters other than tab,
  CR, LF and FF appear. Callers can add their own acceptance check
  (for example "parses into at least one section").

  Supported names: utf-8, cp1252 (windows-1252), latin-1 (iso-8859-1).
  latin-1 accepts the C1 range 0x80..0x9F, so placed after cp1252 it
  picks up files carrying bytes cp1252 leaves undefined.
*/
class TextDecoder {
 public:
  using Acceptor = std::function<bool(const std::string&)>;

  explicit TextDecoder(std::vector<std::string> encodings);

  std::optional<DecodedText> Decode(std::string_view bytes, const Acceptor& accept = {}) const;

  static std::optional<std::string> DecodeAs(std::string_view bytes, std::string_view encoding);

  static bool IsSupported(std::string_view encoding);

  const std::vector<std::string>& Encodings() const {
    return encodings_;
  }

 private:
  std::vector<std::string> encodings_;
};

} // namespace relaynorm::text
