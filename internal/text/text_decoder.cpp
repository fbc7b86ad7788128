#include "text_decoder.hpp"

#include <cstdint>

#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"

namespace relaynorm::text {

namespace {

enum class Encoding {
  kUtf8,
  kCp1252,
  kLatin1,
};

std::optional<Encoding> ParseEncoding(std::string_view name) {
  const auto folded = util::FoldCase(name);
  if (folded == "utf-8" || folded == "utf8") return Encoding::kUtf8;
  if (folded == "cp1252" || folded == "windows-1252") return Encoding::kCp1252;
  if (folded == "latin-1" || folded == "latin1" || folded == "iso-8859-1") return Encoding::kLatin1;
  return std::nullopt;
}

bool IsAllowedCodePoint(std::uint32_t cp) {
  if (cp == '\t' || cp == '\n' || cp == '\r' || cp == '\f') return true;
  if (cp < 0x20 || cp == 0x7F) return false;
  if (cp >= 0x80 && cp <= 0x9F) return false;
  return true;
}

void AppendUtf8(std::string& out, std::uint32_t cp) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

std::optional<std::string> DecodeUtf8(std::string_view bytes) {
  if (bytes.size() >= 3 && static_cast<unsigned char>(bytes[0]) == 0xEF && static_cast<unsigned char>(bytes[1]) == 0xBB &&
      static_cast<unsigned char>(bytes[2]) == 0xBF) {
    bytes.remove_prefix(3);
  }

  std::size_t i = 0;
  while (i < bytes.size()) {
    const auto    lead = static_cast<unsigned char>(bytes[i]);
    std::uint32_t cp   = 0;
    int           extra = 0;
    if (lead < 0x80) {
      cp = lead;
    } else if ((lead & 0xE0) == 0xC0) {
      cp    = lead & 0x1F;
      extra = 1;
    } else if ((lead & 0xF0) == 0xE0) {
      cp    = lead & 0x0F;
      extra = 2;
    } else if ((lead & 0xF8) == 0xF0) {
      cp    = lead & 0x07;
      extra = 3;
    } else {
      return std::nullopt;
    }
    if (i + static_cast<std::size_t>(extra) >= bytes.size()) return std::nullopt;
    for (int k = 1; k <= extra; ++k) {
      const auto next = static_cast<unsigned char>(bytes[i + static_cast<std::size_t>(k)]);
      if ((next & 0xC0) != 0x80) return std::nullopt;
      cp = (cp << 6) | (next & 0x3F);
    }
    // overlong forms, surrogates, out of range
    if ((extra == 1 && cp < 0x80) || (extra == 2 && cp < 0x800) || (extra == 3 && cp < 0x10000)) return std::nullopt;
    if ((cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) return std::nullopt;
    if (!IsAllowedCodePoint(cp)) return std::nullopt;
    i += static_cast<std::size_t>(extra) + 1;
  }
  return std::string(bytes);
}

// 0x80..0x9F; 0 marks bytes windows-1252 leaves undefined
constexpr std::uint16_t kCp1252High[32] = {
    0x20AC, 0,      0x201A, 0x0192, 0x201E, 0x2026, 0x2020, 0x2021, 0x02C6, 0x2030, 0x0160, 0x2039, 0x0152, 0,      0x017D, 0,
    0,      0x2018, 0x2019, 0x201C, 0x201D, 0x2022, 0x2013, 0x2014, 0x02DC, 0x2122, 0x0161, 0x203A, 0x0153, 0,      0x017E, 0x0178,
};

std::optional<std::string> DecodeSingleByte(std::string_view bytes, Encoding encoding) {
  std::string out;
  out.reserve(bytes.size());
  for (char c : bytes) {
    std::uint32_t cp = static_cast<unsigned char>(c);
    if (cp >= 0x80 && cp <= 0x9F) {
      if (encoding == Encoding::kLatin1) {
        // C1 bytes map to U+0080..U+009F
        AppendUtf8(out, cp);
        continue;
      }
      cp = kCp1252High[cp - 0x80];
      if (cp == 0) return std::nullopt;
    }
    if (!IsAllowedCodePoint(cp)) return std::nullopt;
    AppendUtf8(out, cp);
  }
  return out;
}

} // namespace

TextDecoder::TextDecoder(std::vector<std::string> encodings) : encodings_(std::move(encodings)) {
  for (const auto& encoding : encodings_) {
    if (!IsSupported(encoding)) {
      throw util::InvalidConfig("unsupported text encoding: " + encoding);
    }
  }
}

bool TextDecoder::IsSupported(std::string_view encoding) {
  return ParseEncoding(encoding).has_value();
}

std::optional<std::string> TextDecoder::DecodeAs(std::string_view bytes, std::string_view encoding) {
  const auto parsed = ParseEncoding(encoding);
  if (!parsed) return std::nullopt;
  if (*parsed == Encoding::kUtf8) return DecodeUtf8(bytes);
  return DecodeSingleByte(bytes, *parsed);
}

std::optional<DecodedText> TextDecoder::Decode(std::string_view bytes, const Acceptor& accept) const {
  for (const auto& encoding : encodings_) {
    auto text = DecodeAs(bytes, encoding);
    if (!text) continue;
    if (accept && !accept(*text)) continue;
    return DecodedText{std::move(*text), encoding};
  }
  return std::nullopt;
}

} // namespace relaynorm::text
