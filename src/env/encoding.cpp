#include "subrepl/env/encoding.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "subrepl/core/log.hpp"

namespace subrepl::env {

namespace {

// Decodes one UTF-8 sequence starting at `pos`, advancing it. Rejects
// overlong forms, surrogates and code points past U+10FFFF.
auto decode_utf8(std::string_view text, size_t& pos) -> std::optional<char32_t> {
  auto lead = static_cast<unsigned char>(text[pos]);

  size_t   length = 0;
  char32_t cp     = 0;
  char32_t min    = 0;
  if (lead < 0x80) {
    ++pos;
    return lead;
  }
  if ((lead & 0xE0) == 0xC0) {
    length = 2;
    cp     = lead & 0x1F;
    min    = 0x80;
  } else if ((lead & 0xF0) == 0xE0) {
    length = 3;
    cp     = lead & 0x0F;
    min    = 0x800;
  } else if ((lead & 0xF8) == 0xF0) {
    length = 4;
    cp     = lead & 0x07;
    min    = 0x10000;
  } else {
    return std::nullopt;
  }

  if (pos + length > text.size()) {
    return std::nullopt;
  }
  for (size_t i = 1; i < length; ++i) {
    auto cont = static_cast<unsigned char>(text[pos + i]);
    if ((cont & 0xC0) != 0x80) {
      return std::nullopt;
    }
    cp = (cp << 6) | (cont & 0x3F);
  }

  if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
    return std::nullopt;
  }
  pos += length;
  return cp;
}

auto representable_in_block(std::string_view key, std::string_view value) noexcept -> bool {
  if (key.empty() || key.find('=') != std::string_view::npos) {
    return false;
  }
  return key.find('\0') == std::string_view::npos && value.find('\0') == std::string_view::npos;
}

} // namespace

auto parse_encoding(std::string_view name) -> std::optional<Encoding> {
  std::string normalized;
  for (char c : name) {
    if (c == '-' || c == '_') {
      continue;
    }
    normalized.push_back(c >= 'A' && c <= 'Z' ? static_cast<char>(c - 'A' + 'a') : c);
  }

  if (normalized == "utf8") {
    return Encoding::Utf8;
  }
  if (normalized == "ascii" || normalized == "usascii") {
    return Encoding::Ascii;
  }
  if (normalized == "latin1" || normalized == "iso88591" || normalized == "l1") {
    return Encoding::Latin1;
  }
  return std::nullopt;
}

auto encoding_name(Encoding encoding) noexcept -> std::string_view {
  switch (encoding) {
    case Encoding::Utf8: return "utf-8";
    case Encoding::Ascii: return "ascii";
    case Encoding::Latin1: return "latin-1";
  }
  return "unknown";
}

auto encode(std::string_view text, Encoding encoding) -> std::optional<std::string> {
  switch (encoding) {
    case Encoding::Utf8: {
      for (size_t pos = 0; pos < text.size();) {
        if (!decode_utf8(text, pos)) {
          return std::nullopt;
        }
      }
      return std::string(text);
    }
    case Encoding::Ascii: {
      for (char c : text) {
        if (static_cast<unsigned char>(c) >= 0x80) {
          return std::nullopt;
        }
      }
      return std::string(text);
    }
    case Encoding::Latin1: {
      std::string out;
      out.reserve(text.size());
      for (size_t pos = 0; pos < text.size();) {
        auto cp = decode_utf8(text, pos);
        if (!cp || *cp > 0xFF) {
          return std::nullopt;
        }
        out.push_back(static_cast<char>(static_cast<uint8_t>(*cp)));
      }
      return out;
    }
  }
  return std::nullopt;
}

auto encode_environment(Environment const& env, Encoding encoding) -> Environment {
  Environment result;
  result.reserve(env.size());
  for (auto const& [key, value] : env) {
    auto enc_key   = encode(key, encoding);
    auto enc_value = encode(value, encoding);
    if (!enc_key || !enc_value || !representable_in_block(*enc_key, *enc_value)) {
      core::log::debug("dropping environment variable '{}' ({})", key, encoding_name(encoding));
      continue;
    }
    result.insert_or_assign(std::move(*enc_key), std::move(*enc_value));
  }
  return result;
}

} // namespace subrepl::env
