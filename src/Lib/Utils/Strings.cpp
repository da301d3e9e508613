/**
 * @file Strings.cpp
 * @brief Conversions between host C strings and C++ strings
 * @author Spank++ Team
 * @version 1.0.0
 */

#include <Spank++/Utils/Strings.hpp>

namespace spankpp::utils::strings {
  using namespace types;

  namespace {
    constexpr StringView REPLACEMENT_CHARACTER = "\xEF\xBF\xBD";

    // Length of the well-formed UTF-8 sequence starting at bytes[pos], or 0 if ill-formed.
    fn SequenceLength(const StringView bytes, const usize pos) -> usize {
      const auto lead      = static_cast<u8>(bytes[pos]);
      const usize remaining = bytes.size() - pos;

      if (lead < 0x80)
        return 1;

      usize length = 0;
      u8    lower  = 0x80;
      u8    upper  = 0xBF;

      if (lead >= 0xC2 && lead <= 0xDF)
        length = 2;
      else if (lead >= 0xE0 && lead <= 0xEF) {
        length = 3;
        if (lead == 0xE0)
          lower = 0xA0;
        else if (lead == 0xED)
          upper = 0x9F;
      } else if (lead >= 0xF0 && lead <= 0xF4) {
        length = 4;
        if (lead == 0xF0)
          lower = 0x90;
        else if (lead == 0xF4)
          upper = 0x8F;
      } else
        return 0;

      if (remaining < length)
        return 0;

      for (usize idx = 1; idx < length; ++idx) {
        const auto cont = static_cast<u8>(bytes[pos + idx]);

        if (idx == 1 ? (cont < lower || cont > upper) : (cont < 0x80 || cont > 0xBF))
          return 0;
      }

      return length;
    }
  } // namespace

  fn ToCString(const StringView value) -> Result<String> {
    if (value.find('\0') != StringView::npos)
      ERR(error::kind::CStringError { String(value) });

    return String(value);
  }

  fn IsValidUtf8(const StringView bytes) -> bool {
    for (usize pos = 0; pos < bytes.size();) {
      const usize length = SequenceLength(bytes, pos);

      if (length == 0)
        return false;

      pos += length;
    }

    return true;
  }

  fn ToLossyUtf8(const StringView bytes) -> String {
    String result;
    result.reserve(bytes.size());

    for (usize pos = 0; pos < bytes.size();) {
      if (const usize length = SequenceLength(bytes, pos); length != 0) {
        result.append(bytes.substr(pos, length));
        pos += length;
      } else {
        result.append(REPLACEMENT_CHARACTER);
        ++pos;
      }
    }

    return result;
  }

  fn ToUtf8(const StringView bytes) -> Result<String> {
    if (!IsValidUtf8(bytes))
      ERR(error::kind::Utf8Error { ToLossyUtf8(bytes) });

    return String(bytes);
  }

  fn EscapeNul(const StringView value, const StringView replacement) -> String {
    String result;
    result.reserve(value.size());

    for (const char chr : value)
      if (chr == '\0')
        result.append(replacement);
      else
        result.push_back(chr);

    return result;
  }

  fn ViewArgv(const usize argc, const char* const* argv) -> Vec<StringView> {
    Vec<StringView> views;

    if (argv == nullptr)
      return views;

    views.reserve(argc);

    for (usize idx = 0; idx < argc; ++idx)
      views.emplace_back(argv[idx] != nullptr ? argv[idx] : "");

    return views;
  }
} // namespace spankpp::utils::strings
