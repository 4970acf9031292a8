#include "logkit/sanitizer.hpp"

#include <algorithm>

namespace logkit {

namespace {

struct DecodedChar {
  char32_t codePoint = 0;
  std::size_t length = 1;
  bool valid = false;
};

// Декодирует один символ UTF-8, начиная с позиции pos. Отвергает
// overlong-последовательности, суррогаты и значения выше U+10FFFF.
DecodedChar decodeUtf8(const std::string& text, std::size_t pos) {
  DecodedChar result;
  const auto lead = static_cast<unsigned char>(text[pos]);

  if (lead < 0x80) {
    result.codePoint = lead;
    result.valid = true;
    return result;
  }

  std::size_t length = 0;
  char32_t cp = 0;
  char32_t minimum = 0;
  if ((lead & 0xE0) == 0xC0) {
    length = 2;
    cp = lead & 0x1F;
    minimum = 0x80;
  } else if ((lead & 0xF0) == 0xE0) {
    length = 3;
    cp = lead & 0x0F;
    minimum = 0x800;
  } else if ((lead & 0xF8) == 0xF0) {
    length = 4;
    cp = lead & 0x07;
    minimum = 0x10000;
  } else {
    return result;
  }

  if (pos + length > text.size()) return result;

  for (std::size_t i = 1; i < length; ++i) {
    const auto next = static_cast<unsigned char>(text[pos + i]);
    if ((next & 0xC0) != 0x80) return result;
    cp = (cp << 6) | (next & 0x3F);
  }

  if (cp < minimum || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
    return result;
  }

  result.codePoint = cp;
  result.length = length;
  result.valid = true;
  return result;
}

bool isEmoji(char32_t cp) {
  return (cp >= 0x1F600 && cp <= 0x1F64F) ||  // смайлики
         (cp >= 0x1F300 && cp <= 0x1F5FF) ||  // символы и пиктограммы
         (cp >= 0x1F680 && cp <= 0x1F6FF) ||  // транспорт и карты
         (cp >= 0x1F1E0 && cp <= 0x1F1FF) ||  // флаги
         cp == 0x200D || cp == 0x23CF ||
         (cp >= 0x23E9 && cp <= 0x23ED) || (cp >= 0x23EF && cp <= 0x23F3) ||
         (cp >= 0x25A0 && cp <= 0x25FF) || (cp >= 0x2600 && cp <= 0x26FF) ||
         (cp >= 0x2700 && cp <= 0x27BF) || (cp >= 0x2B00 && cp <= 0x2BFF) ||
         cp == 0xFE0E || cp == 0xFE0F || cp >= 0x10000;
}

bool isInvisible(char32_t cp) {
  return cp == 0x200B || cp == 0x200C || cp == 0x2060 || cp == 0xFEFF;
}

bool isControl(char32_t cp) {
  if (cp == '\t' || cp == '\n') return false;
  return cp < 0x20 || cp == 0x7F || (cp >= 0x80 && cp <= 0x9F);
}

// nullptr, если символ не требует замены.
const char* substitutionFor(char32_t cp) {
  switch (cp) {
    case 0x2192:
      return "-->";
    case 0x2190:
      return "<--";
    case 0x2194:
      return "<->";
    case 0x21D2:
      return "==>";
    case 0x2013:
    case 0x2014:
      return "-";
    case 0x2026:
      return "...";
    case 0x2018:
    case 0x2019:
      return "'";
    case 0x201C:
    case 0x201D:
      return "\"";
    case 0x00A0:
      return " ";
    default:
      return nullptr;
  }
}

bool isFilenameChar(char32_t cp) {
  return (cp >= 'a' && cp <= 'z') || (cp >= 'A' && cp <= 'Z') ||
         (cp >= '0' && cp <= '9') || cp == '-' || cp == '_' || cp == '.';
}

}  // namespace

std::string sanitizeMessage(const std::string& text) {
  std::string result;
  result.reserve(text.size());

  std::size_t pos = 0;
  while (pos < text.size()) {
    const DecodedChar ch = decodeUtf8(text, pos);
    if (!ch.valid) {
      result.push_back('?');
      pos += 1;
      continue;
    }

    if (const char* replacement = substitutionFor(ch.codePoint)) {
      result.append(replacement);
    } else if (!isEmoji(ch.codePoint) && !isInvisible(ch.codePoint) &&
               !isControl(ch.codePoint)) {
      result.append(text, pos, ch.length);
    }
    pos += ch.length;
  }
  return result;
}

std::string sanitizeLoggerName(const std::string& name) {
  std::string result = sanitizeMessage(name);
  std::replace_if(result.begin(), result.end(),
                  [](char c) { return c == '\n' || c == '\t'; }, ' ');
  return result;
}

std::string safeFilename(const std::string& name) {
  if (name.empty()) return kFallbackFilename;

  std::string result;
  result.reserve(name.size());

  std::size_t pos = 0;
  while (pos < name.size()) {
    const DecodedChar ch = decodeUtf8(name, pos);
    result.push_back(ch.valid && isFilenameChar(ch.codePoint)
                         ? static_cast<char>(ch.codePoint)
                         : '_');
    pos += ch.length;
  }
  return result;
}

}  // namespace logkit
