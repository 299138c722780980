#include "lspshim/utils/utf8.hpp"

#include <algorithm>

namespace lspshim::utils {

namespace {

auto IsContinuationByte(unsigned char byte) -> bool {
  return (byte & 0xC0) == 0x80;
}

}  // namespace

auto Utf8SequenceLength(unsigned char lead) -> std::size_t {
  if (lead < 0x80) {
    return 1;
  }
  if ((lead & 0xE0) == 0xC0) {
    return 2;
  }
  if ((lead & 0xF0) == 0xE0) {
    return 3;
  }
  if ((lead & 0xF8) == 0xF0) {
    return 4;
  }
  return 1;
}

auto Utf16UnitsForLead(unsigned char lead) -> int {
  // Only four-byte sequences lie outside the BMP
  return Utf8SequenceLength(lead) == 4 ? 2 : 1;
}

auto Utf16UnitsToBytes(std::string_view text, int units) -> std::size_t {
  std::size_t offset = 0;
  int consumed = 0;
  while (offset < text.size() && consumed < units) {
    auto lead = static_cast<unsigned char>(text[offset]);
    auto width = Utf16UnitsForLead(lead);
    if (consumed + width > units) {
      break;
    }
    consumed += width;
    offset = std::min(text.size(), offset + Utf8SequenceLength(lead));
  }
  return offset;
}

auto BytesToUtf16Units(std::string_view text, std::size_t bytes) -> int {
  bytes = std::min(bytes, text.size());
  std::size_t offset = 0;
  int units = 0;
  while (offset < bytes) {
    auto lead = static_cast<unsigned char>(text[offset]);
    units += Utf16UnitsForLead(lead);
    offset += Utf8SequenceLength(lead);
  }
  return units;
}

auto CodepointsToBytes(std::string_view text, int codepoints) -> std::size_t {
  std::size_t offset = 0;
  for (int i = 0; i < codepoints && offset < text.size(); ++i) {
    auto lead = static_cast<unsigned char>(text[offset]);
    offset = std::min(text.size(), offset + Utf8SequenceLength(lead));
  }
  return offset;
}

auto BytesToCodepoints(std::string_view text, std::size_t bytes) -> int {
  bytes = std::min(bytes, text.size());
  std::size_t offset = 0;
  int count = 0;
  while (offset < bytes) {
    offset += Utf8SequenceLength(static_cast<unsigned char>(text[offset]));
    ++count;
  }
  return count;
}

auto FloorToCharBoundary(std::string_view text, std::size_t bytes)
    -> std::size_t {
  bytes = std::min(bytes, text.size());
  while (bytes > 0 && bytes < text.size() &&
         IsContinuationByte(static_cast<unsigned char>(text[bytes]))) {
    --bytes;
  }
  return bytes;
}

}  // namespace lspshim::utils
