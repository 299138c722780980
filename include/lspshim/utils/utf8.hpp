#pragma once

#include <cstddef>
#include <string_view>

namespace lspshim::utils {

// Length of the UTF-8 sequence introduced by a lead byte. Invalid lead
// bytes and stray continuation bytes count as single-byte sequences.
auto Utf8SequenceLength(unsigned char lead) -> std::size_t;

// Number of UTF-16 code units needed to encode the sequence at the lead byte
auto Utf16UnitsForLead(unsigned char lead) -> int;

// Walk `text` and return the byte offset reached after `units` UTF-16 code
// units. Stops at the end of `text`, and never splits a character: a count
// that lands inside a surrogate pair resolves to the start of the pair.
auto Utf16UnitsToBytes(std::string_view text, int units) -> std::size_t;

// Number of UTF-16 code units in the first `bytes` bytes of `text`
auto BytesToUtf16Units(std::string_view text, std::size_t bytes) -> int;

// Byte offset reached after `codepoints` characters, clamped to the end
auto CodepointsToBytes(std::string_view text, int codepoints) -> std::size_t;

// Number of characters in the first `bytes` bytes of `text`
auto BytesToCodepoints(std::string_view text, std::size_t bytes) -> int;

// Move a byte offset back onto the nearest character boundary
auto FloorToCharBoundary(std::string_view text, std::size_t bytes)
    -> std::size_t;

}  // namespace lspshim::utils
