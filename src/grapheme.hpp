#pragma once
/*
 * Grapheme
 *
 * Purpose: UTF-8 boundary queries for cursor movement and deletion.
 *   grapheme boundaries (ICU character break iterator): cursor steps,
 *     selection extension, forward delete
 *   code point boundaries: backspace removes one scalar value at a time
 * Layout: grapheme_layout gives, per cluster, its byte length and a cell
 *         width hint (2 for East Asian wide/fullwidth and emoji
 *         presentation, 0 for controls, otherwise 1) for a renderer.
 */
#include <cstdint>
#include <string_view>
#include <vector>
#include "error.hpp"

class TextBuffer;

struct GraphemeInfo {
  uint32_t byte_len = 0;
  uint8_t width = 1;
};

/* positions are byte offsets into text; results stay within [0, text.size()] */
size_t next_grapheme_boundary(std::string_view text, size_t pos);
size_t prev_grapheme_boundary(std::string_view text, size_t pos);
size_t next_code_point_boundary(std::string_view text, size_t pos);
size_t prev_code_point_boundary(std::string_view text, size_t pos);
bool is_code_point_boundary(std::string_view text, size_t pos);

std::vector<GraphemeInfo> grapheme_layout(std::string_view text);
uint8_t grapheme_width(std::string_view cluster);
/* visual column of byte offset pos within a line */
size_t column_of(std::string_view line, size_t pos);

/* buffer-level variants read a window around pos */
bool next_grapheme_boundary(const TextBuffer& buf, uint64_t pos, uint64_t& out, Error& err);
bool prev_grapheme_boundary(const TextBuffer& buf, uint64_t pos, uint64_t& out, Error& err);
bool prev_code_point_boundary(const TextBuffer& buf, uint64_t pos, uint64_t& out, Error& err);
