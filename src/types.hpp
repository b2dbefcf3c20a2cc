#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight enums/aliases (LineEnding, ByteRange).
 * Principle: carry simple state; avoid cross-module coupling/business logic.
 */
#include <cstddef>
#include <cstdint>

enum class LineEnding { LF, CRLF };

inline const char* line_ending_name(LineEnding le) { return le == LineEnding::CRLF ? "crlf" : "lf"; }

struct ByteRange { uint64_t offset = 0; uint64_t len = 0; };
