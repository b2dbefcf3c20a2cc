#pragma once
/*
 * FileReader
 *
 * Purpose: read a whole file via mmap; scan bytes for line structure.
 * Usage: mmap_read_file(path, out, err); returns false with err on failure.
 */
#include <string>
#include <vector>
#include <filesystem>
#include "error.hpp"
#include "types.hpp"

bool mmap_read_file(const std::filesystem::path& path, std::string& out, Error& err);

/* newline count; scans in parallel for inputs of 1 MiB or more */
size_t count_newlines(const char* data, size_t n);
/* CRLF when the first newline is preceded by '\r', otherwise LF */
LineEnding detect_line_ending(const char* data, size_t n);
/* split on '\n', dropping a trailing '\r' from each line */
std::vector<std::string> split_lines(const std::string& text);
