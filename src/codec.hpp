#pragma once
/*
 * Codec
 *
 * Purpose: Base64 (standard alphabet, padded) for binary payloads carried
 *          inside JSON: wire messages and chunked recovery content.
 * Note: decode returns false on malformed input; whitespace is not accepted.
 */
#include <string>
#include <string_view>

std::string base64_encode(std::string_view data);
bool base64_decode(std::string_view text, std::string& out);
