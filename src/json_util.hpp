#pragma once
/*
 * JSON text helpers over jsoncpp's builders.
 */
#include <string>
#include <json/json.h>
#include "error.hpp"

std::string json_to_pretty(const Json::Value& v);
/* single line, no trailing newline */
std::string json_to_compact(const Json::Value& v);
bool json_parse(const std::string& text, Json::Value& out, Error& err);
