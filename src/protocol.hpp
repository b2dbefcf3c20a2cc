#pragma once
/*
 * Protocol
 *
 * Purpose: line-delimited JSON messages exchanged with the file agent.
 *   request  {"id": N, "method": "...", "params": {...}}
 *   response {"id": N, "data"?: {...}, "result"?: {...}, "error"?: "..."}
 * A request may receive any number of "data" messages before the single
 * terminal "result" or "error". Binary payloads are base64 strings.
 * Methods: read write patch truncate append stat ls mkdir rm cancel.
 */
#include <cstdint>
#include <string>
#include <vector>
#include <json/json.h>
#include "error.hpp"
#include "ifilesystem.hpp"

/* error strings for missing paths start with this prefix */
#define PE_NOT_FOUND_PREFIX "not found:"

std::string encode_request(uint64_t id, const std::string& method, const Json::Value& params);
std::string encode_data(uint64_t id, const Json::Value& data);
std::string encode_result(uint64_t id, const Json::Value& result);
std::string encode_error(uint64_t id, const std::string& message);

Json::Value path_params(const std::filesystem::path& path);
Json::Value read_params(const std::filesystem::path& path, uint64_t offset, uint64_t len);
Json::Value read_all_params(const std::filesystem::path& path);
Json::Value write_params(const std::filesystem::path& path, const std::string& data);
Json::Value patch_params(const std::filesystem::path& src, const std::filesystem::path& dst,
                         const std::vector<WriteOp>& ops);
Json::Value truncate_params(const std::filesystem::path& path, uint64_t len);
Json::Value append_params(const std::filesystem::path& path, const std::string& data);
Json::Value cancel_params(uint64_t request_id);

bool decode_write_ops(const Json::Value& arr, std::vector<WriteOp>& out, Error& err);

Json::Value metadata_to_json(const FileMetadata& md);
bool metadata_from_json(const Json::Value& v, FileMetadata& out, Error& err);
Json::Value dir_entry_to_json(const DirEntry& e);
bool dir_entry_from_json(const Json::Value& v, DirEntry& out, Error& err);

/* payload of one streamed "data" message */
Json::Value data_chunk(const std::string& bytes);
bool decode_data_chunk(const Json::Value& v, std::string& out, Error& err);
