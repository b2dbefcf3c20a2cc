#pragma once
/*
 * Recovery types
 *
 * Purpose: value types persisted by RecoveryStorage, with JSON mapping.
 *   RecoveryChunk       one replaced range of the original file, self-checksummed
 *   ChunkedRecoveryData ordered chunks + original/final sizes
 *   RecoveryMetadata    <id>.meta.json
 *   SessionInfo         session.lock
 * Note: chunk content travels as base64 inside JSON.
 */
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <json/json.h>
#include "error.hpp"

struct RecoveryChunk {
  uint64_t offset = 0;
  uint64_t original_len = 0;
  std::string content;
  std::string checksum;

  static RecoveryChunk make(uint64_t offset, uint64_t original_len, std::string content);
  bool verify() const;

  Json::Value to_json() const;
  static bool from_json(const Json::Value& v, RecoveryChunk& out, Error& err);
};

struct ChunkedRecoveryData {
  uint64_t original_size = 0;
  uint64_t final_size = 0;
  std::vector<RecoveryChunk> chunks;

  /* applies chunks in ascending offset order against the original bytes */
  bool apply(const std::string& original, std::string& out, Error& err) const;

  Json::Value to_json() const;
  static bool from_json(const Json::Value& v, ChunkedRecoveryData& out, Error& err);
};

enum class RecoveryFormat { Full, Chunked };

struct RecoveryMetadata {
  static constexpr int kVersion = 1;

  int version = kVersion;
  std::optional<std::string> original_path;
  std::optional<std::string> buffer_name;
  std::string checksum;
  uint64_t content_size = 0;
  std::optional<uint64_t> line_count;
  std::optional<uint64_t> original_mtime;
  uint64_t created_at = 0;
  uint64_t updated_at = 0;
  RecoveryFormat format = RecoveryFormat::Full;
  std::optional<uint64_t> chunk_count;
  std::optional<uint64_t> original_file_size;

  void update(std::string new_checksum, uint64_t new_size, std::optional<uint64_t> new_lines);

  Json::Value to_json() const;
  static bool from_json(const Json::Value& v, RecoveryMetadata& out, Error& err);
};

struct SessionInfo {
  int64_t pid = 0;
  uint64_t started_at = 0;

  static SessionInfo current();
  /* signal 0 probe; EPERM still means the process exists */
  bool is_running() const;

  Json::Value to_json() const;
  static bool from_json(const Json::Value& v, SessionInfo& out, Error& err);
};

uint64_t unix_now();
