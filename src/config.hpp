#pragma once
/*
 * Config
 *
 * Purpose: compile-time defaults (PE_* macros) plus runtime overrides
 *          read from ~/.peditrc.
 * Format: one "set key value" or "set key=value" per line; lines starting
 *         with '#', '"' or '//' are comments; a leading ':' is ignored.
 */
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include <filesystem>
#include "log.hpp"

/* files at or below this size are cached in memory on load */
#ifndef PE_LARGE_FILE_THRESHOLD
#define PE_LARGE_FILE_THRESHOLD (1u << 20)
#endif

/* chunk size used when streaming a large file into pieces */
#ifndef PE_LOAD_CHUNK_SIZE
#define PE_LOAD_CHUNK_SIZE (1u << 20)
#endif

/* buffers above this size (with a backing file) use chunked recovery */
#ifndef PE_CHUNKED_RECOVERY_THRESHOLD
#define PE_CHUNKED_RECOVERY_THRESHOLD (10u << 20)
#endif

/* bounded per-request data queue in the agent channel */
#ifndef PE_DATA_CHANNEL_CAPACITY
#define PE_DATA_CHANNEL_CAPACITY 64
#endif

/* payload size of one streamed "data" message from the agent */
#ifndef PE_STREAM_CHUNK_SIZE
#define PE_STREAM_CHUNK_SIZE (64u << 10)
#endif

/* staging buffer for atomic writes */
#ifndef PE_WRITE_CHUNK_SIZE
#define PE_WRITE_CHUNK_SIZE (256u << 10)
#endif

/* outgoing message queue depth of the channel writer thread */
#ifndef PE_WRITER_QUEUE_CAPACITY
#define PE_WRITER_QUEUE_CAPACITY 64
#endif

struct Config {
  size_t large_file_threshold = PE_LARGE_FILE_THRESHOLD;
  size_t load_chunk_size = PE_LOAD_CHUNK_SIZE;
  size_t chunked_recovery_threshold = PE_CHUNKED_RECOVERY_THRESHOLD;
  size_t data_channel_capacity = PE_DATA_CHANNEL_CAPACITY;
  std::filesystem::path recovery_dir;
  LogLevel log_level = LogLevel::Info;

  /* apply one rc line; returns false with msg on an unknown key or bad value */
  bool apply_line(const std::string& line, std::string& msg);
  /* apply every line of an rc file's text; bad lines are logged and skipped */
  void apply_text(const std::string& text);
  /* $HOME/.peditrc when present; missing file is not an error */
  bool load_rc(std::string& msg);

  static Config defaults();
};

/* $XDG_DATA_HOME/pedit/recovery, ~/.local/share/pedit/recovery, /tmp/pedit-recovery */
std::filesystem::path default_recovery_dir();
