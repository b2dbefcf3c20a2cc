#include "file_reader.hpp"
#include "posix_fd.hpp"
#include <sys/mman.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <thread>
#include <future>
#include <algorithm>

bool mmap_read_file(const std::filesystem::path& path, std::string& out, Error& err) {
  out.clear();
  UniqueFd fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
  if (!fd.valid()) return fail_errno(err, "can not open file: " + path.string(), errno);
  struct stat st{};
  if (::fstat(fd.get(), &st) != 0) return fail_errno(err, "can not read file stat: " + path.string(), errno);
  if (S_ISDIR(st.st_mode)) return fail(err, ErrorKind::Io, "is a directory: " + path.string());
  size_t n = static_cast<size_t>(st.st_size);
  if (n == 0) return true;
  void* mem = ::mmap(nullptr, n, PROT_READ, MAP_PRIVATE, fd.get(), 0);
  if (mem == MAP_FAILED) return fail_errno(err, "can not mmap file: " + path.string(), errno);
  (void)::madvise(mem, n, MADV_SEQUENTIAL);
  out.assign(static_cast<const char*>(mem), n);
  ::munmap(mem, n);
  return true;
}

size_t count_newlines(const char* data, size_t n) {
  unsigned hw = std::thread::hardware_concurrency();
  if (hw == 0) hw = 4;
  const size_t min_parallel_size = 1 << 20;
  if (n < min_parallel_size || hw == 1) {
    return static_cast<size_t>(std::count(data, data + n, '\n'));
  }
  unsigned threads = std::min<unsigned>(hw, static_cast<unsigned>(n / min_parallel_size));
  threads = std::max(threads, 2u);
  size_t chunk = n / threads;
  std::vector<std::future<size_t>> futs;
  for (unsigned t = 0; t < threads; ++t) {
    size_t s = t * chunk;
    size_t e = (t + 1 == threads) ? n : (t + 1) * chunk;
    futs.emplace_back(std::async(std::launch::async, [data, s, e]{
      return static_cast<size_t>(std::count(data + s, data + e, '\n'));
    }));
  }
  size_t total = 0;
  for (auto& f : futs) total += f.get();
  return total;
}

LineEnding detect_line_ending(const char* data, size_t n) {
  const void* nl = std::memchr(data, '\n', n);
  if (!nl) return LineEnding::LF;
  size_t pos = static_cast<size_t>(static_cast<const char*>(nl) - data);
  return (pos > 0 && data[pos - 1] == '\r') ? LineEnding::CRLF : LineEnding::LF;
}

std::vector<std::string> split_lines(const std::string& text) {
  std::vector<std::string> lines;
  size_t start = 0, n = text.size();
  for (size_t i = 0; i < n; ++i) {
    if (text[i] == '\n') {
      size_t end = i;
      if (end > start && text[end - 1] == '\r') end--;
      lines.emplace_back(text.data() + start, end - start);
      start = i + 1;
    }
  }
  if (start < n) {
    size_t end = n;
    if (end > start && text[end - 1] == '\r') end--;
    lines.emplace_back(text.data() + start, end - start);
  }
  return lines;
}
