#include "local_filesystem.hpp"
#include "config.hpp"
#include "file_reader.hpp"
#include "posix_fd.hpp"
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>

std::filesystem::path staging_path(const std::filesystem::path& path) {
  std::filesystem::path tmp = path;
  tmp += ".tmp";
  return tmp;
}

namespace {

class LocalFileWriter : public IFileWriter {
public:
  LocalFileWriter(UniqueFd fd, std::filesystem::path path) : fd_(std::move(fd)), path_(std::move(path)) {}
  bool write_all(const std::string& data, Error& err) override {
    int e = write_fully(fd_.get(), data.data(), data.size());
    if (e != 0) return fail_errno(err, "append failed: " + path_.string(), e);
    return true;
  }
  bool sync_all(Error& err) override {
    if (::fsync(fd_.get()) != 0) return fail_errno(err, "sync failed: " + path_.string(), errno);
    return true;
  }
private:
  UniqueFd fd_;
  std::filesystem::path path_;
};

bool pread_exact(int fd, uint64_t offset, uint64_t len, std::string& out, const std::filesystem::path& path, Error& err) {
  size_t base = out.size();
  out.resize(base + static_cast<size_t>(len));
  char* p = out.data() + base;
  uint64_t done = 0;
  while (done < len) {
    ssize_t r = ::pread(fd, p + done, static_cast<size_t>(len - done), static_cast<off_t>(offset + done));
    if (r < 0) {
      if (errno == EINTR) continue;
      out.resize(base);
      return fail_errno(err, "read failed: " + path.string(), errno);
    }
    if (r == 0) {
      out.resize(base);
      return fail(err, ErrorKind::Range, "unexpected end of file: " + path.string());
    }
    done += static_cast<uint64_t>(r);
  }
  return true;
}

/* commit a fully written temp file over the target */
bool commit_staged(UniqueFd& ufd, const std::filesystem::path& tmp, const std::filesystem::path& path,
                   mode_t mode, Error& err) {
  if (::fchmod(ufd.get(), mode) != 0) return fail_errno(err, "write file failed: " + tmp.string(), errno);
  if (int e = sync_data(ufd.get()); e != 0) return fail_errno(err, "write file failed: " + tmp.string(), e);
  ufd.reset();
  std::error_code ec;
  std::filesystem::rename(tmp, path, ec);
  if (ec) {
    std::filesystem::remove(tmp, ec);
    return fail(err, ErrorKind::Io, "write file failed: " + path.string());
  }
  return true;
}

mode_t existing_mode(const std::filesystem::path& path, mode_t fallback) {
  struct stat st{};
  if (::stat(path.c_str(), &st) == 0) return st.st_mode & 07777;
  return fallback;
}

} // namespace

bool LocalFileSystem::read_file(const std::filesystem::path& path, std::string& out, Error& err) {
  return mmap_read_file(path, out, err);
}

bool LocalFileSystem::read_range(const std::filesystem::path& path, uint64_t offset, uint64_t len,
                                 std::string& out, Error& err) {
  out.clear();
  UniqueFd fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
  if (!fd.valid()) return fail_errno(err, "can not open file: " + path.string(), errno);
  struct stat st{};
  if (::fstat(fd.get(), &st) != 0) return fail_errno(err, "can not read file stat: " + path.string(), errno);
  uint64_t size = static_cast<uint64_t>(st.st_size);
  if (offset > size || len > size - offset) {
    return fail(err, ErrorKind::Range,
                "range " + std::to_string(offset) + "+" + std::to_string(len) +
                " exceeds file size " + std::to_string(size) + ": " + path.string());
  }
  return pread_exact(fd.get(), offset, len, out, path, err);
}

bool LocalFileSystem::write_file(const std::filesystem::path& path, const std::string& data, Error& err) {
  std::filesystem::path tmp = staging_path(path);
  mode_t mode = existing_mode(path, 0644);
  UniqueFd ufd(::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));
  if (!ufd.valid()) return fail_errno(err, "write file failed: " + tmp.string(), errno);
  if (int e = write_fully(ufd.get(), data.data(), data.size()); e != 0) {
    ufd.reset();
    std::error_code ec;
    std::filesystem::remove(tmp, ec);
    return fail_errno(err, "write file failed: " + tmp.string(), e);
  }
  return commit_staged(ufd, tmp, path, mode, err);
}

bool LocalFileSystem::write_patched(const std::filesystem::path& src, const std::filesystem::path& dst,
                                    const std::vector<WriteOp>& ops, Error& err) {
  bool needs_src = std::any_of(ops.begin(), ops.end(),
                               [](const WriteOp& op){ return std::holds_alternative<WriteCopy>(op); });
  UniqueFd sfd;
  uint64_t src_size = 0;
  if (needs_src) {
    sfd.reset(::open(src.c_str(), O_RDONLY | O_CLOEXEC));
    if (!sfd.valid()) return fail_errno(err, "can not open patch source: " + src.string(), errno);
    struct stat st{};
    if (::fstat(sfd.get(), &st) != 0) return fail_errno(err, "can not read file stat: " + src.string(), errno);
    src_size = static_cast<uint64_t>(st.st_size);
  }
  mode_t mode = existing_mode(dst, existing_mode(src, 0644));

  std::filesystem::path tmp = staging_path(dst);
  UniqueFd ufd(::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));
  if (!ufd.valid()) return fail_errno(err, "write file failed: " + tmp.string(), errno);
  auto abandon = [&]() {
    ufd.reset();
    std::error_code ec;
    std::filesystem::remove(tmp, ec);
    return false;
  };

  std::string buf;
  const uint64_t chunk = PE_WRITE_CHUNK_SIZE;
  for (const WriteOp& op : ops) {
    if (const auto* c = std::get_if<WriteCopy>(&op)) {
      if (c->offset > src_size || c->len > src_size - c->offset) {
        fail(err, ErrorKind::Range, "copy range " + std::to_string(c->offset) + "+" + std::to_string(c->len) +
                                   " exceeds source size " + std::to_string(src_size));
        return abandon();
      }
      uint64_t done = 0;
      while (done < c->len) {
        uint64_t n = std::min(chunk, c->len - done);
        buf.clear();
        if (!pread_exact(sfd.get(), c->offset + done, n, buf, src, err)) return abandon();
        if (int e = write_fully(ufd.get(), buf.data(), buf.size()); e != 0) {
          fail_errno(err, "write file failed: " + tmp.string(), e);
          return abandon();
        }
        done += n;
      }
    } else {
      const std::string& data = std::get<WriteInsert>(op).data;
      if (int e = write_fully(ufd.get(), data.data(), data.size()); e != 0) {
        fail_errno(err, "write file failed: " + tmp.string(), e);
        return abandon();
      }
    }
  }
  sfd.reset();
  if (!commit_staged(ufd, tmp, dst, mode, err)) return abandon();
  return true;
}

bool LocalFileSystem::set_file_length(const std::filesystem::path& path, uint64_t len, Error& err) {
  if (::truncate(path.c_str(), static_cast<off_t>(len)) != 0) {
    return fail_errno(err, "set file length failed: " + path.string(), errno);
  }
  return true;
}

std::unique_ptr<IFileWriter> LocalFileSystem::open_file_for_append(const std::filesystem::path& path, Error& err) {
  UniqueFd fd(::open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644));
  if (!fd.valid()) { fail_errno(err, "can not open for append: " + path.string(), errno); return nullptr; }
  return std::make_unique<LocalFileWriter>(std::move(fd), path);
}

bool LocalFileSystem::metadata(const std::filesystem::path& path, FileMetadata& out, Error& err) {
  struct stat st{};
  if (::stat(path.c_str(), &st) != 0) return fail_errno(err, "can not read file stat: " + path.string(), errno);
  out.size = static_cast<uint64_t>(st.st_size);
  out.mtime = static_cast<uint64_t>(st.st_mtime);
  out.mode = static_cast<uint32_t>(st.st_mode & 07777);
  out.is_dir = S_ISDIR(st.st_mode);
  out.is_file = S_ISREG(st.st_mode);
  return true;
}

/* stat that reports a missing path as present = false */
static bool stat_if_present(const std::filesystem::path& path, struct stat& st, bool& present, Error& err) {
  if (::stat(path.c_str(), &st) == 0) { present = true; return true; }
  if (errno == ENOENT || errno == ENOTDIR) { present = false; return true; }
  return fail_errno(err, "can not read file stat: " + path.string(), errno);
}

bool LocalFileSystem::is_dir(const std::filesystem::path& path, bool& out, Error& err) {
  struct stat st{};
  bool present = false;
  if (!stat_if_present(path, st, present, err)) return false;
  out = present && S_ISDIR(st.st_mode);
  return true;
}

bool LocalFileSystem::exists(const std::filesystem::path& path, bool& out, Error& err) {
  struct stat st{};
  return stat_if_present(path, st, out, err);
}

bool LocalFileSystem::read_dir(const std::filesystem::path& path, std::vector<DirEntry>& out, Error& err) {
  out.clear();
  std::error_code ec;
  std::filesystem::directory_iterator it(path, ec), end;
  if (ec) {
    return fail(err, ec == std::errc::no_such_file_or_directory ? ErrorKind::NotFound : ErrorKind::Io,
                "can not read directory: " + path.string() + ": " + ec.message());
  }
  for (; it != end; it.increment(ec)) {
    if (ec) return fail(err, ErrorKind::Io, "can not read directory: " + path.string() + ": " + ec.message());
    DirEntry e;
    e.path = it->path();
    e.name = e.path.filename().string();
    std::error_code sec;
    e.is_dir = it->is_directory(sec);
    e.is_file = it->is_regular_file(sec);
    if (e.is_file) {
      auto sz = it->file_size(sec);
      if (!sec) e.size = static_cast<uint64_t>(sz);
    }
    out.push_back(std::move(e));
  }
  std::sort(out.begin(), out.end(), [](const DirEntry& a, const DirEntry& b){ return a.name < b.name; });
  return true;
}

bool LocalFileSystem::remove_file(const std::filesystem::path& path, Error& err) {
  if (::unlink(path.c_str()) != 0) return fail_errno(err, "remove failed: " + path.string(), errno);
  return true;
}

bool LocalFileSystem::create_dir_all(const std::filesystem::path& path, Error& err) {
  std::error_code ec;
  std::filesystem::create_directories(path, ec);
  if (ec) return fail(err, ErrorKind::Io, "can not create directory: " + path.string() + ": " + ec.message());
  return true;
}
