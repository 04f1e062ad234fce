#include "platform_fs.h"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <string>

namespace {

std::atomic<std::uint32_t> g_temp_seq{0};

void SetErrno(std::error_code& ec) {
  ec = std::error_code(errno, std::generic_category());
}

bool WriteAllFd(int fd, const std::uint8_t* data, std::size_t len,
                std::error_code& ec) {
  std::size_t offset = 0;
  while (offset < len) {
    const ssize_t rc = ::write(fd, data + offset, len - offset);
    if (rc < 0) {
      if (errno == EINTR) {
        continue;
      }
      SetErrno(ec);
      return false;
    }
    offset += static_cast<std::size_t>(rc);
  }
  return true;
}

std::filesystem::path BuildTempPath(const std::filesystem::path& target,
                                    std::uint32_t seq) {
  const std::filesystem::path dir =
      target.has_parent_path() ? target.parent_path() : std::filesystem::path{};
  std::string base = target.filename().string();
  if (base.empty()) {
    base = "tmp";
  }
  const std::string name = base + ".tmp." +
                           std::to_string(static_cast<int>(::getpid())) + "." +
                           std::to_string(seq);
  return dir.empty() ? std::filesystem::path{name} : (dir / name);
}

void RemoveQuietly(const std::filesystem::path& path) {
  std::error_code ignore_ec;
  std::filesystem::remove(path, ignore_ec);
}

}  // namespace

namespace lipseal::platform::fs {

bool Exists(const std::filesystem::path& path, std::error_code& ec) {
  return std::filesystem::exists(path, ec);
}

bool IsRegularFile(const std::filesystem::path& path, std::error_code& ec) {
  return std::filesystem::is_regular_file(path, ec);
}

std::uint64_t FileSize(const std::filesystem::path& path,
                       std::error_code& ec) {
  const auto size = std::filesystem::file_size(path, ec);
  return ec ? 0 : static_cast<std::uint64_t>(size);
}

bool CreateDirectories(const std::filesystem::path& path,
                       std::error_code& ec) {
  ec.clear();
  std::filesystem::create_directories(path, ec);
  return !ec;
}

bool Remove(const std::filesystem::path& path, std::error_code& ec) {
  return std::filesystem::remove(path, ec);
}

bool Rename(const std::filesystem::path& from, const std::filesystem::path& to,
            std::error_code& ec) {
  std::filesystem::rename(from, to, ec);
  return !ec;
}

bool ReadAll(const std::filesystem::path& path,
             std::vector<std::uint8_t>& out,
             std::error_code& ec) {
  ec.clear();
  out.clear();
  const int fd = ::open(path.c_str(), O_RDONLY);
  if (fd < 0) {
    SetErrno(ec);
    return false;
  }
  struct stat st {};
  if (::fstat(fd, &st) == 0 && st.st_size > 0) {
    out.reserve(static_cast<std::size_t>(st.st_size));
  }
  std::uint8_t buf[8192];
  while (true) {
    const ssize_t got = ::read(fd, buf, sizeof(buf));
    if (got < 0) {
      if (errno == EINTR) {
        continue;
      }
      SetErrno(ec);
      ::close(fd);
      out.clear();
      return false;
    }
    if (got == 0) {
      break;
    }
    out.insert(out.end(), buf, buf + got);
  }
  ::close(fd);
  return true;
}

bool AtomicWrite(const std::filesystem::path& path,
                 const std::uint8_t* data,
                 std::size_t len,
                 std::error_code& ec) {
  ec.clear();
  if (path.empty() || (len > 0 && !data)) {
    ec = std::make_error_code(std::errc::invalid_argument);
    return false;
  }

  for (int attempt = 0; attempt < 16; ++attempt) {
    const std::filesystem::path tmp = BuildTempPath(path, g_temp_seq++);
    const int fd =
        ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_TRUNC, 0600);
    if (fd < 0) {
      if (errno == EEXIST) {
        continue;
      }
      SetErrno(ec);
      return false;
    }

    if (len > 0 && !WriteAllFd(fd, data, len, ec)) {
      ::close(fd);
      RemoveQuietly(tmp);
      return false;
    }
    if (::fsync(fd) != 0) {
      SetErrno(ec);
      ::close(fd);
      RemoveQuietly(tmp);
      return false;
    }
    if (::close(fd) != 0) {
      SetErrno(ec);
      RemoveQuietly(tmp);
      return false;
    }
    if (::rename(tmp.c_str(), path.c_str()) != 0) {
      SetErrno(ec);
      RemoveQuietly(tmp);
      return false;
    }

    const std::filesystem::path dir =
        path.has_parent_path() ? path.parent_path() : std::filesystem::path(".");
    const int dfd = ::open(dir.c_str(), O_RDONLY);
    if (dfd >= 0) {
      (void)::fsync(dfd);
      (void)::close(dfd);
    }
    return true;
  }

  ec = std::make_error_code(std::errc::file_exists);
  return false;
}

std::filesystem::path UniqueTempSibling(const std::filesystem::path& target) {
  for (int attempt = 0; attempt < 16; ++attempt) {
    const std::filesystem::path tmp = BuildTempPath(target, g_temp_seq++);
    std::error_code ec;
    if (!std::filesystem::exists(tmp, ec) && !ec) {
      return tmp;
    }
  }
  return BuildTempPath(target, g_temp_seq++);
}

}  // namespace lipseal::platform::fs
