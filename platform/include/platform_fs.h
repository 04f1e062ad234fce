#ifndef LIPSEAL_PLATFORM_FS_H
#define LIPSEAL_PLATFORM_FS_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <system_error>
#include <vector>

namespace lipseal::platform::fs {

bool Exists(const std::filesystem::path& path, std::error_code& ec);
bool IsRegularFile(const std::filesystem::path& path, std::error_code& ec);
std::uint64_t FileSize(const std::filesystem::path& path,
                       std::error_code& ec);
bool CreateDirectories(const std::filesystem::path& path,
                       std::error_code& ec);
bool Remove(const std::filesystem::path& path, std::error_code& ec);
bool Rename(const std::filesystem::path& from, const std::filesystem::path& to,
            std::error_code& ec);

// Reads the whole file. A missing file reports no_such_file_or_directory.
bool ReadAll(const std::filesystem::path& path,
             std::vector<std::uint8_t>& out,
             std::error_code& ec);

// Writes to a sibling temp file (mode 0600), fsyncs, then renames over path.
bool AtomicWrite(const std::filesystem::path& path,
                 const std::uint8_t* data,
                 std::size_t len,
                 std::error_code& ec);

// Sibling path that is not yet in use, for callers that stream into a
// temp file and publish it with Rename.
std::filesystem::path UniqueTempSibling(const std::filesystem::path& target);

}  // namespace lipseal::platform::fs

#endif  // LIPSEAL_PLATFORM_FS_H
