#ifndef LIPSEAL_CHUNKED_FILE_CIPHER_H
#define LIPSEAL_CHUNKED_FILE_CIPHER_H

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include "client_config.h"
#include "e2ee_error.h"
#include "key_agreement.h"

namespace lipseal::client {

enum class FilePhase : std::uint8_t {
  kReading = 0,
  kEncrypting = 1,
  kDecrypting = 2,
  kFinalizing = 3,
};

const char* FilePhaseName(FilePhase phase);

struct FileProgress {
  FilePhase phase{FilePhase::kReading};
  std::uint32_t current_chunk{0};
  std::uint32_t total_chunks{0};
  double percentage{0.0};
  std::uint64_t bytes_processed{0};
  std::uint64_t total_bytes{0};
};

using ProgressCallback = std::function<void(const FileProgress&)>;

// Polled between chunks; a cancelled operation produces no output.
class CancellationToken {
 public:
  void Cancel() { cancelled_.store(true); }
  bool IsCancelled() const { return cancelled_.load(); }

 private:
  std::atomic<bool> cancelled_{false};
};

struct FileChunk {
  std::uint32_t index{0};
  std::string iv;              // base64, 16 bytes
  std::string auth_tag;        // hex, keyed BLAKE2b-256
  std::string encrypted_data;  // base64
  std::uint64_t original_size{0};
  std::uint64_t encrypted_size{0};
};

struct ChunkedFile {
  std::string file_id;
  std::string file_name;
  std::string file_type;
  std::uint32_t total_chunks{0};
  std::uint64_t original_size{0};
  std::uint64_t encrypted_size{0};
  std::string master_iv;  // carried for format compatibility, not used
  std::string master_auth_tag;
  std::vector<FileChunk> chunks;
};

std::string MimeTypeForFileName(const std::string& file_name);

// Subkeys for file payloads, derived from the conversation content key.
struct FileKeys {
  ContentKey enc{};
  ContentKey mac{};

  ~FileKeys();
};

void DeriveFileKeys(const ContentKey& content_key, FileKeys& out);

class ChunkedFileCipher {
 public:
  explicit ChunkedFileCipher(FilesConfig cfg = FilesConfig{});

  std::uint32_t chunk_size() const { return cfg_.chunk_size; }
  std::uint32_t ChunkCountFor(std::uint64_t size) const;

  bool EncryptFile(const ContentKey& key,
                   const std::filesystem::path& input,
                   const std::string& file_name,
                   ChunkedFile& out,
                   Error& error,
                   const ProgressCallback& on_progress = {},
                   const CancellationToken* cancel = nullptr) const;
  bool EncryptBytes(const ContentKey& key,
                    const std::vector<std::uint8_t>& data,
                    const std::string& file_name,
                    ChunkedFile& out,
                    Error& error,
                    const ProgressCallback& on_progress = {},
                    const CancellationToken* cancel = nullptr) const;

  // Verifies the master tag before touching any chunk, then each chunk's tag
  // before decrypting it. out is left empty on any failure.
  bool DecryptToMemory(const ChunkedFile& file,
                       const ContentKey& key,
                       std::vector<std::uint8_t>& out,
                       Error& error,
                       const ProgressCallback& on_progress = {},
                       const CancellationToken* cancel = nullptr) const;
  // Streams into a temp sibling of output and renames on success.
  bool DecryptToFile(const ChunkedFile& file,
                     const ContentKey& key,
                     const std::filesystem::path& output,
                     Error& error,
                     const ProgressCallback& on_progress = {},
                     const CancellationToken* cancel = nullptr) const;

 private:
  using ChunkReader = std::function<bool(std::uint64_t offset,
                                         std::size_t len,
                                         std::uint8_t* out,
                                         Error& error)>;
  using ChunkWriter = std::function<bool(const std::uint8_t* data,
                                         std::size_t len,
                                         Error& error)>;

  bool EncryptFrom(const ContentKey& key,
                   std::uint64_t size,
                   const ChunkReader& read,
                   const std::string& file_name,
                   ChunkedFile& out,
                   Error& error,
                   const ProgressCallback& on_progress,
                   const CancellationToken* cancel) const;
  bool DecryptInto(const ChunkedFile& file,
                   const ContentKey& key,
                   const ChunkWriter& write,
                   Error& error,
                   const ProgressCallback& on_progress,
                   const CancellationToken* cancel) const;

  FilesConfig cfg_;
};

}  // namespace lipseal::client

#endif  // LIPSEAL_CHUNKED_FILE_CIPHER_H
