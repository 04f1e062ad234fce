#ifndef LIPSEAL_FILE_CIPHER_H
#define LIPSEAL_FILE_CIPHER_H

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "chunked_file_cipher.h"
#include "client_config.h"
#include "e2ee_error.h"
#include "file_key_wrap.h"
#include "key_agreement.h"

namespace lipseal::client {

// Format for payloads at or below the chunked threshold: one keystream pass
// plus a keyed tag over the whole ciphertext.
struct SingleFileEnvelope {
  std::string file_name;
  std::string file_type;
  std::string iv;              // base64, 16 bytes
  std::string auth_tag;        // hex
  std::string encrypted_data;  // base64
  std::uint64_t original_size{0};
  std::uint64_t encrypted_size{0};
};

struct EncryptedFile {
  bool chunked{false};
  SingleFileEnvelope single;
  ChunkedFile chunked_file;
  // Set when the payload is sealed under a random file key. Empty means the
  // payload key is the content key of the sender and reader.
  std::vector<RecipientKey> recipient_keys;
};

// Picks the single-envelope or chunked format by size and dispatches.
class FileCipher {
 public:
  explicit FileCipher(FilesConfig cfg = FilesConfig{});

  bool UsesChunkedFormat(std::uint64_t size) const {
    return size > cfg_.chunked_threshold;
  }
  const ChunkedFileCipher& chunked() const { return chunked_; }

  bool EncryptFile(const ContentKey& key,
                   const std::filesystem::path& input,
                   const std::string& file_name,
                   EncryptedFile& out,
                   Error& error,
                   const ProgressCallback& on_progress = {},
                   const CancellationToken* cancel = nullptr) const;
  bool EncryptBytes(const ContentKey& key,
                    const std::vector<std::uint8_t>& data,
                    const std::string& file_name,
                    EncryptedFile& out,
                    Error& error,
                    const ProgressCallback& on_progress = {},
                    const CancellationToken* cancel = nullptr) const;

  bool DecryptToMemory(const EncryptedFile& file,
                       const ContentKey& key,
                       std::vector<std::uint8_t>& out,
                       Error& error,
                       const ProgressCallback& on_progress = {},
                       const CancellationToken* cancel = nullptr) const;
  bool DecryptToFile(const EncryptedFile& file,
                     const ContentKey& key,
                     const std::filesystem::path& output,
                     Error& error,
                     const ProgressCallback& on_progress = {},
                     const CancellationToken* cancel = nullptr) const;

  static bool SealSingle(const ContentKey& key,
                         const std::vector<std::uint8_t>& data,
                         const std::string& file_name,
                         SingleFileEnvelope& out,
                         Error& error);
  // kMasterIntegrityMismatch when the tag does not verify.
  static bool OpenSingle(const SingleFileEnvelope& envelope,
                         const ContentKey& key,
                         std::vector<std::uint8_t>& out,
                         Error& error);

 private:
  FilesConfig cfg_;
  ChunkedFileCipher chunked_;
};

}  // namespace lipseal::client

#endif  // LIPSEAL_FILE_CIPHER_H
