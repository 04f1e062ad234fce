#include "file_cipher.h"

#include <cstring>
#include <utility>

#include "base64_utils.h"
#include "constant_time.h"
#include "hex_utils.h"
#include "message_cipher.h"
#include "monocypher.h"
#include "platform_fs.h"
#include "platform_random.h"
#include "secure_buffer.h"

namespace lipseal::client {

namespace {

constexpr char kSingleLabel[] = "single";

std::string SingleTagHex(const ContentKey& mac_key,
                         const EnvelopeIv& iv,
                         const std::vector<std::uint8_t>& cipher) {
  std::uint8_t le_size[8];
  const std::uint64_t size = cipher.size();
  for (int i = 0; i < 8; ++i) {
    le_size[i] = static_cast<std::uint8_t>(size >> (8 * i));
  }
  std::uint8_t tag[32];
  crypto_blake2b_ctx ctx;
  crypto_blake2b_keyed_init(&ctx, sizeof(tag), mac_key.data(), mac_key.size());
  crypto_blake2b_update(&ctx,
                        reinterpret_cast<const std::uint8_t*>(kSingleLabel),
                        sizeof(kSingleLabel) - 1);
  crypto_blake2b_update(&ctx, iv.data(), iv.size());
  crypto_blake2b_update(&ctx, le_size, sizeof(le_size));
  crypto_blake2b_update(&ctx, cipher.data(), cipher.size());
  crypto_blake2b_final(&ctx, tag);
  return common::BytesToHex(tag, sizeof(tag));
}

void ReportSingle(const ProgressCallback& on_progress,
                  FilePhase phase,
                  double percentage,
                  std::uint64_t processed,
                  std::uint64_t total) {
  if (!on_progress) {
    return;
  }
  FileProgress p;
  p.phase = phase;
  p.current_chunk = phase == FilePhase::kReading ? 0 : 1;
  p.total_chunks = 1;
  p.percentage = percentage;
  p.bytes_processed = processed;
  p.total_bytes = total;
  on_progress(p);
}

}  // namespace

FileCipher::FileCipher(FilesConfig cfg) : cfg_(cfg), chunked_(cfg) {}

bool FileCipher::SealSingle(const ContentKey& key,
                            const std::vector<std::uint8_t>& data,
                            const std::string& file_name,
                            SingleFileEnvelope& out,
                            Error& error) {
  error.Clear();
  out = SingleFileEnvelope{};
  FileKeys keys;
  DeriveFileKeys(key, keys);
  EnvelopeIv iv{};
  if (!platform::RandomBytes(iv.data(), iv.size())) {
    return Fail(error, ErrorCode::kCryptoFailure, "rng failed");
  }
  std::vector<std::uint8_t> cipher(data.size());
  ApplyKeystream(keys.enc, iv, 0, data.data(), data.size(), cipher.data());

  out.file_name = file_name;
  out.file_type = MimeTypeForFileName(file_name);
  out.iv = common::Base64Encode(iv.data(), iv.size());
  out.auth_tag = SingleTagHex(keys.mac, iv, cipher);
  out.encrypted_data = common::Base64Encode(cipher);
  out.original_size = data.size();
  out.encrypted_size = cipher.size();
  return true;
}

bool FileCipher::OpenSingle(const SingleFileEnvelope& envelope,
                            const ContentKey& key,
                            std::vector<std::uint8_t>& out,
                            Error& error) {
  error.Clear();
  out.clear();
  std::vector<std::uint8_t> iv_raw;
  std::vector<std::uint8_t> cipher;
  EnvelopeIv iv{};
  if (!common::Base64Decode(envelope.iv, iv_raw) || iv_raw.size() != iv.size() ||
      !common::Base64Decode(envelope.encrypted_data, cipher)) {
    return Fail(error, ErrorCode::kMalformedPayload, "file envelope invalid");
  }
  std::memcpy(iv.data(), iv_raw.data(), iv.size());

  FileKeys keys;
  DeriveFileKeys(key, keys);
  if (!common::ConstantTimeEqual(SingleTagHex(keys.mac, iv, cipher),
                                 envelope.auth_tag)) {
    return Fail(error, ErrorCode::kMasterIntegrityMismatch,
                "file auth tag mismatch");
  }
  if (cipher.size() != envelope.original_size) {
    return Fail(error, ErrorCode::kMalformedPayload, "file size mismatch");
  }
  out.resize(cipher.size());
  ApplyKeystream(keys.enc, iv, 0, cipher.data(), cipher.size(), out.data());
  return true;
}

bool FileCipher::EncryptBytes(const ContentKey& key,
                              const std::vector<std::uint8_t>& data,
                              const std::string& file_name,
                              EncryptedFile& out,
                              Error& error,
                              const ProgressCallback& on_progress,
                              const CancellationToken* cancel) const {
  error.Clear();
  out = EncryptedFile{};
  if (UsesChunkedFormat(data.size())) {
    out.chunked = true;
    return chunked_.EncryptBytes(key, data, file_name, out.chunked_file, error,
                                 on_progress, cancel);
  }
  if (cancel && cancel->IsCancelled()) {
    return Fail(error, ErrorCode::kCancelled, "operation cancelled");
  }
  ReportSingle(on_progress, FilePhase::kReading, 0.0, 0, data.size());
  if (!SealSingle(key, data, file_name, out.single, error)) {
    return false;
  }
  ReportSingle(on_progress, FilePhase::kFinalizing, 100.0, data.size(),
               data.size());
  return true;
}

bool FileCipher::EncryptFile(const ContentKey& key,
                             const std::filesystem::path& input,
                             const std::string& file_name,
                             EncryptedFile& out,
                             Error& error,
                             const ProgressCallback& on_progress,
                             const CancellationToken* cancel) const {
  error.Clear();
  out = EncryptedFile{};
  std::error_code ec;
  const std::uint64_t size = platform::fs::FileSize(input, ec);
  if (ec) {
    return Fail(error, ErrorCode::kIoError,
                "input not readable: " + input.string());
  }
  const std::string name =
      file_name.empty() ? input.filename().string() : file_name;
  if (UsesChunkedFormat(size)) {
    out.chunked = true;
    return chunked_.EncryptFile(key, input, name, out.chunked_file, error,
                                on_progress, cancel);
  }
  std::vector<std::uint8_t> data;
  if (!platform::fs::ReadAll(input, data, ec)) {
    return Fail(error, ErrorCode::kIoError, "read input failed: " + ec.message());
  }
  common::ScopedWipe wipe_data(data);
  return EncryptBytes(key, data, name, out, error, on_progress, cancel);
}

bool FileCipher::DecryptToMemory(const EncryptedFile& file,
                                 const ContentKey& key,
                                 std::vector<std::uint8_t>& out,
                                 Error& error,
                                 const ProgressCallback& on_progress,
                                 const CancellationToken* cancel) const {
  if (file.chunked) {
    return chunked_.DecryptToMemory(file.chunked_file, key, out, error,
                                    on_progress, cancel);
  }
  if (cancel && cancel->IsCancelled()) {
    out.clear();
    return Fail(error, ErrorCode::kCancelled, "operation cancelled");
  }
  const std::uint64_t total = file.single.original_size;
  ReportSingle(on_progress, FilePhase::kDecrypting, 0.0, 0, total);
  if (!OpenSingle(file.single, key, out, error)) {
    return false;
  }
  ReportSingle(on_progress, FilePhase::kFinalizing, 100.0, total, total);
  return true;
}

bool FileCipher::DecryptToFile(const EncryptedFile& file,
                               const ContentKey& key,
                               const std::filesystem::path& output,
                               Error& error,
                               const ProgressCallback& on_progress,
                               const CancellationToken* cancel) const {
  if (file.chunked) {
    return chunked_.DecryptToFile(file.chunked_file, key, output, error,
                                  on_progress, cancel);
  }
  std::vector<std::uint8_t> plain;
  if (!DecryptToMemory(file, key, plain, error, on_progress, cancel)) {
    return false;
  }
  common::ScopedWipe wipe_plain(plain);
  std::error_code ec;
  const auto parent =
      output.has_parent_path() ? output.parent_path() : std::filesystem::path{};
  if (!parent.empty() && !platform::fs::CreateDirectories(parent, ec)) {
    return Fail(error, ErrorCode::kIoError,
                "create output dir failed: " + ec.message());
  }
  if (!platform::fs::AtomicWrite(output, plain.data(), plain.size(), ec)) {
    return Fail(error, ErrorCode::kIoError,
                "write output file failed: " + ec.message());
  }
  return true;
}

}  // namespace lipseal::client
