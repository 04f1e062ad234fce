#include "chunked_file_cipher.h"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <fstream>
#include <limits>
#include <unordered_map>
#include <utility>

#include "base64_utils.h"
#include "constant_time.h"
#include "hex_utils.h"
#include "message_cipher.h"
#include "monocypher.h"
#include "platform_fs.h"
#include "platform_log.h"
#include "platform_random.h"
#include "secure_buffer.h"

namespace lipseal::client {

namespace {

constexpr char kLogTag[] = "file_cipher";
constexpr char kFileKeyLabel[] = "lipseal/file-key/v1";
constexpr char kEncLabel[] = "enc";
constexpr char kMacLabel[] = "mac";
constexpr char kMasterLabel[] = "master";
constexpr std::size_t kFileIdBytes = 16;
constexpr std::size_t kTagBytes = 32;
constexpr std::uint64_t kMaxReserveBytes = 256ull * 1024 * 1024;

const std::uint8_t* Bytes(const char* s) {
  return reinterpret_cast<const std::uint8_t*>(s);
}

std::string ChunkTagHex(const ContentKey& mac_key,
                        const std::string& file_id,
                        std::uint32_t index,
                        const std::uint8_t* cipher,
                        std::size_t cipher_len) {
  std::uint8_t le_index[4];
  for (int i = 0; i < 4; ++i) {
    le_index[i] = static_cast<std::uint8_t>(index >> (8 * i));
  }
  std::uint8_t tag[kTagBytes];
  crypto_blake2b_ctx ctx;
  crypto_blake2b_keyed_init(&ctx, sizeof(tag), mac_key.data(), mac_key.size());
  crypto_blake2b_update(&ctx, Bytes(file_id.data()), file_id.size());
  crypto_blake2b_update(&ctx, le_index, sizeof(le_index));
  crypto_blake2b_update(&ctx, cipher, cipher_len);
  crypto_blake2b_final(&ctx, tag);
  return common::BytesToHex(tag, sizeof(tag));
}

std::string MasterTagHex(const ContentKey& mac_key,
                         const std::string& file_id,
                         const std::vector<FileChunk>& chunks) {
  std::uint8_t tag[kTagBytes];
  crypto_blake2b_ctx ctx;
  crypto_blake2b_keyed_init(&ctx, sizeof(tag), mac_key.data(), mac_key.size());
  crypto_blake2b_update(&ctx, Bytes(file_id.data()), file_id.size());
  crypto_blake2b_update(&ctx, Bytes(kMasterLabel), sizeof(kMasterLabel) - 1);
  for (std::size_t i = 0; i < chunks.size(); ++i) {
    if (i > 0) {
      crypto_blake2b_update(&ctx, Bytes(":"), 1);
    }
    const std::string& t = chunks[i].auth_tag;
    crypto_blake2b_update(&ctx, Bytes(t.data()), t.size());
  }
  crypto_blake2b_final(&ctx, tag);
  return common::BytesToHex(tag, sizeof(tag));
}

void Report(const ProgressCallback& on_progress,
            FilePhase phase,
            std::uint32_t current,
            std::uint32_t total,
            double percentage,
            std::uint64_t processed,
            std::uint64_t total_bytes) {
  if (!on_progress) {
    return;
  }
  FileProgress p;
  p.phase = phase;
  p.current_chunk = current;
  p.total_chunks = total;
  p.percentage = percentage;
  p.bytes_processed = processed;
  p.total_bytes = total_bytes;
  on_progress(p);
}

bool StopRequested(const CancellationToken* cancel, Error& error) {
  if (!cancel || !cancel->IsCancelled()) {
    return false;
  }
  error.code = ErrorCode::kCancelled;
  error.message = "operation cancelled";
  error.chunk_index = 0;
  return true;
}

bool ChunkFail(Error& error, std::uint32_t index, const std::string& what) {
  error.code = ErrorCode::kChunkIntegrityMismatch;
  error.message = "chunk " + std::to_string(index) + " " + what;
  error.chunk_index = index;
  return false;
}

}  // namespace

const char* FilePhaseName(FilePhase phase) {
  switch (phase) {
    case FilePhase::kReading:
      return "reading";
    case FilePhase::kEncrypting:
      return "encrypting";
    case FilePhase::kDecrypting:
      return "decrypting";
    case FilePhase::kFinalizing:
      return "finalizing";
  }
  return "unknown";
}

std::string MimeTypeForFileName(const std::string& file_name) {
  static const std::unordered_map<std::string, std::string> kTypes = {
      {"mp4", "video/mp4"},
      {"mov", "video/quicktime"},
      {"avi", "video/x-msvideo"},
      {"mkv", "video/x-matroska"},
      {"webm", "video/webm"},
      {"m4v", "video/x-m4v"},
      {"3gp", "video/3gpp"},
      {"mp3", "audio/mpeg"},
      {"wav", "audio/wav"},
      {"m4a", "audio/mp4"},
      {"aac", "audio/aac"},
      {"ogg", "audio/ogg"},
      {"flac", "audio/flac"},
      {"jpg", "image/jpeg"},
      {"jpeg", "image/jpeg"},
      {"png", "image/png"},
      {"gif", "image/gif"},
      {"webp", "image/webp"},
      {"svg", "image/svg+xml"},
      {"heic", "image/heic"},
      {"pdf", "application/pdf"},
      {"doc", "application/msword"},
      {"docx",
       "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
      {"xls", "application/vnd.ms-excel"},
      {"xlsx",
       "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"},
      {"ppt", "application/vnd.ms-powerpoint"},
      {"pptx",
       "application/"
       "vnd.openxmlformats-officedocument.presentationml.presentation"},
      {"txt", "text/plain"},
      {"zip", "application/zip"},
      {"rar", "application/x-rar-compressed"},
      {"7z", "application/x-7z-compressed"},
      {"tar", "application/x-tar"},
      {"gz", "application/gzip"},
  };
  const auto dot = file_name.rfind('.');
  if (dot != std::string::npos && dot + 1 < file_name.size()) {
    std::string ext = file_name.substr(dot + 1);
    for (auto& ch : ext) {
      ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    const auto it = kTypes.find(ext);
    if (it != kTypes.end()) {
      return it->second;
    }
  }
  return "application/octet-stream";
}

FileKeys::~FileKeys() {
  common::SecureWipe(enc);
  common::SecureWipe(mac);
}

void DeriveFileKeys(const ContentKey& content_key, FileKeys& out) {
  ContentKey file_key{};
  common::ScopedWipe wipe_file_key(file_key);
  crypto_blake2b_ctx ctx;
  crypto_blake2b_init(&ctx, file_key.size());
  crypto_blake2b_update(&ctx, Bytes(kFileKeyLabel), sizeof(kFileKeyLabel) - 1);
  crypto_blake2b_update(&ctx, content_key.data(), content_key.size());
  crypto_blake2b_final(&ctx, file_key.data());

  crypto_blake2b_keyed(out.enc.data(), out.enc.size(), file_key.data(),
                       file_key.size(), Bytes(kEncLabel),
                       sizeof(kEncLabel) - 1);
  crypto_blake2b_keyed(out.mac.data(), out.mac.size(), file_key.data(),
                       file_key.size(), Bytes(kMacLabel),
                       sizeof(kMacLabel) - 1);
}

ChunkedFileCipher::ChunkedFileCipher(FilesConfig cfg) : cfg_(cfg) {
  if (cfg_.chunk_size == 0) {
    cfg_.chunk_size = kDefaultChunkSize;
  }
}

std::uint32_t ChunkedFileCipher::ChunkCountFor(std::uint64_t size) const {
  const std::uint64_t count =
      (size + cfg_.chunk_size - 1) / static_cast<std::uint64_t>(cfg_.chunk_size);
  if (count > std::numeric_limits<std::uint32_t>::max()) {
    return 0;
  }
  return static_cast<std::uint32_t>(count);
}

bool ChunkedFileCipher::EncryptFrom(const ContentKey& key,
                                    std::uint64_t size,
                                    const ChunkReader& read,
                                    const std::string& file_name,
                                    ChunkedFile& out,
                                    Error& error,
                                    const ProgressCallback& on_progress,
                                    const CancellationToken* cancel) const {
  error.Clear();
  out = ChunkedFile{};
  if (size == 0) {
    return Fail(error, ErrorCode::kInvalidArgument,
                "empty input cannot be chunked");
  }
  const std::uint32_t total = ChunkCountFor(size);
  if (total == 0) {
    return Fail(error, ErrorCode::kInvalidArgument, "input too large");
  }

  ChunkedFile result;
  std::uint8_t id_bytes[kFileIdBytes];
  EnvelopeIv master_iv{};
  if (!platform::RandomBytes(id_bytes, sizeof(id_bytes)) ||
      !platform::RandomBytes(master_iv.data(), master_iv.size())) {
    return Fail(error, ErrorCode::kCryptoFailure, "rng failed");
  }
  result.file_id = common::BytesToHex(id_bytes, sizeof(id_bytes));
  result.master_iv = common::Base64Encode(master_iv.data(), master_iv.size());
  result.file_name = file_name;
  result.file_type = MimeTypeForFileName(file_name);
  result.total_chunks = total;
  result.original_size = size;
  result.chunks.reserve(total);

  FileKeys keys;
  DeriveFileKeys(key, keys);

  Report(on_progress, FilePhase::kReading, 0, total, 0.0, 0, size);

  std::vector<std::uint8_t> plain(cfg_.chunk_size);
  common::ScopedWipe wipe_plain(plain);
  std::vector<std::uint8_t> cipher(cfg_.chunk_size);
  for (std::uint32_t i = 0; i < total; ++i) {
    if (StopRequested(cancel, error)) {
      return false;
    }
    const std::uint64_t offset =
        static_cast<std::uint64_t>(i) * cfg_.chunk_size;
    const std::size_t len = static_cast<std::size_t>(
        std::min<std::uint64_t>(cfg_.chunk_size, size - offset));
    Report(on_progress, FilePhase::kEncrypting, i + 1, total,
           10.0 + (static_cast<double>(i) / total) * 85.0,
           std::min<std::uint64_t>(offset + len, size), size);

    if (!read(offset, len, plain.data(), error)) {
      return false;
    }
    FileChunk chunk;
    chunk.index = i;
    EnvelopeIv iv{};
    if (!platform::RandomBytes(iv.data(), iv.size())) {
      return Fail(error, ErrorCode::kCryptoFailure, "rng failed");
    }
    ApplyKeystream(keys.enc, iv, i, plain.data(), len, cipher.data());
    chunk.iv = common::Base64Encode(iv.data(), iv.size());
    chunk.auth_tag =
        ChunkTagHex(keys.mac, result.file_id, i, cipher.data(), len);
    chunk.encrypted_data = common::Base64Encode(cipher.data(), len);
    chunk.original_size = len;
    chunk.encrypted_size = len;
    result.encrypted_size += len;
    result.chunks.push_back(std::move(chunk));
  }

  result.master_auth_tag = MasterTagHex(keys.mac, result.file_id, result.chunks);
  Report(on_progress, FilePhase::kFinalizing, total, total, 100.0, size, size);

  platform::log::Log(platform::log::Level::kDebug, kLogTag, "file encrypted",
                     {{"file_id", result.file_id},
                      {"chunks", std::to_string(total)},
                      {"bytes", std::to_string(size)}});
  out = std::move(result);
  return true;
}

bool ChunkedFileCipher::EncryptFile(const ContentKey& key,
                                    const std::filesystem::path& input,
                                    const std::string& file_name,
                                    ChunkedFile& out,
                                    Error& error,
                                    const ProgressCallback& on_progress,
                                    const CancellationToken* cancel) const {
  error.Clear();
  std::error_code ec;
  if (!platform::fs::IsRegularFile(input, ec)) {
    return Fail(error, ErrorCode::kIoError,
                "input not found: " + input.string());
  }
  const std::uint64_t size = platform::fs::FileSize(input, ec);
  if (ec) {
    return Fail(error, ErrorCode::kIoError, "stat failed: " + ec.message());
  }
  std::ifstream ifs(input, std::ios::binary);
  if (!ifs) {
    return Fail(error, ErrorCode::kIoError, "open input failed");
  }
  const ChunkReader read = [&ifs](std::uint64_t offset, std::size_t len,
                                  std::uint8_t* dst, Error& err) {
    ifs.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    ifs.read(reinterpret_cast<char*>(dst), static_cast<std::streamsize>(len));
    if (!ifs || static_cast<std::size_t>(ifs.gcount()) != len) {
      return Fail(err, ErrorCode::kIoError, "short read");
    }
    return true;
  };
  return EncryptFrom(key, size, read,
                     file_name.empty() ? input.filename().string() : file_name,
                     out, error, on_progress, cancel);
}

bool ChunkedFileCipher::EncryptBytes(const ContentKey& key,
                                     const std::vector<std::uint8_t>& data,
                                     const std::string& file_name,
                                     ChunkedFile& out,
                                     Error& error,
                                     const ProgressCallback& on_progress,
                                     const CancellationToken* cancel) const {
  const ChunkReader read = [&data](std::uint64_t offset, std::size_t len,
                                   std::uint8_t* dst, Error&) {
    std::memcpy(dst, data.data() + offset, len);
    return true;
  };
  return EncryptFrom(key, data.size(), read, file_name, out, error,
                     on_progress, cancel);
}

bool ChunkedFileCipher::DecryptInto(const ChunkedFile& file,
                                    const ContentKey& key,
                                    const ChunkWriter& write,
                                    Error& error,
                                    const ProgressCallback& on_progress,
                                    const CancellationToken* cancel) const {
  error.Clear();
  if (file.file_id.empty() || file.chunks.empty() ||
      file.master_auth_tag.empty()) {
    return Fail(error, ErrorCode::kMalformedPayload, "chunked file incomplete");
  }

  FileKeys keys;
  DeriveFileKeys(key, keys);

  const std::string expected_master =
      MasterTagHex(keys.mac, file.file_id, file.chunks);
  if (!common::ConstantTimeEqual(expected_master, file.master_auth_tag)) {
    platform::log::Log(platform::log::Level::kWarn, kLogTag,
                       "master tag mismatch", {{"file_id", file.file_id}});
    return Fail(error, ErrorCode::kMasterIntegrityMismatch,
                "master auth tag mismatch");
  }

  const std::uint32_t total = file.total_chunks;
  if (total != file.chunks.size()) {
    return Fail(error, ErrorCode::kMalformedPayload, "chunk count mismatch");
  }
  std::uint64_t declared = 0;
  for (std::uint32_t i = 0; i < total; ++i) {
    if (file.chunks[i].index != i) {
      return Fail(error, ErrorCode::kMalformedPayload,
                  "chunk sequence broken at " + std::to_string(i));
    }
    declared += file.chunks[i].original_size;
  }
  if (declared != file.original_size) {
    return Fail(error, ErrorCode::kMalformedPayload, "chunk sizes mismatch");
  }

  std::vector<std::uint8_t> cipher;
  std::vector<std::uint8_t> plain;
  std::vector<std::uint8_t> iv_raw;
  std::uint64_t processed = 0;
  for (std::uint32_t i = 0; i < total; ++i) {
    if (StopRequested(cancel, error)) {
      common::SecureWipe(plain);
      return false;
    }
    const FileChunk& chunk = file.chunks[i];
    Report(on_progress, FilePhase::kDecrypting, i + 1, total,
           (static_cast<double>(i + 1) / total) * 100.0, processed,
           file.original_size);

    if (!common::Base64Decode(chunk.encrypted_data, cipher)) {
      common::SecureWipe(plain);
      return ChunkFail(error, i, "data not decodable");
    }
    const std::string expected =
        ChunkTagHex(keys.mac, file.file_id, i, cipher.data(), cipher.size());
    if (!common::ConstantTimeEqual(expected, chunk.auth_tag)) {
      platform::log::Log(platform::log::Level::kWarn, kLogTag,
                         "chunk tag mismatch",
                         {{"file_id", file.file_id},
                          {"chunk", std::to_string(i)}});
      common::SecureWipe(plain);
      return ChunkFail(error, i, "auth tag mismatch");
    }
    EnvelopeIv iv{};
    if (!common::Base64Decode(chunk.iv, iv_raw) || iv_raw.size() != iv.size() ||
        cipher.size() != chunk.original_size) {
      common::SecureWipe(plain);
      return ChunkFail(error, i, "header invalid");
    }
    std::memcpy(iv.data(), iv_raw.data(), iv.size());
    plain.resize(cipher.size());
    ApplyKeystream(keys.enc, iv, i, cipher.data(), cipher.size(), plain.data());
    if (!write(plain.data(), plain.size(), error)) {
      common::SecureWipe(plain);
      return false;
    }
    processed += plain.size();
  }
  common::SecureWipe(plain);
  Report(on_progress, FilePhase::kFinalizing, total, total, 100.0, processed,
         file.original_size);
  return true;
}

bool ChunkedFileCipher::DecryptToMemory(const ChunkedFile& file,
                                        const ContentKey& key,
                                        std::vector<std::uint8_t>& out,
                                        Error& error,
                                        const ProgressCallback& on_progress,
                                        const CancellationToken* cancel) const {
  out.clear();
  std::vector<std::uint8_t> assembled;
  assembled.reserve(static_cast<std::size_t>(
      std::min<std::uint64_t>(file.original_size, kMaxReserveBytes)));
  const ChunkWriter write = [&assembled](const std::uint8_t* data,
                                         std::size_t len, Error&) {
    assembled.insert(assembled.end(), data, data + len);
    return true;
  };
  if (!DecryptInto(file, key, write, error, on_progress, cancel)) {
    common::SecureWipe(assembled);
    return false;
  }
  out = std::move(assembled);
  return true;
}

bool ChunkedFileCipher::DecryptToFile(const ChunkedFile& file,
                                      const ContentKey& key,
                                      const std::filesystem::path& output,
                                      Error& error,
                                      const ProgressCallback& on_progress,
                                      const CancellationToken* cancel) const {
  error.Clear();
  if (output.empty()) {
    return Fail(error, ErrorCode::kInvalidArgument, "output path empty");
  }
  std::error_code ec;
  const auto parent =
      output.has_parent_path() ? output.parent_path() : std::filesystem::path{};
  if (!parent.empty() && !platform::fs::CreateDirectories(parent, ec)) {
    return Fail(error, ErrorCode::kIoError,
                "create output dir failed: " + ec.message());
  }
  const auto tmp = platform::fs::UniqueTempSibling(output);
  bool ok = false;
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) {
      return Fail(error, ErrorCode::kIoError, "open output file failed");
    }
    const ChunkWriter write = [&ofs](const std::uint8_t* data, std::size_t len,
                                     Error& err) {
      ofs.write(reinterpret_cast<const char*>(data),
                static_cast<std::streamsize>(len));
      if (!ofs) {
        return Fail(err, ErrorCode::kIoError, "write output file failed");
      }
      return true;
    };
    ok = DecryptInto(file, key, write, error, on_progress, cancel);
    if (ok) {
      ofs.flush();
      if (!ofs) {
        ok = Fail(error, ErrorCode::kIoError, "flush output file failed");
      }
    }
  }
  if (ok && !platform::fs::Rename(tmp, output, ec)) {
    ok = Fail(error, ErrorCode::kIoError, "rename output failed: " + ec.message());
  }
  if (!ok) {
    std::error_code ignore_ec;
    platform::fs::Remove(tmp, ignore_ec);
  }
  return ok;
}

}  // namespace lipseal::client
