#include <cassert>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

#include "file_cipher.h"
#include "test_fakes.h"

using lipseal::client::CancellationToken;
using lipseal::client::ContentKey;
using lipseal::client::EncryptedFile;
using lipseal::client::Error;
using lipseal::client::ErrorCode;
using lipseal::client::FileCipher;
using lipseal::client::FilePhase;
using lipseal::client::FileProgress;
using lipseal::client::FilesConfig;
using lipseal::client::SingleFileEnvelope;
using lipseal::test::MakeKey;
using lipseal::test::PatternBytes;

namespace {

constexpr std::uint32_t kChunk = 4096;
constexpr std::uint32_t kThreshold = 4 * kChunk;

FilesConfig SmallFiles() {
  FilesConfig cfg;
  cfg.chunk_size = kChunk;
  cfg.chunked_threshold = kThreshold;
  return cfg;
}

std::vector<std::uint8_t> ReadFile(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  return std::vector<std::uint8_t>(std::istreambuf_iterator<char>(in),
                                   std::istreambuf_iterator<char>());
}

}  // namespace

int main() {
  const auto dir = lipseal::test::MakeTempDir("lipseal_file_cipher_test");
  const ContentKey key = MakeKey(11);
  const FileCipher cipher(SmallFiles());

  {
    assert(!cipher.UsesChunkedFormat(kThreshold));
    assert(cipher.UsesChunkedFormat(kThreshold + 1));
    const FileCipher defaults;
    assert(!defaults.UsesChunkedFormat(5u * 1024u * 1024u));
    assert(defaults.UsesChunkedFormat(5u * 1024u * 1024u + 1));
  }

  {
    const auto data = PatternBytes(kThreshold);
    EncryptedFile file;
    Error err;
    assert(cipher.EncryptBytes(key, data, "photo.jpg", file, err));
    assert(!file.chunked);
    assert(file.single.file_type == "image/jpeg");
    assert(file.single.original_size == data.size());
    assert(file.single.encrypted_size == data.size());
    assert(file.single.auth_tag.size() == 64);

    std::vector<std::uint8_t> plain;
    assert(cipher.DecryptToMemory(file, key, plain, err));
    assert(plain == data);

    std::vector<std::uint8_t> wrong;
    assert(!cipher.DecryptToMemory(file, MakeKey(12), wrong, err));
    assert(err.code == ErrorCode::kMasterIntegrityMismatch);
    assert(wrong.empty());
  }

  {
    const auto data = PatternBytes(kThreshold + 1);
    EncryptedFile file;
    Error err;
    std::vector<FileProgress> progress;
    assert(cipher.EncryptBytes(key, data, "big.bin", file, err,
                               [&progress](const FileProgress& p) {
                                 progress.push_back(p);
                               }));
    assert(file.chunked);
    assert(file.chunked_file.total_chunks == 5);
    assert(file.chunked_file.chunks.back().original_size == 1);
    assert(progress.back().phase == FilePhase::kFinalizing);

    const auto out_path = dir / "big.out";
    assert(cipher.DecryptToFile(file, key, out_path, err));
    assert(ReadFile(out_path) == data);
  }

  {
    const auto data = PatternBytes(300);
    SingleFileEnvelope env;
    Error err;
    assert(FileCipher::SealSingle(key, data, "notes.txt", env, err));
    assert(env.file_type == "text/plain");

    SingleFileEnvelope tampered = env;
    tampered.auth_tag[5] = tampered.auth_tag[5] == 'a' ? 'b' : 'a';
    std::vector<std::uint8_t> plain;
    assert(!FileCipher::OpenSingle(tampered, key, plain, err));
    assert(err.code == ErrorCode::kMasterIntegrityMismatch);

    tampered = env;
    tampered.iv = "bad";
    assert(!FileCipher::OpenSingle(tampered, key, plain, err));
    assert(err.code == ErrorCode::kMalformedPayload);

    assert(FileCipher::OpenSingle(env, key, plain, err));
    assert(plain == data);
  }

  {
    const auto data = PatternBytes(2 * kChunk);
    const auto input = dir / "clip.mov";
    {
      std::ofstream out(input, std::ios::binary);
      out.write(reinterpret_cast<const char*>(data.data()),
                static_cast<std::streamsize>(data.size()));
    }
    EncryptedFile file;
    Error err;
    assert(cipher.EncryptFile(key, input, "", file, err));
    assert(!file.chunked);
    assert(file.single.file_name == "clip.mov");
    assert(file.single.file_type == "video/quicktime");

    const auto out_path = dir / "nested" / "clip.mov";
    assert(cipher.DecryptToFile(file, key, out_path, err));
    assert(ReadFile(out_path) == data);
  }

  {
    CancellationToken cancel;
    cancel.Cancel();
    EncryptedFile file;
    Error err;
    assert(!cipher.EncryptBytes(key, PatternBytes(10), "a.txt", file, err, {},
                                &cancel));
    assert(err.code == ErrorCode::kCancelled);
  }

  return 0;
}
