#include <cassert>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <utility>
#include <vector>

#include "base64_utils.h"
#include "chunked_file_cipher.h"
#include "test_fakes.h"

using lipseal::client::CancellationToken;
using lipseal::client::ChunkedFile;
using lipseal::client::ChunkedFileCipher;
using lipseal::client::ContentKey;
using lipseal::client::Error;
using lipseal::client::ErrorCode;
using lipseal::client::FilePhase;
using lipseal::client::FileProgress;
using lipseal::client::FilesConfig;
using lipseal::client::MimeTypeForFileName;
using lipseal::test::MakeKey;
using lipseal::test::PatternBytes;

namespace {

constexpr std::uint32_t kChunk = 4096;

FilesConfig SmallChunks() {
  FilesConfig cfg;
  cfg.chunk_size = kChunk;
  cfg.chunked_threshold = 3 * kChunk;
  return cfg;
}

void FlipDataByte(ChunkedFile& file, std::size_t chunk, std::size_t offset) {
  std::vector<std::uint8_t> raw;
  assert(lipseal::common::Base64Decode(file.chunks[chunk].encrypted_data, raw));
  raw[offset] ^= 0x01;
  file.chunks[chunk].encrypted_data = lipseal::common::Base64Encode(raw);
}

std::size_t CountEntries(const std::filesystem::path& dir) {
  std::size_t n = 0;
  for (const auto& entry : std::filesystem::directory_iterator(dir)) {
    (void)entry;
    ++n;
  }
  return n;
}

}  // namespace

int main() {
  const auto dir = lipseal::test::MakeTempDir("lipseal_chunked_file_test");
  const ContentKey key = MakeKey(7);
  const ChunkedFileCipher cipher(SmallChunks());

  {
    assert(MimeTypeForFileName("Clip.MP4") == "video/mp4");
    assert(MimeTypeForFileName("report.pdf") == "application/pdf");
    assert(MimeTypeForFileName("archive.tar.gz") == "application/gzip");
    assert(MimeTypeForFileName("README") == "application/octet-stream");
    assert(MimeTypeForFileName("trailing.") == "application/octet-stream");
  }

  {
    assert(cipher.chunk_size() == kChunk);
    assert(cipher.ChunkCountFor(1) == 1);
    assert(cipher.ChunkCountFor(kChunk) == 1);
    assert(cipher.ChunkCountFor(kChunk + 1) == 2);
    assert(ChunkedFileCipher().chunk_size() == 512u * 1024u);
  }

  const auto data = PatternBytes(3 * kChunk + 100);

  {
    ChunkedFile file;
    Error err;
    std::vector<FileProgress> progress;
    assert(cipher.EncryptBytes(key, data, "movie.mkv", file, err,
                               [&progress](const FileProgress& p) {
                                 progress.push_back(p);
                               }));
    assert(err.ok());
    assert(file.total_chunks == 4);
    assert(file.chunks.size() == 4);
    assert(file.original_size == data.size());
    assert(file.encrypted_size == data.size());
    assert(file.file_type == "video/x-matroska");
    assert(file.file_name == "movie.mkv");
    assert(file.file_id.size() == 32);
    assert(!file.master_auth_tag.empty());
    for (std::uint32_t i = 0; i < 4; ++i) {
      assert(file.chunks[i].index == i);
      assert(file.chunks[i].auth_tag.size() == 64);
    }
    assert(file.chunks[0].original_size == kChunk);
    assert(file.chunks[3].original_size == 100);
    assert(file.chunks[0].iv != file.chunks[1].iv);

    assert(progress.size() == 6);
    assert(progress.front().phase == FilePhase::kReading);
    assert(progress.front().percentage == 0.0);
    assert(progress[1].phase == FilePhase::kEncrypting);
    assert(progress[1].current_chunk == 1);
    assert(progress[1].percentage == 10.0);
    assert(progress.back().phase == FilePhase::kFinalizing);
    assert(progress.back().percentage == 100.0);
    for (std::size_t i = 1; i < progress.size(); ++i) {
      assert(progress[i].percentage >= progress[i - 1].percentage);
    }

    std::vector<std::uint8_t> plain;
    std::vector<FileProgress> dec_progress;
    assert(cipher.DecryptToMemory(file, key, plain, err,
                                  [&dec_progress](const FileProgress& p) {
                                    dec_progress.push_back(p);
                                  }));
    assert(plain == data);
    assert(dec_progress.size() == 5);
    assert(dec_progress[0].phase == FilePhase::kDecrypting);
    assert(dec_progress[0].percentage == 25.0);
    assert(dec_progress[3].percentage == 100.0);
    assert(dec_progress.back().phase == FilePhase::kFinalizing);
  }

  {
    ChunkedFile a;
    ChunkedFile b;
    Error err;
    assert(cipher.EncryptBytes(key, data, "x.bin", a, err));
    assert(cipher.EncryptBytes(key, data, "x.bin", b, err));
    assert(a.file_id != b.file_id);
    assert(a.chunks[0].encrypted_data != b.chunks[0].encrypted_data);
  }

  {
    ChunkedFile file;
    Error err;
    assert(cipher.EncryptBytes(key, data, "flip.bin", file, err));
    FlipDataByte(file, 2, 17);
    std::vector<std::uint8_t> plain;
    assert(!cipher.DecryptToMemory(file, key, plain, err));
    assert(err.code == ErrorCode::kChunkIntegrityMismatch);
    assert(err.chunk_index == 2);
    assert(plain.empty());
  }

  {
    ChunkedFile file;
    Error err;
    assert(cipher.EncryptBytes(key, data, "junk.bin", file, err));
    file.chunks[1].encrypted_data = "***";
    std::vector<std::uint8_t> plain;
    assert(!cipher.DecryptToMemory(file, key, plain, err));
    assert(err.code == ErrorCode::kChunkIntegrityMismatch);
    assert(err.chunk_index == 1);
  }

  {
    ChunkedFile file;
    Error err;
    assert(cipher.EncryptBytes(key, data, "swap.bin", file, err));
    std::swap(file.chunks[0], file.chunks[1]);
    std::vector<std::uint8_t> plain;
    assert(!cipher.DecryptToMemory(file, key, plain, err));
    assert(err.code == ErrorCode::kMasterIntegrityMismatch);
    assert(plain.empty());
  }

  {
    ChunkedFile file;
    Error err;
    assert(cipher.EncryptBytes(key, data, "tag.bin", file, err));
    file.chunks[3].auth_tag[0] = file.chunks[3].auth_tag[0] == '0' ? '1' : '0';
    std::vector<std::uint8_t> plain;
    assert(!cipher.DecryptToMemory(file, key, plain, err));
    assert(err.code == ErrorCode::kMasterIntegrityMismatch);
  }

  {
    ChunkedFile file;
    Error err;
    assert(cipher.EncryptBytes(key, data, "key.bin", file, err));
    std::vector<std::uint8_t> plain;
    assert(!cipher.DecryptToMemory(file, MakeKey(8), plain, err));
    assert(err.code == ErrorCode::kMasterIntegrityMismatch);
  }

  {
    ChunkedFile file;
    Error err;
    assert(cipher.EncryptBytes(key, data, "trunc.bin", file, err));
    file.chunks.pop_back();
    std::vector<std::uint8_t> plain;
    assert(!cipher.DecryptToMemory(file, key, plain, err));
    assert(err.code == ErrorCode::kMasterIntegrityMismatch ||
           err.code == ErrorCode::kMalformedPayload);

    ChunkedFile empty;
    assert(!cipher.DecryptToMemory(empty, key, plain, err));
    assert(err.code == ErrorCode::kMalformedPayload);
  }

  {
    ChunkedFile file;
    Error err;
    assert(!cipher.EncryptBytes(key, {}, "empty.bin", file, err));
    assert(err.code == ErrorCode::kInvalidArgument);
  }

  {
    CancellationToken cancel;
    cancel.Cancel();
    ChunkedFile file;
    Error err;
    assert(!cipher.EncryptBytes(key, data, "c.bin", file, err, {}, &cancel));
    assert(err.code == ErrorCode::kCancelled);
    assert(file.chunks.empty());
  }

  {
    CancellationToken cancel;
    ChunkedFile file;
    Error err;
    assert(!cipher.EncryptBytes(
        key, data, "c.bin", file, err,
        [&cancel](const FileProgress& p) {
          if (p.phase == FilePhase::kEncrypting && p.current_chunk == 2) {
            cancel.Cancel();
          }
        },
        &cancel));
    assert(err.code == ErrorCode::kCancelled);
    assert(file.total_chunks == 0);
  }

  {
    ChunkedFile file;
    Error err;
    assert(cipher.EncryptBytes(key, data, "out.bin", file, err));
    const auto out_dir = dir / "out";
    const auto out_path = out_dir / "restored.bin";
    assert(cipher.DecryptToFile(file, key, out_path, err));
    std::vector<std::uint8_t> written;
    {
      std::ifstream in(out_path, std::ios::binary);
      written.assign(std::istreambuf_iterator<char>(in),
                     std::istreambuf_iterator<char>());
    }
    assert(written == data);
    assert(CountEntries(out_dir) == 1);

    const auto bad_path = out_dir / "tampered.bin";
    FlipDataByte(file, 3, 0);
    assert(!cipher.DecryptToFile(file, key, bad_path, err));
    assert(err.code == ErrorCode::kChunkIntegrityMismatch);
    assert(err.chunk_index == 3);
    assert(!std::filesystem::exists(bad_path));
    assert(CountEntries(out_dir) == 1);
  }

  {
    const auto input = dir / "input.dat";
    {
      std::ofstream out(input, std::ios::binary);
      out.write(reinterpret_cast<const char*>(data.data()),
                static_cast<std::streamsize>(data.size()));
    }
    ChunkedFile file;
    Error err;
    assert(cipher.EncryptFile(key, input, "", file, err));
    assert(file.file_name == "input.dat");
    assert(file.total_chunks == 4);
    std::vector<std::uint8_t> plain;
    assert(cipher.DecryptToMemory(file, key, plain, err));
    assert(plain == data);

    assert(!cipher.EncryptFile(key, dir / "absent.dat", "", file, err));
    assert(err.code == ErrorCode::kIoError);
  }

  return 0;
}
