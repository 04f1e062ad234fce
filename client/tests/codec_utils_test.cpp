#include <cassert>
#include <cstdint>
#include <string>
#include <vector>

#include "base64_utils.h"
#include "constant_time.h"
#include "hex_utils.h"

using lipseal::common::Base64Decode;
using lipseal::common::Base64Encode;
using lipseal::common::Base64EncodedSize;
using lipseal::common::BytesToHex;
using lipseal::common::ConstantTimeEqual;
using lipseal::common::HexToBytes;
using lipseal::common::KeyFingerprintHex;

namespace {

std::vector<std::uint8_t> Bytes(const std::string& s) {
  return std::vector<std::uint8_t>(s.begin(), s.end());
}

}  // namespace

int main() {
  {
    assert(Base64Encode(Bytes("")) == "");
    assert(Base64Encode(Bytes("f")) == "Zg==");
    assert(Base64Encode(Bytes("fo")) == "Zm8=");
    assert(Base64Encode(Bytes("foo")) == "Zm9v");
    assert(Base64Encode(Bytes("foobar")) == "Zm9vYmFy");
    assert(Base64EncodedSize(0) == 0);
    assert(Base64EncodedSize(1) == 4);
    assert(Base64EncodedSize(16) == 24);
  }

  {
    std::vector<std::uint8_t> out;
    assert(Base64Decode("Zm9vYg==", out));
    assert(out == Bytes("foob"));
    assert(Base64Decode("", out));
    assert(out.empty());

    assert(!Base64Decode("Zm9", out));
    assert(!Base64Decode("Zm9v!A==", out));
    assert(!Base64Decode("Zg=v", out));
    assert(!Base64Decode("Z===", out));
  }

  {
    std::vector<std::uint8_t> all(256);
    for (std::size_t i = 0; i < all.size(); ++i) {
      all[i] = static_cast<std::uint8_t>(i);
    }
    std::vector<std::uint8_t> back;
    assert(Base64Decode(Base64Encode(all), back));
    assert(back == all);
  }

  {
    std::vector<std::uint8_t> large(200000);
    for (std::size_t i = 0; i < large.size(); ++i) {
      large[i] = static_cast<std::uint8_t>((i * 31) ^ (i >> 8));
    }
    const std::string text = Base64Encode(large);
    assert(text.size() == Base64EncodedSize(large.size()));
    assert(text.compare(text.size() - 2, 2, "==") != 0);
    assert(text.back() == '=');
    std::vector<std::uint8_t> back;
    assert(Base64Decode(text, back));
    assert(back == large);

    assert(!Base64Decode("====", back));
    assert(back.empty());
    assert(!Base64Decode("Zm9vZg==Zm9v", back));
    assert(!Base64Decode(" Zm9", back));
  }

  {
    const std::vector<std::uint8_t> raw = {0x00, 0x01, 0xab, 0xff};
    assert(BytesToHex(raw) == "0001abff");
    std::vector<std::uint8_t> out;
    assert(HexToBytes(std::string("0001ABff"), out));
    assert(out == raw);
    assert(!HexToBytes(std::string("abc"), out));
    assert(!HexToBytes(std::string("zz"), out));
  }

  {
    const std::vector<std::uint8_t> key(32, 0x42);
    const std::string fp = KeyFingerprintHex(key.data(), key.size());
    assert(!fp.empty());
    assert(fp == KeyFingerprintHex(key.data(), key.size()));
    assert(fp != BytesToHex(key));
  }

  {
    assert(ConstantTimeEqual("abcdef", "abcdef"));
    assert(!ConstantTimeEqual("abcdef", "abcdeg"));
    assert(!ConstantTimeEqual("abc", "abcdef"));
    assert(ConstantTimeEqual("", ""));
  }

  return 0;
}
