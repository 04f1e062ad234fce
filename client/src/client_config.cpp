#include "client_config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <string>

namespace lipseal::client {

namespace {

constexpr std::uint32_t kMinChunkSize = 4u * 1024u;
constexpr std::uint32_t kMaxChunkSize = 64u * 1024u * 1024u;
constexpr std::uint32_t kMinArgon2Blocks = 8;
constexpr std::uint32_t kMaxArgon2Blocks = 256u * 1024u;

std::string Trim(const std::string& s) {
  const auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
  auto b = std::find_if_not(s.begin(), s.end(), is_space);
  auto e = std::find_if_not(s.rbegin(), s.rend(), is_space).base();
  if (b >= e) return {};
  return std::string(b, e);
}

std::string StripInlineComment(const std::string& input) {
  for (std::size_t i = 0; i < input.size(); ++i) {
    const char ch = input[i];
    if ((ch == '#' || ch == ';') &&
        (i == 0 ||
         std::isspace(static_cast<unsigned char>(input[i - 1])) != 0)) {
      return Trim(input.substr(0, i));
    }
  }
  return input;
}

bool ParseUint32(const std::string& text, std::uint32_t& out) {
  if (text.empty() || text.front() == '-') return false;
  char* end_ptr = nullptr;
  const unsigned long long v = std::strtoull(text.c_str(), &end_ptr, 10);
  if (end_ptr == text.c_str() || *end_ptr != '\0' || v > 0xFFFFFFFFull) {
    return false;
  }
  out = static_cast<std::uint32_t>(v);
  return true;
}

std::string ToLower(std::string s) {
  for (auto& ch : s) {
    ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  }
  return s;
}

bool ParseBool(const std::string& text, bool& out) {
  const std::string t = ToLower(text);
  if (t == "1" || t == "true" || t == "on" || t == "yes") {
    out = true;
    return true;
  }
  if (t == "0" || t == "false" || t == "off" || t == "no") {
    out = false;
    return true;
  }
  return false;
}

bool BadValue(const std::string& key, std::size_t line_no,
              std::string& error) {
  error = "invalid " + key + " at line " + std::to_string(line_no);
  return false;
}

bool Validate(const E2eeConfig& cfg, std::string& error) {
  if (cfg.state_dir.empty()) {
    error = "state_dir empty";
    return false;
  }
  if (cfg.files.chunk_size < kMinChunkSize ||
      cfg.files.chunk_size > kMaxChunkSize) {
    error = "chunk_size out of range";
    return false;
  }
  if (cfg.files.chunked_threshold == 0) {
    error = "chunked_threshold must be > 0";
    return false;
  }
  if (cfg.backup.min_password_len < 8) {
    error = "min_password_len must be >= 8";
    return false;
  }
  if (cfg.backup.argon2_blocks < kMinArgon2Blocks ||
      cfg.backup.argon2_blocks > kMaxArgon2Blocks) {
    error = "argon2_blocks out of range";
    return false;
  }
  if (cfg.backup.argon2_passes == 0 || cfg.backup.argon2_passes > 64) {
    error = "argon2_passes out of range";
    return false;
  }
  if (cfg.backup.max_restore_attempts == 0) {
    error = "max_restore_attempts must be > 0";
    return false;
  }
  return true;
}

}  // namespace

bool LoadE2eeConfig(const std::string& path, E2eeConfig& out_cfg,
                    std::string& error) {
  error.clear();
  out_cfg = E2eeConfig{};
  std::ifstream f(path);
  if (!f.is_open()) {
    error = "e2ee config not found: " + path;
    return false;
  }
  std::string section;
  std::string line;
  std::size_t line_no = 0;
  while (std::getline(f, line)) {
    ++line_no;
    std::string t = StripInlineComment(Trim(line));
    if (t.empty()) continue;
    if (t.front() == '[' && t.back() == ']') {
      section = ToLower(Trim(t.substr(1, t.size() - 2)));
      continue;
    }
    const auto pos = t.find('=');
    if (pos == std::string::npos) {
      error = "invalid line " + std::to_string(line_no);
      return false;
    }
    const std::string key = Trim(t.substr(0, pos));
    const std::string val = StripInlineComment(Trim(t.substr(pos + 1)));
    if (section == "e2ee") {
      if (key == "state_dir") {
        out_cfg.state_dir = val;
      } else if (key == "wrap_secure_store") {
        if (!ParseBool(val, out_cfg.wrap_secure_store)) {
          return BadValue(key, line_no, error);
        }
      }
    } else if (section == "files") {
      if (key == "chunk_size") {
        if (!ParseUint32(val, out_cfg.files.chunk_size)) {
          return BadValue(key, line_no, error);
        }
      } else if (key == "chunked_threshold") {
        if (!ParseUint32(val, out_cfg.files.chunked_threshold)) {
          return BadValue(key, line_no, error);
        }
      }
    } else if (section == "backup") {
      std::uint32_t* target = nullptr;
      if (key == "min_password_len") {
        target = &out_cfg.backup.min_password_len;
      } else if (key == "argon2_blocks") {
        target = &out_cfg.backup.argon2_blocks;
      } else if (key == "argon2_passes") {
        target = &out_cfg.backup.argon2_passes;
      } else if (key == "max_restore_attempts") {
        target = &out_cfg.backup.max_restore_attempts;
      }
      if (target && !ParseUint32(val, *target)) {
        return BadValue(key, line_no, error);
      }
    } else if (section == "log") {
      if (key == "level" &&
          !platform::log::ParseLevel(val, out_cfg.log_level)) {
        return BadValue(key, line_no, error);
      }
    }
  }
  return Validate(out_cfg, error);
}

}  // namespace lipseal::client
