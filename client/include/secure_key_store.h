#ifndef LIPSEAL_SECURE_KEY_STORE_H
#define LIPSEAL_SECURE_KEY_STORE_H

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

#include "e2ee_error.h"

namespace lipseal::client {

inline constexpr char kDeviceKeyName[] = "e2ee_device_key";
inline constexpr char kPeerKeyPrefix[] = "peer_key_";

std::string PeerKeyName(const std::string& user_id);

// Local, synchronous name -> bytes store. A missing entry is reported with
// found = false and a true return; false is reserved for storage faults
// (kStorageUnavailable).
class SecureKeyStore {
 public:
  virtual ~SecureKeyStore() = default;

  virtual bool Get(const std::string& name,
                   std::vector<std::uint8_t>& out,
                   bool& found,
                   Error& error) = 0;
  virtual bool Set(const std::string& name,
                   const std::vector<std::uint8_t>& value,
                   Error& error) = 0;
  // Deleting a missing entry succeeds.
  virtual bool Delete(const std::string& name, Error& error) = 0;
};

class FileSecureKeyStore final : public SecureKeyStore {
 public:
  FileSecureKeyStore(std::filesystem::path dir, bool wrap_values);

  bool Get(const std::string& name,
           std::vector<std::uint8_t>& out,
           bool& found,
           Error& error) override;
  bool Set(const std::string& name,
           const std::vector<std::uint8_t>& value,
           Error& error) override;
  bool Delete(const std::string& name, Error& error) override;

  std::filesystem::path PathFor(const std::string& name) const;

 private:
  bool EnsureDir(Error& error);

  std::filesystem::path dir_;
  bool wrap_values_{true};
  std::mutex mutex_;
};

}  // namespace lipseal::client

#endif  // LIPSEAL_SECURE_KEY_STORE_H
