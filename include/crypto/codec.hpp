#ifndef MEDIAVAULT_CODEC_HPP
#define MEDIAVAULT_CODEC_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "crypto_error.hpp"

namespace mediavault::crypto {

// Keystream and validation flag derived from one passphrase
struct KeyMaterial {
  std::string keystream;  // hex SHA-224 of the domain string
  std::string flag;       // hex SHA-256 of the domain string
};

// Derives key material for a passphrase using OpenSSL EVP digests
KeyMaterial derive_key(const std::string& passphrase);

// Rotates every group of group_size bytes by step positions to the right
// (left when step is negative). A trailing short group rotates within its length.
std::vector<uint8_t> rotate_groups(const std::vector<uint8_t>& data, std::size_t group_size, int step);

// XORs data with key repeated cyclically
std::vector<uint8_t> xor_keystream(const std::vector<uint8_t>& data, const std::string& key);

// Obfuscating codec for the metadata document and image payloads.
// NOTE: provides no integrity protection; corrupted payloads decode to altered bytes.
class Codec {
public:
  static constexpr std::size_t GROUP_SIZE = 8;
  static constexpr const char* MARKER = "DATA";

  // ---- CONSTRUCTOR ----
  explicit Codec(const std::string& passphrase);


  // ---- DOCUMENT ENCODING ----
  // Frames the document with marker and flag, rotates and XORs it
  std::vector<uint8_t> encode_document(const std::string& document) const;
  // Returns nullopt if the prefix does not match this key (wrong key or corruption)
  std::optional<std::string> decode_document(const std::vector<uint8_t>& data) const;


  // ---- PAYLOAD ENCODING ----
  std::vector<uint8_t> encode_payload(const std::vector<uint8_t>& data) const;
  std::vector<uint8_t> decode_payload(const std::vector<uint8_t>& data) const;

private:
  // ---- PARAMETERS ----
  KeyMaterial material_;

  // Envelope prefix "DATA:<flag>:"
  std::string prefix() const;
};

} // namespace mediavault::crypto

#endif // MEDIAVAULT_CODEC_HPP
