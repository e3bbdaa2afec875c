#include "crypto/codec.hpp"
#include <openssl/evp.h>
#include <algorithm>
#include <iomanip>
#include <sstream>
#include <boost/log/trivial.hpp>

namespace mediavault::crypto {

namespace {

// Wraps the passphrase in the application domain string
std::string domain_string(const std::string& passphrase) {
  return "photos." + passphrase + ".heerkirov.com";
}

// Generates a lower-case hex digest of input using OpenSSL EVP
std::string hex_digest(const EVP_MD* md, const std::string& input) {
  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len;

  EVP_MD_CTX* ctx = EVP_MD_CTX_new();
  if (!ctx) {
    throw DigestError("Codec: Failed to create hash context");
  }

  if (!EVP_DigestInit_ex(ctx, md, nullptr)) {
    EVP_MD_CTX_free(ctx);
    throw DigestError("Codec: Failed to initialize hash context");
  }

  if (!EVP_DigestUpdate(ctx, input.c_str(), input.length())) {
    EVP_MD_CTX_free(ctx);
    throw DigestError("Codec: Failed to update hash");
  }

  if (!EVP_DigestFinal_ex(ctx, hash, &hash_len)) {
    EVP_MD_CTX_free(ctx);
    throw DigestError("Codec: Failed to finalize hash");
  }

  EVP_MD_CTX_free(ctx);

  std::stringstream ss;
  for (unsigned int i = 0; i < hash_len; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0')
       << static_cast<int>(hash[i]);
  }
  return ss.str();
}

} // namespace

//==============================================
// KEY DERIVATION
//==============================================

KeyMaterial derive_key(const std::string& passphrase) {
  const std::string domain = domain_string(passphrase);
  KeyMaterial material;
  material.keystream = hex_digest(EVP_sha224(), domain);
  material.flag = hex_digest(EVP_sha256(), domain);
  return material;
}


//==============================================
// BYTE TRANSFORMS
//==============================================

std::vector<uint8_t> rotate_groups(const std::vector<uint8_t>& data, std::size_t group_size, int step) {
  const std::size_t length = data.size();
  std::vector<uint8_t> result(length);
  if (group_size == 0) {
    return data;
  }

  for (std::size_t head = 0; head < length; head += group_size) {
    const std::size_t span = std::min(group_size, length - head);
    // Normalize the step into [0, span) so negative steps rotate left
    const long shift = ((static_cast<long>(step) % static_cast<long>(span)) + static_cast<long>(span))
                       % static_cast<long>(span);
    for (std::size_t i = 0; i < span; ++i) {
      const std::size_t source = (i + span - static_cast<std::size_t>(shift)) % span;
      result[head + i] = data[head + source];
    }
  }
  return result;
}

std::vector<uint8_t> xor_keystream(const std::vector<uint8_t>& data, const std::string& key) {
  std::vector<uint8_t> result(data.size());
  if (key.empty()) {
    return data;
  }
  for (std::size_t i = 0, j = 0; i < data.size(); ++i, ++j) {
    if (j >= key.size()) j = 0;
    result[i] = data[i] ^ static_cast<uint8_t>(key[j]);
  }
  return result;
}


//==============================================
// CONSTRUCTOR
//==============================================

Codec::Codec(const std::string& passphrase) : material_(derive_key(passphrase)) {
  BOOST_LOG_TRIVIAL(debug) << "Codec: Key material derived";
}

std::string Codec::prefix() const {
  return std::string(MARKER) + ":" + material_.flag + ":";
}


//==============================================
// DOCUMENT ENCODING
//==============================================

std::vector<uint8_t> Codec::encode_document(const std::string& document) const {
  const std::string envelope = prefix() + document;
  std::vector<uint8_t> plain(envelope.begin(), envelope.end());
  auto encoded = xor_keystream(rotate_groups(plain, GROUP_SIZE, 1), material_.keystream);
  BOOST_LOG_TRIVIAL(debug) << "Codec: Encoded document of " << encoded.size() << " bytes";
  return encoded;
}

std::optional<std::string> Codec::decode_document(const std::vector<uint8_t>& data) const {
  auto plain = rotate_groups(xor_keystream(data, material_.keystream), GROUP_SIZE, -1);
  const std::string expected = prefix();

  if (plain.size() < expected.size() ||
      !std::equal(expected.begin(), expected.end(), plain.begin())) {
    BOOST_LOG_TRIVIAL(warning) << "Codec: Document prefix mismatch, key is wrong or data is corrupted";
    return std::nullopt;
  }

  return std::string(plain.begin() + static_cast<std::ptrdiff_t>(expected.size()), plain.end());
}


//==============================================
// PAYLOAD ENCODING
//==============================================

std::vector<uint8_t> Codec::encode_payload(const std::vector<uint8_t>& data) const {
  return xor_keystream(data, material_.keystream);
}

std::vector<uint8_t> Codec::decode_payload(const std::vector<uint8_t>& data) const {
  return xor_keystream(data, material_.keystream);
}

} // namespace mediavault::crypto
