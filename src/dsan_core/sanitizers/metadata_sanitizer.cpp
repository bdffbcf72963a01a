#include "dsan_core/sanitizers/metadata_sanitizer.hpp"
#include <openssl/evp.h>

#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace dsan_core {

std::string MetadataSanitizer::get_binary_content(const fs::path& file_path) const {
  std::ifstream file_stream(file_path, std::ios::binary);
  if (!file_stream.is_open()) {
    throw SanitizerError("Could not open file: " + file_path.string());
  }

  std::stringstream buffer;
  buffer << file_stream.rdbuf();
  return buffer.str();
}

std::string MetadataSanitizer::compute_hash_from_content(const std::string& content) const {
  EVP_MD_CTX* mdctx = EVP_MD_CTX_new();
  if (!mdctx) {
    throw SanitizerError("Failed to create EVP context for hashing");
  }

  if (EVP_DigestInit_ex(mdctx, EVP_sha256(), nullptr) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw SanitizerError("Failed to initialize SHA256 digest");
  }

  if (EVP_DigestUpdate(mdctx, content.data(), content.length()) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw SanitizerError("Failed to update SHA256 digest");
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len;
  if (EVP_DigestFinal_ex(mdctx, hash, &hash_len) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw SanitizerError("Failed to finalize SHA256 digest");
  }

  EVP_MD_CTX_free(mdctx);

  std::stringstream ss;
  for (unsigned int i = 0; i < hash_len; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
  }

  return ss.str();
}

std::string MetadataSanitizer::get_content_hash(const fs::path& file_path) const {
  return compute_hash_from_content(get_binary_content(file_path));
}

void MetadataSanitizer::remove_partial_output(const fs::path& destination) const {
  std::error_code ec;
  if (fs::remove(destination, ec)) {
    logger_->debug("Removed partial output: " + destination.string());
  } else if (ec) {
    logger_->warning("Could not remove partial output " + destination.string() + ": " +
                     ec.message());
  }
}

}  // namespace dsan_core
