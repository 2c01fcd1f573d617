/**
 * @file contentreader.cpp
 * @brief Чтение содержимого и SHA-256
 */

#include "../include/contentreader.hpp"

#include <openssl/evp.h>

#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

ContentReader::Content ContentReader::read(const fs::path &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw std::runtime_error("Cannot open file for reading: " + path.string());
  }

  auto bytes = std::make_shared<std::vector<char>>();
  char buffer[8192];
  while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
    bytes->insert(bytes->end(), buffer, buffer + file.gcount());
  }
  if (file.bad()) {
    throw std::runtime_error("Failed to read file: " + path.string());
  }

  Content content;
  content.sha256 = sha256Hex(bytes->data(), bytes->size());
  content.bytes = std::move(bytes);
  return content;
}

std::string ContentReader::sha256Hex(const char *data, std::size_t size) {
  EVP_MD_CTX *mdctx = EVP_MD_CTX_new();
  if (!mdctx) {
    throw std::runtime_error("Failed to create EVP context");
  }

  const EVP_MD *md = EVP_sha256();

  if (EVP_DigestInit_ex(mdctx, md, nullptr) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw std::runtime_error("Failed to initialize SHA256 digest");
  }

  if (size > 0 && EVP_DigestUpdate(mdctx, data, size) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw std::runtime_error("Failed to update SHA256 digest");
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int len = 0;
  if (EVP_DigestFinal_ex(mdctx, hash, &len) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw std::runtime_error("Failed to finalize SHA256 digest");
  }

  EVP_MD_CTX_free(mdctx);

  std::stringstream ss;
  ss << std::hex << std::setfill('0');
  for (unsigned int i = 0; i < len; i++) {
    ss << std::setw(2) << static_cast<unsigned>(hash[i]);
  }
  return ss.str();
}
