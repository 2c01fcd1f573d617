/**
 * @file contentreader.hpp
 * @brief Однократное чтение файла в память с контрольной суммой
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "../include/transfertypes.hpp"

class ContentReader {
 public:
  struct Content {
    std::shared_ptr<const std::vector<char>> bytes;
    std::string sha256;  ///< hex, нижний регистр
  };

  /**
   * @brief Прочитать файл целиком
   * @throw std::runtime_error Файл не открывается или чтение прервано
   */
  static Content read(const fs::path &path);

  /**
   * @brief SHA-256 через OpenSSL EVP
   * @throw std::runtime_error Ошибка OpenSSL
   */
  static std::string sha256Hex(const char *data, std::size_t size);
};
