#pragma once

#include <exception>
#include <string>
#include <string_view>

namespace tome_core {

class ContentHashError : public std::exception {
 public:
  explicit ContentHashError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

/**
 * @brief Computes the lowercase hex SHA-256 digest of the given content.
 * @throw ContentHashError if the OpenSSL digest fails.
 */
std::string compute_hash_from_content(std::string_view content);

}  // namespace tome_core
