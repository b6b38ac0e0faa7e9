#pragma once

#include <exception>
#include <string>

namespace tome_core {

class IndexerError : public std::exception {
 public:
  explicit IndexerError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

}  // namespace tome_core
