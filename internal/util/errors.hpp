#pragma once

#include <stdexcept>
#include <string>

namespace relaynorm::util {

/*
  Central error types.

  Every one of these is local to a single document: the batch worker
  records it in the report and moves on to the next file.
*/

class InvalidConfig : public std::runtime_error {
 public:
  explicit InvalidConfig(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidInput : public std::runtime_error {
 public:
  explicit InvalidInput(const std::string& msg) : std::runtime_error(msg) {
  }
};

// no encoding in the chain produced clean text
class EncodingUnresolved : public std::runtime_error {
 public:
  explicit EncodingUnresolved(const std::string& msg) : std::runtime_error(msg) {
  }
};

class UnknownModel : public std::runtime_error {
 public:
  explicit UnknownModel(const std::string& msg) : std::runtime_error(msg) {
  }
};

class UnresolvedEquipment : public std::runtime_error {
 public:
  explicit UnresolvedEquipment(const std::string& msg) : std::runtime_error(msg) {
  }
};

// row counts read back after the upsert differ from what was emitted
class IntegrityMismatch : public std::runtime_error {
 public:
  explicit IntegrityMismatch(const std::string& msg) : std::runtime_error(msg) {
  }
};

class StorageError : public std::runtime_error {
 public:
  explicit StorageError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace relaynorm::util
