#pragma once

#include <stdexcept>
#include <string>

namespace graphdoc::util {

/*
  Central error types.

  Registry and store operations throw these; the storage layer below
  them only reports db::Result codes. Validation failures are raised
  before anything is written, so a thrown error never leaves partial
  state behind.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

// type registry

class DuplicateName : public std::runtime_error {
 public:
  explicit DuplicateName(const std::string& msg) : std::runtime_error(msg) {
  }
};

class DuplicateKey : public std::runtime_error {
 public:
  explicit DuplicateKey(const std::string& msg) : std::runtime_error(msg) {
  }
};

class UnknownType : public std::runtime_error {
 public:
  explicit UnknownType(const std::string& msg) : std::runtime_error(msg) {
  }
};

// entity / relationship stores

class EntityNotFound : public std::runtime_error {
 public:
  explicit EntityNotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidBaseType : public std::runtime_error {
 public:
  explicit InvalidBaseType(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidTraitType : public std::runtime_error {
 public:
  explicit InvalidTraitType(const std::string& msg) : std::runtime_error(msg) {
  }
};

class DuplicateTraitAssignment : public std::runtime_error {
 public:
  explicit DuplicateTraitAssignment(const std::string& msg) : std::runtime_error(msg) {
  }
};

class UnknownAttributeKey : public std::runtime_error {
 public:
  explicit UnknownAttributeKey(const std::string& msg) : std::runtime_error(msg) {
  }
};

class TypeMismatch : public std::runtime_error {
 public:
  explicit TypeMismatch(const std::string& msg) : std::runtime_error(msg) {
  }
};

class DuplicateValue : public std::runtime_error {
 public:
  explicit DuplicateValue(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ConstraintViolation : public std::runtime_error {
 public:
  explicit ConstraintViolation(const std::string& msg) : std::runtime_error(msg) {
  }
};

class EndpointTypeMismatch : public std::runtime_error {
 public:
  explicit EndpointTypeMismatch(const std::string& msg) : std::runtime_error(msg) {
  }
};

class MultiplicityExceeded : public std::runtime_error {
 public:
  explicit MultiplicityExceeded(const std::string& msg) : std::runtime_error(msg) {
  }
};

// The backing store could not be reached or refused the transaction
// (busy, I/O, serialization conflict). Callers may retry.
class StoreUnavailable : public std::runtime_error {
 public:
  explicit StoreUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace graphdoc::util
