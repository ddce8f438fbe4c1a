#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace pointzilla::util {

/*
  Central error types.

  main() maps these to exit codes and a single diagnostic line.
*/

class ConfigurationError : public std::runtime_error {
 public:
  explicit ConfigurationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class RowParseError : public std::runtime_error {
 public:
  RowParseError(std::size_t row_number, const std::string& msg) : std::runtime_error(msg), row_number_(row_number) {
  }

  std::size_t row_number() const {
    return row_number_;
  }

 private:
  std::size_t row_number_;
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class RemoteError : public std::runtime_error {
 public:
  explicit RemoteError(const std::string& msg) : std::runtime_error(msg) {
  }
};

/*
  A batch (or the append it produced) was rejected by the store.
  accepted_points counts points from earlier batches that the store already took.
*/
class AppendRejected : public RemoteError {
 public:
  AppendRejected(const std::string& msg, std::size_t accepted_points) : RemoteError(msg), accepted_points_(accepted_points) {
  }

  std::size_t accepted_points() const {
    return accepted_points_;
  }

 private:
  std::size_t accepted_points_;
};

} // namespace pointzilla::util
