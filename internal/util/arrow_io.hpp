#pragma once

#include <arrow/buffer.h>
#include <arrow/io/file.h>
#include <arrow/result.h>
#include <arrow/status.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

namespace pointzilla::util {

/*
  Helper: unwrap Arrow Result<T> or throw std::runtime_error
*/
template <typename T>
T Unwrap(const arrow::Result<T>& result) {
  if (!result.ok()) throw std::runtime_error(result.status().ToString());
  return *result;
}

inline void Unwrap(const arrow::Status& status) {
  if (!status.ok()) throw std::runtime_error(status.ToString());
}

/*
  Read entire file into buffer
*/
inline arrow::Result<std::shared_ptr<arrow::Buffer>> ReadFile(const std::string& path) {
  ARROW_ASSIGN_OR_RAISE(auto file, arrow::io::ReadableFile::Open(path));
  ARROW_ASSIGN_OR_RAISE(auto size, file->GetSize());
  ARROW_ASSIGN_OR_RAISE(auto buffer, file->Read(size));
  ARROW_RETURN_NOT_OK(file->Close());
  return buffer;
}

/*
  Write contents, replacing any existing file.
*/
inline arrow::Status WriteFile(const std::string& path, std::string_view contents) {
  ARROW_ASSIGN_OR_RAISE(auto out, arrow::io::FileOutputStream::Open(path));
  ARROW_RETURN_NOT_OK(out->Write(contents.data(), static_cast<int64_t>(contents.size())));
  ARROW_RETURN_NOT_OK(out->Flush());
  return out->Close();
}

} // namespace pointzilla::util
