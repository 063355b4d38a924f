// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#ifndef FUNCMAP_CORE_EXCEPTIONS_H_
#define FUNCMAP_CORE_EXCEPTIONS_H_

#include <stdexcept>
#include <string>

namespace funcmap {

// Base exception for all funcmap errors
// The function ledger itself never throws; these cover the tool layer
class FuncmapException : public std::runtime_error {
 public:
  explicit FuncmapException(const std::string& message)
      : std::runtime_error(message) {}
};

// Event trace errors - unreadable or malformed trace files
class TraceException : public FuncmapException {
 public:
  explicit TraceException(const std::string& message,
                          const std::string& file_path = "")
      : FuncmapException(FormatMessage(message, file_path)),
        file_path_(file_path) {}

  const std::string& file_path() const { return file_path_; }

 private:
  std::string file_path_;

  static std::string FormatMessage(const std::string& msg,
                                   const std::string& path) {
    if (path.empty()) {
      return "Trace error: " + msg;
    }
    return "Trace error (" + path + "): " + msg;
  }
};

// Rendering errors - debug artifact generation failures
class RenderException : public FuncmapException {
 public:
  explicit RenderException(const std::string& message,
                           const std::string& output_path = "")
      : FuncmapException(FormatMessage(message, output_path)),
        output_path_(output_path) {}

  const std::string& output_path() const { return output_path_; }

 private:
  std::string output_path_;

  static std::string FormatMessage(const std::string& msg,
                                   const std::string& path) {
    if (path.empty()) {
      return "Render error: " + msg;
    }
    return "Render error (" + path + "): " + msg;
  }
};

// Configuration errors - invalid settings or options
class ConfigException : public FuncmapException {
 public:
  explicit ConfigException(const std::string& message)
      : FuncmapException("Configuration error: " + message) {}
};

}  // namespace funcmap

#endif  // FUNCMAP_CORE_EXCEPTIONS_H_
