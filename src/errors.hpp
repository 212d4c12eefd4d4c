#pragma once
#include <stdexcept>
#include <string>

namespace labelsheet {

/* no input files, unreadable file, file without a barcode column */
struct InputResolutionError : std::runtime_error {
  explicit InputResolutionError(const std::string& m) : std::runtime_error(m) {}
};

/* value rejected by the barcode symbology; source is empty until the engine knows it */
struct EncodingError : std::runtime_error {
  std::string identifier, source;
  EncodingError(const std::string& m, const std::string& id, const std::string& src = std::string())
    : std::runtime_error(m), identifier(id), source(src) {}
};

/* destination not writable */
struct OutputWriteError : std::runtime_error {
  explicit OutputWriteError(const std::string& m) : std::runtime_error(m) {}
};

}
