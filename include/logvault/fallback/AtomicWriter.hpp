// Repository: LogVault
// Component: Atomic Writer
// Purpose: Whole-file replacement through a temp file in the target directory
//          followed by rename(2). Readers see the old or the new content,
//          never a mix.
// Copyright (c) 2026 LogVault

#ifndef LOGVAULT_FALLBACK_ATOMIC_WRITER_HPP_
#define LOGVAULT_FALLBACK_ATOMIC_WRITER_HPP_

#include <memory>
#include <string>
#include <vector>

#include "logvault/fallback/FormatTypes.hpp"
#include "logvault/fallback/Sanitizer.hpp"
#include "logvault/fallback/Value.hpp"

namespace logvault::fallback {

// AtomicWriter
//
// Every Write* call returns false on failure and leaves the target untouched;
// the temp file is removed before returning. When `error` is non-null it
// receives a one-line reason.
//
// No locking: concurrent writers to one path must be serialized by the caller
// (FallbackCoordinator does this through PathLockTable).
class AtomicWriter {
 public:
  // Null sanitizer = a private one with the default cache size.
  explicit AtomicWriter(std::shared_ptr<Sanitizer> sanitizer = nullptr, bool fsync = true);

  // indent < 0 writes compact JSON.
  bool WriteJSONAtomic(const Value& data, const std::string& path, int indent = -1,
                       std::string* error = nullptr);
  // Already-sanitized document.
  bool WriteJSONDocumentAtomic(const Json& document, const std::string& path, int indent = -1,
                               std::string* error = nullptr);

  bool WriteJSONLinesAtomic(const std::vector<Value>& records, const std::string& path,
                            std::string* error = nullptr);
  bool WriteJSONLinesDocumentAtomic(const std::vector<Json>& records, const std::string& path,
                                    std::string* error = nullptr);

  // Each record must be a mapping. The header comes from the first record.
  bool WriteCSVAtomic(const std::vector<Value>& records, const std::string& path,
                      std::string* error = nullptr);
  bool WriteCSVRecordsAtomic(const std::vector<CsvRecord>& records, const std::string& path,
                             std::string* error = nullptr);

  // Raw bytes, no sanitization.
  bool WriteBytesAtomic(const std::string& bytes, const std::string& path,
                        std::string* error = nullptr);

  static std::string SerializeJSON(const Json& document, int indent);
  static std::string SerializeJSONLines(const std::vector<Json>& records);

  [[nodiscard]] const std::shared_ptr<Sanitizer>& sanitizer() const { return sanitizer_; }

 private:
  std::shared_ptr<Sanitizer> sanitizer_;
  bool fsync_;
};

}  // namespace logvault::fallback

#endif  // LOGVAULT_FALLBACK_ATOMIC_WRITER_HPP_
