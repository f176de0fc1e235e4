// Repository: LogVault
// Component: Atomic Writer
// Copyright (c) 2026 LogVault

#include "logvault/fallback/AtomicWriter.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <stdexcept>

#include "logvault/fallback/Csv.hpp"
#include "logvault/util/FileIo.hpp"
#include "logvault/util/Logger.hpp"

namespace logvault::fallback {

namespace {

void SetError(std::string* error, const std::string& reason) {
  if (error != nullptr) *error = reason;
}

}  // namespace

AtomicWriter::AtomicWriter(std::shared_ptr<Sanitizer> sanitizer, bool fsync)
    : sanitizer_(sanitizer ? std::move(sanitizer) : std::make_shared<Sanitizer>()),
      fsync_(fsync) {}

std::string AtomicWriter::SerializeJSON(const Json& document, int indent) {
  return document.dump(indent < 0 ? -1 : indent, ' ', false, Json::error_handler_t::replace);
}

std::string AtomicWriter::SerializeJSONLines(const std::vector<Json>& records) {
  std::string out;
  for (const auto& record : records) {
    out += record.dump(-1, ' ', false, Json::error_handler_t::replace);
    out.push_back('\n');
  }
  return out;
}

bool AtomicWriter::WriteJSONAtomic(const Value& data, const std::string& path, int indent,
                                   std::string* error) {
  return WriteJSONDocumentAtomic(sanitizer_->SanitizeForJSON(data), path, indent, error);
}

bool AtomicWriter::WriteJSONDocumentAtomic(const Json& document, const std::string& path,
                                           int indent, std::string* error) {
  return WriteBytesAtomic(SerializeJSON(document, indent), path, error);
}

bool AtomicWriter::WriteJSONLinesAtomic(const std::vector<Value>& records,
                                        const std::string& path, std::string* error) {
  std::vector<Json> sanitized;
  sanitized.reserve(records.size());
  for (const auto& record : records) {
    sanitized.push_back(sanitizer_->SanitizeForJSON(record));
  }
  return WriteJSONLinesDocumentAtomic(sanitized, path, error);
}

bool AtomicWriter::WriteJSONLinesDocumentAtomic(const std::vector<Json>& records,
                                                const std::string& path, std::string* error) {
  return WriteBytesAtomic(SerializeJSONLines(records), path, error);
}

bool AtomicWriter::WriteCSVAtomic(const std::vector<Value>& records, const std::string& path,
                                  std::string* error) {
  std::vector<CsvRecord> rows;
  rows.reserve(records.size());
  for (size_t i = 0; i < records.size(); ++i) {
    const Value& record = records[i];
    const bool has_fields = record.kind() == Value::Kind::kMapping ||
                            (record.kind() == Value::Kind::kOpaque && record.HasAttributes());
    if (!has_fields) {
      SetError(error, "record " + std::to_string(i) + " is a " +
                          KindToString(record.kind()) + ", not a mapping");
      return false;
    }
    rows.push_back(sanitizer_->SanitizeRowForCSV(record));
  }
  return WriteCSVRecordsAtomic(rows, path, error);
}

bool AtomicWriter::WriteCSVRecordsAtomic(const std::vector<CsvRecord>& records,
                                         const std::string& path, std::string* error) {
  std::string content;
  if (!EncodeCsvRecords(records, &content, error)) {
    return false;
  }
  return WriteBytesAtomic(content, path, error);
}

bool AtomicWriter::WriteBytesAtomic(const std::string& bytes, const std::string& path,
                                    std::string* error) {
  if (path.empty()) {
    throw std::invalid_argument("AtomicWriter: path must not be empty");
  }

  const std::string dir = util::DirectoryOf(path);
  std::string tmpl = dir + "/." + util::BaseName(path) + ".tmp.XXXXXX";
  std::vector<char> name(tmpl.begin(), tmpl.end());
  name.push_back('\0');

  int fd = ::mkstemp(name.data());
  if (fd < 0) {
    SetError(error, "create temp in " + dir + ": " + util::ErrnoMessage(errno));
    return false;
  }
  const std::string tmp_path(name.data());

  auto fail = [&](const std::string& reason) {
    if (fd >= 0) ::close(fd);
    (void)::unlink(tmp_path.c_str());
    SetError(error, reason);
    util::Logger::Debug("[AtomicWriter] write failed path=" + path + " reason=" + reason);
    return false;
  };

  // mkstemp creates 0600; keep the target's mode, or use 0644 for a new file.
  mode_t mode = 0644;
  struct stat st;
  if (::stat(path.c_str(), &st) == 0) {
    mode = st.st_mode & 07777;
  }
  if (::fchmod(fd, mode) != 0) {
    return fail("chmod temp: " + util::ErrnoMessage(errno));
  }

  if (!util::WriteAll(fd, bytes.data(), bytes.size())) {
    return fail("write temp: " + util::ErrnoMessage(errno));
  }
  if (fsync_ && ::fsync(fd) != 0) {
    return fail("fsync temp: " + util::ErrnoMessage(errno));
  }
  const int close_rc = ::close(fd);
  fd = -1;
  if (close_rc != 0) {
    return fail("close temp: " + util::ErrnoMessage(errno));
  }

  if (::rename(tmp_path.c_str(), path.c_str()) != 0) {
    return fail("rename onto " + path + ": " + util::ErrnoMessage(errno));
  }

  // The new content is in place from here on; a failed directory sync only
  // weakens durability across power loss.
  if (fsync_ && !util::SyncDirectory(dir)) {
    util::Logger::Warn("[AtomicWriter] directory fsync failed dir=" + dir);
  }
  return true;
}

}  // namespace logvault::fallback
