// Repository: LogVault
// Component: logvault_inspect
// Purpose: Operator tool for structured log files: validate, salvage,
//          back up and restore without going through a running logger.
// Copyright (c) 2026 LogVault

#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "logvault/fallback/BackupManager.hpp"
#include "logvault/fallback/CorruptionDetector.hpp"
#include "logvault/fallback/FormatTypes.hpp"
#include "logvault/fallback/Recovery.hpp"

using namespace logvault::fallback;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailed = 1;
constexpr int kExitUsage = 2;

struct Args {
  std::string command;
  std::vector<std::string> positional;
  std::string backup_dir;
  std::string suffix = BackupManager::kDefaultSuffix;
};

void PrintUsage(const char* prog) {
  std::cerr << "Usage: " << prog << " <command> [options]\n"
            << "\n"
            << "Commands:\n"
            << "  validate <format> <path>     exit 0 if the file parses cleanly\n"
            << "  recover <format> <path>      print salvageable records as JSON Lines\n"
            << "  backup <path>                take a timestamped backup\n"
            << "  restore <path> <backup>      replace <path> with <backup>\n"
            << "  list-backups <path>          print backups, oldest first\n"
            << "\n"
            << "Formats: json, json_lines (jsonl), csv\n"
            << "\n"
            << "Options:\n"
            << "  --backup-dir <dir>   backup directory (default: beside the file)\n"
            << "  --suffix <suffix>    backup suffix (default: .backup)\n";
}

size_t ExpectedPositional(const std::string& command) {
  if (command == "validate" || command == "recover" || command == "restore") return 2;
  if (command == "backup" || command == "list-backups") return 1;
  return 0;
}

bool ParseArgs(int argc, char** argv, Args& args) {
  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];
    if (arg == "--backup-dir" && i + 1 < argc) {
      args.backup_dir = argv[++i];
    } else if (arg == "--suffix" && i + 1 < argc) {
      args.suffix = argv[++i];
    } else if (arg == "--help" || arg == "-h") {
      return false;
    } else if (!arg.empty() && arg[0] == '-') {
      std::cerr << "Unknown option: " << arg << "\n";
      return false;
    } else if (args.command.empty()) {
      args.command = arg;
    } else {
      args.positional.push_back(arg);
    }
  }

  const size_t expected = ExpectedPositional(args.command);
  if (expected == 0) {
    if (!args.command.empty()) std::cerr << "Unknown command: " << args.command << "\n";
    return false;
  }
  if (args.positional.size() != expected) {
    std::cerr << args.command << ": expected " << expected << " argument(s)\n";
    return false;
  }
  if (args.suffix.empty()) {
    std::cerr << "--suffix must not be empty\n";
    return false;
  }
  return true;
}

// ---------------------------------------------------------------------------
// Commands
// ---------------------------------------------------------------------------

int RunValidate(Format format, const std::string& path) {
  CorruptionDetector detector;
  ValidationResult result = detector.Check(path, format, CachePolicy::kBypass);
  std::cout << (result.valid ? "valid" : "invalid") << " format=" << FormatToString(format)
            << " path=" << result.path << "\n";
  return result.valid ? kExitOk : kExitFailed;
}

int RunRecover(Format format, const std::string& path) {
  size_t count = 0;
  if (format == Format::kCsv) {
    std::optional<std::vector<CsvRecord>> rows = Recovery::RecoverCSVFile(path);
    if (!rows.has_value()) {
      std::cerr << "nothing recoverable in " << path << "\n";
      return kExitFailed;
    }
    for (const auto& row : *rows) {
      Json object = Json::object();
      for (const auto& field : row) object[field.first] = field.second;
      std::cout << object.dump() << "\n";
    }
    count = rows->size();
  } else {
    std::optional<std::vector<Json>> records = format == Format::kJson
                                                   ? Recovery::RecoverJSONFile(path)
                                                   : Recovery::RecoverJSONLinesFile(path);
    if (!records.has_value()) {
      std::cerr << "nothing recoverable in " << path << "\n";
      return kExitFailed;
    }
    for (const auto& record : *records) {
      std::cout << record.dump(-1, ' ', false, Json::error_handler_t::replace) << "\n";
    }
    count = records->size();
  }
  std::cerr << "recovered " << count << " record(s) from " << path << "\n";
  return kExitOk;
}

int RunBackup(BackupManager& backups, const std::string& path, const std::string& suffix) {
  std::optional<BackupRecord> record = backups.CreateBackup(path, suffix);
  if (!record.has_value()) {
    std::cerr << "backup failed for " << path << "\n";
    return kExitFailed;
  }
  std::cout << record->backup_path << " size=" << record->size_bytes << " crc32=" << std::hex
            << record->crc32 << std::dec << "\n";
  return kExitOk;
}

int RunRestore(BackupManager& backups, const std::string& path, const std::string& backup) {
  if (!backups.RestoreFromBackup(path, backup)) {
    std::cerr << "restore failed: " << backup << " -> " << path << "\n";
    return kExitFailed;
  }
  std::cout << "restored " << path << " from " << backup << "\n";
  return kExitOk;
}

int RunListBackups(BackupManager& backups, const std::string& path, const std::string& suffix) {
  for (const auto& backup : backups.ListBackups(path, suffix)) {
    std::cout << backup << "\n";
  }
  return kExitOk;
}

}  // namespace

int main(int argc, char** argv) {
  Args args;
  if (!ParseArgs(argc, argv, args)) {
    PrintUsage(argv[0]);
    return kExitUsage;
  }

  try {
    if (args.command == "validate" || args.command == "recover") {
      std::optional<Format> format = ParseFormatName(args.positional[0]);
      if (!format.has_value()) {
        std::cerr << "Unknown format: " << args.positional[0] << "\n";
        PrintUsage(argv[0]);
        return kExitUsage;
      }
      return args.command == "validate" ? RunValidate(*format, args.positional[1])
                                        : RunRecover(*format, args.positional[1]);
    }

    BackupManager backups(args.backup_dir);
    if (args.command == "backup") {
      return RunBackup(backups, args.positional[0], args.suffix);
    }
    if (args.command == "restore") {
      return RunRestore(backups, args.positional[0], args.positional[1]);
    }
    return RunListBackups(backups, args.positional[0], args.suffix);
  } catch (const std::invalid_argument& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return kExitUsage;
  }
}
