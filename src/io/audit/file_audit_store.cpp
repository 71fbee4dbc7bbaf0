#include "file_audit_store.hpp"
#include "core/logger.hpp"
#include "utils/json_formatter.hpp"
#include "utils/utils.hpp"

#include <deque>

FileAuditStore::FileAuditStore(const std::string &file_path)
    : audit_file_path_(file_path) {
  if (audit_file_path_.empty()) {
    LOG(LogLevel::ERROR, LogComponent::IO_AUDIT,
        "FileAuditStore created without a file path.");
    return;
  }
  Utils::create_directory_for_file(audit_file_path_);
  audit_file_stream_.open(audit_file_path_, std::ios::app);
  if (!audit_file_stream_.is_open())
    LOG(LogLevel::ERROR, LogComponent::IO_AUDIT,
        "FileAuditStore could not open audit file: " << audit_file_path_);
  else
    LOG(LogLevel::INFO, LogComponent::IO_AUDIT,
        "Audit log appending to " << audit_file_path_);
}

FileAuditStore::~FileAuditStore() {
  if (audit_file_stream_.is_open()) {
    audit_file_stream_.flush();
    audit_file_stream_.close();
  }
}

bool FileAuditStore::append(const AuditLogEntry &entry) {
  std::lock_guard<std::mutex> lock(write_mutex_);
  if (!audit_file_stream_.is_open())
    return false;

  std::string line = JsonFormatter::format_audit_entry_to_json(entry);
  audit_file_stream_ << line << std::endl; // endl also flushes
  if (!audit_file_stream_.good()) {
    LOG(LogLevel::ERROR, LogComponent::IO_AUDIT,
        "Failed to write audit entry " << entry.id << " to "
                                       << audit_file_path_);
    audit_file_stream_.clear();
    return false;
  }
  return true;
}

std::vector<AuditLogEntry> FileAuditStore::load_recent(size_t limit) {
  std::ifstream input(audit_file_path_);
  if (!input.is_open())
    return {};

  std::deque<AuditLogEntry> newest;
  size_t malformed = 0;
  std::string line;
  while (std::getline(input, line)) {
    if (Utils::trim_copy(line).empty())
      continue;
    auto json = nlohmann::json::parse(line, nullptr, false);
    auto entry = JsonFormatter::audit_entry_from_json(json);
    if (!entry) {
      ++malformed;
      continue;
    }
    newest.push_back(std::move(*entry));
    if (limit > 0 && newest.size() > limit)
      newest.pop_front();
  }

  if (malformed > 0)
    LOG(LogLevel::WARN, LogComponent::IO_AUDIT,
        "Skipped " << malformed << " malformed lines in " << audit_file_path_);
  return {newest.begin(), newest.end()};
}
