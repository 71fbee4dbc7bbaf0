#ifndef FILE_AUDIT_STORE_HPP
#define FILE_AUDIT_STORE_HPP

#include "io/audit/base_audit_store.hpp"

#include <fstream>
#include <mutex>
#include <string>

// JSON lines file, one entry per line, flushed after every append
class FileAuditStore : public IAuditStore {
public:
  explicit FileAuditStore(const std::string &file_path);
  ~FileAuditStore() override;

  bool append(const AuditLogEntry &entry) override;
  std::vector<AuditLogEntry> load_recent(size_t limit) override;
  const char *get_name() const override { return "FileAuditStore"; }

  bool is_open() const { return audit_file_stream_.is_open(); }

private:
  std::string audit_file_path_;
  std::ofstream audit_file_stream_;
  std::mutex write_mutex_;
};

#endif // FILE_AUDIT_STORE_HPP
