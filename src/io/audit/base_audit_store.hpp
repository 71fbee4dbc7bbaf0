#ifndef BASE_AUDIT_STORE_HPP
#define BASE_AUDIT_STORE_HPP

#include "core/audit_entry.hpp"

#include <cstddef>
#include <vector>

// Durable, append-only audit backend
class IAuditStore {
public:
  virtual ~IAuditStore() = default;

  // True once the entry is durably stored
  virtual bool append(const AuditLogEntry &entry) = 0;

  // Up to limit of the newest entries, oldest first
  virtual std::vector<AuditLogEntry> load_recent(size_t limit) = 0;

  virtual const char *get_name() const = 0;
};

#endif // BASE_AUDIT_STORE_HPP
