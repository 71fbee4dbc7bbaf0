#ifndef MONGO_AUDIT_STORE_HPP
#define MONGO_AUDIT_STORE_HPP

#include "io/audit/base_audit_store.hpp"
#include "io/db/mongo_manager.hpp"

#include <memory>
#include <string>

class MongoAuditStore : public IAuditStore {
public:
  MongoAuditStore(std::shared_ptr<MongoManager> mongo_manager,
                  const std::string &db_name,
                  const std::string &collection_name);

  bool append(const AuditLogEntry &entry) override;
  std::vector<AuditLogEntry> load_recent(size_t limit) override;
  const char *get_name() const override { return "MongoAuditStore"; }

private:
  std::shared_ptr<MongoManager> mongo_manager_;
  std::string db_name_;
  std::string collection_name_;
};

#endif // MONGO_AUDIT_STORE_HPP
