#include "mongo_audit_store.hpp"
#include "core/logger.hpp"
#include "utils/json_formatter.hpp"

#include <algorithm>
#include <bsoncxx/builder/basic/document.hpp>
#include <bsoncxx/json.hpp>
#include <mongocxx/exception/exception.hpp>
#include <mongocxx/options/find.hpp>

MongoAuditStore::MongoAuditStore(std::shared_ptr<MongoManager> mongo_manager,
                                 const std::string &db_name,
                                 const std::string &collection_name)
    : mongo_manager_(std::move(mongo_manager)), db_name_(db_name),
      collection_name_(collection_name) {
  LOG(LogLevel::INFO, LogComponent::IO_AUDIT,
      "Audit log writing to MongoDB collection " << db_name_ << "."
                                                 << collection_name_);
}

bool MongoAuditStore::append(const AuditLogEntry &entry) {
  try {
    auto client = mongo_manager_->get_client();
    auto collection = (*client)[db_name_][collection_name_];
    auto document = bsoncxx::from_json(
        JsonFormatter::format_audit_entry_to_json(entry));
    auto result = collection.insert_one(document.view());
    return static_cast<bool>(result);
  } catch (const std::exception &e) {
    LOG(LogLevel::ERROR, LogComponent::IO_DATABASE,
        "Failed to insert audit entry " << entry.id << ": " << e.what());
    return false;
  }
}

std::vector<AuditLogEntry> MongoAuditStore::load_recent(size_t limit) {
  using bsoncxx::builder::basic::kvp;
  using bsoncxx::builder::basic::make_document;

  std::vector<AuditLogEntry> entries;
  try {
    auto client = mongo_manager_->get_client();
    auto collection = (*client)[db_name_][collection_name_];

    mongocxx::options::find opts{};
    opts.sort(make_document(kvp("id", -1)));
    if (limit > 0)
      opts.limit(static_cast<int64_t>(limit));

    auto cursor = collection.find({}, opts);
    for (auto &&doc : cursor) {
      auto json = nlohmann::json::parse(bsoncxx::to_json(doc), nullptr, false);
      if (auto entry = JsonFormatter::audit_entry_from_json(json))
        entries.push_back(std::move(*entry));
    }
  } catch (const std::exception &e) {
    LOG(LogLevel::ERROR, LogComponent::IO_DATABASE,
        "Failed to load audit entries: " << e.what());
    return {};
  }

  std::reverse(entries.begin(), entries.end());
  return entries;
}
