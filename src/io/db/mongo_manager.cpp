#include "mongo_manager.hpp"
#include "core/logger.hpp"

#include <bsoncxx/builder/basic/document.hpp>
#include <stdexcept>

mongocxx::instance &MongoManager::driver_instance() {
  // One driver instance per process, created on first use
  static mongocxx::instance instance{};
  return instance;
}

MongoManager::MongoManager(const std::string &uri) : uri_(uri) {
  driver_instance();
  try {
    mongocxx::uri mongo_uri(uri);
    pool_ = std::make_unique<mongocxx::pool>(mongo_uri);
    LOG(LogLevel::INFO, LogComponent::IO_DATABASE,
        "MongoDB connection pool initialized for URI: " << uri);
  } catch (const std::exception &e) {
    LOG(LogLevel::ERROR, LogComponent::IO_DATABASE,
        "Could not initialize MongoDB connection pool. Error: " << e.what());
    pool_ = nullptr;
  }
}

mongocxx::pool::entry MongoManager::get_client() {
  if (!pool_)
    throw std::runtime_error("MongoDB pool is not initialized for " + uri_);
  return pool_->acquire();
}

bool MongoManager::ping() {
  if (!pool_) {
    LOG(LogLevel::ERROR, LogComponent::IO_DATABASE,
        "MongoDB pool is not initialized.");
    return false;
  }
  try {
    auto client = pool_->acquire();
    bsoncxx::builder::basic::document command{};
    command.append(bsoncxx::builder::basic::kvp("ping", 1));
    (*client)["admin"].run_command(command.view());
    LOG(LogLevel::TRACE, LogComponent::IO_DATABASE,
        "MongoDB server is reachable and responsive.");
    return true;
  } catch (const std::exception &e) {
    LOG(LogLevel::ERROR, LogComponent::IO_DATABASE,
        "MongoDB server is unreachable. Error: " << e.what());
    return false;
  }
}
