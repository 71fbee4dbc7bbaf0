#ifndef MONGO_MANAGER_HPP
#define MONGO_MANAGER_HPP

#include <memory>
#include <mongocxx/client.hpp>
#include <mongocxx/instance.hpp>
#include <mongocxx/pool.hpp>
#include <mongocxx/uri.hpp>
#include <string>

// Owns the driver instance and a client pool shared by the audit backend
class MongoManager {
public:
  explicit MongoManager(const std::string &uri);

  // Throws std::runtime_error when the pool could not be created
  mongocxx::pool::entry get_client();

  bool is_initialized() const { return pool_ != nullptr; }
  bool ping();

  const std::string &uri() const { return uri_; }

private:
  static mongocxx::instance &driver_instance();

  std::string uri_;
  std::unique_ptr<mongocxx::pool> pool_;
};

#endif // MONGO_MANAGER_HPP
