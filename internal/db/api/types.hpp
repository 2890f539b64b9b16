#pragma once

#include <optional>
#include <string>

namespace sitestore::db {

/*
  Optional schema features of the backing tables.

  Negotiated once at startup (see capabilities.hpp) and immutable afterwards.
  Default-constructed value is the conservative "no discriminator" shape.
*/
struct SchemaCapabilities {
  bool kv_owner_column    = false; // app_data.user_id
  bool audit_owner_column = false; // user_logs.user_id
};

/*
  Row scoping applied to a single statement.

  owner_id set   -> statement filters/writes user_id = owner_id
  owner_id unset -> statement does not mention user_id at all
*/
struct OwnerScope {
  std::optional<std::string> owner_id;

  static OwnerScope Unscoped() {
    return {};
  }

  static OwnerScope Owner(std::string id) {
    return {std::move(id)};
  }
};

} // namespace sitestore::db
