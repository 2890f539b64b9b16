#include <google/protobuf/util/json_util.h>

#include <chrono>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include "internal/auth/session_cookie.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/kv/value.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

static void Usage() {
  std::cout << "Usage:\n"
            << "  sitestorectl --config <config.yaml> seed-admin\n"
            << "  sitestorectl --config <config.yaml> login <identifier> <password>\n"
            << "  sitestorectl --config <config.yaml> verify <token>\n"
            << "  sitestorectl --config <config.yaml> rotate-secret\n"
            << "  sitestorectl --config <config.yaml> kv-get <key>\n"
            << "  sitestorectl --config <config.yaml> kv-put <key> <json>\n"
            << "  sitestorectl --config <config.yaml> kv-delete <key>\n"
            << "  sitestorectl --config <config.yaml> kv-list <prefix>\n"
            << "  sitestorectl --config <config.yaml> capabilities\n";
}

static const char* YesNo(bool b) {
  return b ? "yes" : "no";
}

int main(int argc, char** argv) {
  if (argc < 4 || std::string(argv[1]) != "--config") {
    Usage();
    return 1;
  }

  const std::string              config_path = argv[2];
  const std::string              cmd         = argv[3];
  const std::vector<std::string> args(argv + 4, argv + argc);

  try {
    // ------------------------------------------------------------
    // Load configuration and build the runtime
    // ------------------------------------------------------------
    auto config = sitestore::config::ConfigLoader::LoadFromYaml(config_path);
    sitestore::observability::InitializeLogging(config);

    auto deps = sitestore::factory::BuildRuntime(config);

    // ------------------------------------------------------------

    if (cmd == "seed-admin") {
      if (!deps.seed_outcome) {
        std::cerr << "administrator not seeded; see log\n";
        return 1;
      }
      std::cout << sitestore::auth::ToString(*deps.seed_outcome) << "\n";
      return 0;
    }

    if (cmd == "login") {
      if (args.size() != 2) {
        Usage();
        return 1;
      }

      auto token = deps.auth->Login(args[0], args[1]);
      if (!token) {
        std::cerr << "unauthorized\n";
        return 2;
      }
      std::cout << *token << "\n";
      std::cout << "Set-Cookie: " << sitestore::auth::BuildSessionCookie(*token, deps.auth->SessionTtl()) << "\n";
      return 0;
    }

    if (cmd == "verify") {
      if (args.size() != 1) {
        Usage();
        return 1;
      }

      auto claims = deps.auth->Authenticate(args[0]);
      if (!claims) {
        std::cerr << "unauthorized\n";
        return 2;
      }
      std::cout << "sub: " << claims->sub << "\n"
                << "iat: " << claims->iat_ms << "\n"
                << "exp: " << claims->exp_ms << "\n";
      return 0;
    }

    if (cmd == "rotate-secret") {
      deps.tokens->RotateSecret();
      std::cout << "session secret rotated; outstanding tokens are now invalid\n";
      return 0;
    }

    if (cmd == "kv-get") {
      if (args.size() != 1) {
        Usage();
        return 1;
      }

      auto value = deps.kv_store->Get(args[0]);
      if (!value) {
        std::cerr << "not found: " << args[0] << "\n";
        return 3;
      }
      std::cout << sitestore::kv::ToJson(*value) << "\n";
      return 0;
    }

    if (cmd == "kv-put") {
      if (args.size() != 2) {
        Usage();
        return 1;
      }

      sitestore::kv::Value value;
      auto                 status = google::protobuf::util::JsonStringToMessage(args[1], &value);
      if (!status.ok()) {
        std::cerr << "invalid json: " << status.ToString() << "\n";
        return 1;
      }
      deps.kv_store->Put(args[0], value);
      return 0;
    }

    if (cmd == "kv-delete") {
      if (args.size() != 1) {
        Usage();
        return 1;
      }

      deps.kv_store->Delete(args[0]);
      return 0;
    }

    if (cmd == "kv-list") {
      const std::string prefix = args.empty() ? std::string{} : args[0];
      for (const auto& key : deps.kv_store->ListKeysWithPrefix(prefix)) {
        std::cout << key << "\n";
      }
      return 0;
    }

    if (cmd == "capabilities") {
      const auto& caps = deps.context.capabilities;
      std::cout << "app_data.user_id:  " << YesNo(caps.kv_owner_column) << "\n"
                << "user_logs.user_id: " << YesNo(caps.audit_owner_column) << "\n"
                << "owner_id:          " << deps.context.owner_id << "\n";
      return 0;
    }

    Usage();
    return 1;
  } catch (const sitestore::util::BackendUnavailable& e) {
    std::cerr << "backend unavailable: " << e.what() << "\n";
    return 4;
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }
}
