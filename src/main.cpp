#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <coffer/ledger/vault_ledger.hpp>
#include <coffer/persistence/audit_log.hpp>
#include <coffer/persistence/checkpoint.hpp>
#include <coffer/schema/primitives.hpp>

#include <charconv>
#include <cstdint>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

namespace po = boost::program_options;
using namespace coffer::schema;

constexpr auto kExitOk = 0;
constexpr auto kExitUsage = 1;
constexpr auto kExitRejected = 2;
constexpr auto kExitState = 3;

struct invocation final {
  std::optional<identity_t> caller;
  std::string command;
  std::vector<std::string> args;
};

std::optional<uint64_t> parse_u64(const std::string_view text) {
  auto value = uint64_t{};
  const auto* end = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(text.data(), end, value);
  if (ec != std::errc{} || ptr != end || text.empty()) {
    return std::nullopt;
  }
  return value;
}

int usage_error(const std::string_view message) {
  std::cerr << "usage error: " << message << std::endl;
  return kExitUsage;
}

int rejected(const operation_result_t& result) {
  std::cerr << "error: " << to_string(result.code) << ": " << result.log
            << std::endl;
  return kExitRejected;
}

std::string describe(const ledger_event_t& event) {
  return std::visit(
      overloaded{[](const vault_created_t& value) {
                   return std::string{"VaultCreated "} +
                          std::to_string(value.vault_id) + " " +
                          to_hex(value.owner);
                 },
                 [](const vault_deposited_t& value) {
                   return std::string{"VaultDeposited "} +
                          std::to_string(value.vault_id) + " " +
                          to_hex(value.owner) + " " + to_string(value.amount);
                 },
                 [](const vault_withdrawn_t& value) {
                   return std::string{"VaultWithdrawn "} +
                          std::to_string(value.vault_id) + " " +
                          to_hex(value.owner) + " " + to_string(value.amount);
                 }},
      event);
}

// Vault rows, the events they produced and the state root land in one batch.
void commit(const coffer::persistence::storage_t& storage,
            coffer::persistence::audit_log& audit,
            const coffer::ledger::vault_ledger& ledger) {
  coffer::persistence::save_checkpoint(storage, ledger,
                                       audit.staged_entries());
  audit.mark_committed();
}

int run_command(const coffer::persistence::storage_t& storage,
                coffer::persistence::audit_log& audit,
                coffer::ledger::vault_ledger& ledger,
                const invocation& call) {
  const auto& command = call.command;
  const auto& args = call.args;
  const auto mutating =
      command == "create" || command == "deposit" || command == "withdraw";

  if ((mutating || command == "owned") && !call.caller) {
    return usage_error("--caller is required for '" + command + "'");
  }

  if (command == "create") {
    auto result = ledger.create_vault(*call.caller);
    if (result.code != ledger_error_code::ok) {
      return rejected(result);
    }
    commit(storage, audit, ledger);
    std::cout << *result.vault_id << std::endl;
    return kExitOk;
  }

  if (command == "deposit" || command == "withdraw") {
    if (args.size() != 2) {
      return usage_error("'" + command + "' expects <vault-id> <amount>");
    }
    auto vault_id = parse_u64(args[0]);
    auto amount = try_make_amount(args[1]);
    if (!vault_id || !amount) {
      return usage_error("vault id and amount must be unsigned integers");
    }
    auto result = command == "deposit"
                      ? ledger.deposit(*call.caller, *vault_id, *amount)
                      : ledger.withdraw(*call.caller, *vault_id, *amount);
    if (result.code != ledger_error_code::ok) {
      return rejected(result);
    }
    commit(storage, audit, ledger);
    std::cout << to_string(ledger.get_vault(*vault_id).vault->balance)
              << std::endl;
    return kExitOk;
  }

  if (command == "show") {
    auto vault_id = args.size() == 1 ? parse_u64(args[0]) : std::nullopt;
    if (!vault_id) {
      return usage_error("'show' expects <vault-id>");
    }
    auto query = ledger.get_vault(*vault_id);
    if (query.code != ledger_error_code::ok) {
      std::cerr << "error: " << to_string(query.code) << ": " << query.log
                << std::endl;
      return kExitRejected;
    }
    std::cout << query.vault->id << " " << to_hex(query.vault->owner) << " "
              << to_string(query.vault->balance) << std::endl;
    return kExitOk;
  }

  if (command == "count") {
    std::cout << ledger.vault_count() << std::endl;
    return kExitOk;
  }

  if (command == "owned") {
    for (const auto vault_id : ledger.vaults_owned_by(*call.caller)) {
      std::cout << vault_id << std::endl;
    }
    return kExitOk;
  }

  if (command == "total") {
    std::cout << to_string(ledger.total_balance()) << std::endl;
    return kExitOk;
  }

  if (command == "root") {
    std::cout << to_hex(ledger.state_root()) << std::endl;
    return kExitOk;
  }

  if (command == "events") {
    auto from = args.empty() ? std::optional<uint64_t>{0} : parse_u64(args[0]);
    auto to = args.size() < 2
                  ? std::optional<uint64_t>{std::numeric_limits<uint64_t>::max()}
                  : parse_u64(args[1]);
    if (args.size() > 2 || !from || !to) {
      return usage_error("'events' expects [from] [to]");
    }
    auto sequence = *from;
    for (const auto& event : audit.range(*from, *to)) {
      std::cout << sequence++ << " " << describe(event) << std::endl;
    }
    return kExitOk;
  }

  return usage_error("unknown command '" + command + "'");
}

}  // namespace

int main(int argc, char* argv[]) {
  auto db_path = std::string{};
  auto caller_hex = std::string{};
  auto log_level = std::string{};
  auto log_file = std::string{};
  auto config_path = std::string{};
  auto call = invocation{};

  auto description = po::options_description{"coffer-ledger"};
  description.add_options()("help,h", "Show the help message")(
      "config,c", po::value<std::string>(&config_path),
      "INI file with option defaults")(
      "db-path,d",
      po::value<std::string>(&db_path)->default_value("./coffer-data"),
      "RocksDB directory holding the ledger")(
      "caller", po::value<std::string>(&caller_hex),
      "Hex identity (32 bytes) the command runs as")(
      "log-level,l", po::value<std::string>(&log_level)->default_value("info"),
      "trace, debug, info, warn, error, critical or off")(
      "log-file", po::value<std::string>(&log_file),
      "Also write logs to this file");

  auto hidden = po::options_description{};
  hidden.add_options()("command", po::value<std::string>(&call.command))(
      "args", po::value<std::vector<std::string>>(&call.args));

  auto all = po::options_description{};
  all.add(description).add(hidden);

  auto positional = po::positional_options_description{};
  positional.add("command", 1).add("args", -1);

  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(all)
                  .positional(positional)
                  .run(),
              vm);
    if (vm.contains("config")) {
      po::store(po::parse_config_file(
                    vm["config"].as<std::string>().c_str(), description),
                vm);
    }
    po::notify(vm);
  } catch (const po::error& ex) {
    return usage_error(ex.what());
  }

  if (vm.contains("help") || call.command.empty()) {
    std::cout << description << std::endl;
    std::cout << "commands: create | deposit <id> <amount> | withdraw <id> "
                 "<amount> | show <id> | count | owned | total | root | "
                 "events [from] [to]"
              << std::endl;
    return vm.contains("help") ? kExitOk : kExitUsage;
  }

  const auto level = spdlog::level::from_str(log_level);
  if (level == spdlog::level::off && log_level != "off") {
    return usage_error("unknown log level '" + log_level + "'");
  }
  if (vm.contains("caller")) {
    call.caller = try_make_hash32(caller_hex);
    if (!call.caller) {
      return usage_error("--caller must be 32 bytes of hex");
    }
  }

  spdlog::init_thread_pool(8192, 1);
  auto sinks = std::vector<spdlog::sink_ptr>{
      std::make_shared<spdlog::sinks::stderr_color_sink_mt>()};
  if (!log_file.empty()) {
    sinks.push_back(
        std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false));
  }
  auto logger = std::make_shared<spdlog::async_logger>(
      "coffer", std::begin(sinks), std::end(sinks), spdlog::thread_pool(),
      spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(level);

  auto storage =
      coffer::storage::make_storage<coffer::storage::rocksdb_storage_tag>(
          db_path);
  auto audit = coffer::persistence::audit_log{storage};
  auto ledger = coffer::ledger::vault_ledger{
      [](const identity_t& recipient, const amount_t& amount) {
        spdlog::info("Released {} to {}", to_string(amount), to_hex(recipient));
        return true;
      },
      audit.sink()};

  auto exit_code = kExitOk;
  auto error = std::string{};
  if (!coffer::persistence::load_checkpoint(storage, ledger, error)) {
    std::cerr << "error: cannot restore ledger: " << error << std::endl;
    exit_code = kExitState;
  } else {
    exit_code = run_command(storage, audit, ledger, call);
  }

  spdlog::shutdown();
  return exit_code;
}
