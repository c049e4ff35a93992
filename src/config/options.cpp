#include <spdlog/fmt/fmt.h>
#include <strata/common/error.hpp>
#include <strata/config/options.hpp>
#include <strata/schedule/schedule_spec.hpp>
#include <strata/schedule/time_zone.hpp>
#include <strata/storage/admin.hpp>

#include <fstream>

namespace strata::config {

namespace {

namespace po = boost::program_options;

struct raw_options final {
  std::string config_file;
  std::string tie_break{"newest"};
  std::string aggregate;
  std::string drop_schema;
};

po::options_description make_description(options& out, raw_options& raw) {
  auto& presence = out.retention.for_log(strata::schema::history_log_t::presence);
  auto& avatar = out.retention.for_log(strata::schema::history_log_t::avatar);
  auto& name = out.retention.for_log(strata::schema::history_log_t::name);

  auto description = po::options_description{"Strata"};
  description.add_options()("help,h", "Show the help message")(
      "config,c", po::value<std::string>(&raw.config_file),
      "INI file with the same keys as the command line")(
      "db-path,d", po::value<std::string>(&out.db_path)->default_value(out.db_path),
      "RocksDB directory")(
      "schema,s", po::value<std::string>(&out.schema)->default_value(out.schema),
      "Schema every key lives under")(
      "timezone,t",
      po::value<std::string>(&out.time_zone)->default_value(out.time_zone),
      "Timezone the rollup schedules are evaluated in")(
      "tz-database", po::value<std::string>(&out.tz_database),
      "Boost date_time zonespec CSV for region timezones")(
      "month-schedule",
      po::value<std::string>(&out.month_schedule)
          ->default_value(out.month_schedule),
      "Cron expression for the monthly rollup")(
      "year-schedule",
      po::value<std::string>(&out.year_schedule)
          ->default_value(out.year_schedule),
      "Cron expression for the yearly rollup")(
      "lock-timeout-ms",
      po::value<int64_t>(&out.storage.lock_timeout_ms)
          ->default_value(out.storage.lock_timeout_ms),
      "How long a transaction waits for a lock")(
      "transaction-timeout-ms",
      po::value<int64_t>(&out.storage.transaction_timeout_ms)
          ->default_value(out.storage.transaction_timeout_ms),
      "Maximum lifetime of a transaction")(
      "presence-cap",
      po::value<std::size_t>(&presence.cap)->default_value(presence.cap),
      "Presence history entries kept per subject")(
      "avatar-cap",
      po::value<std::size_t>(&avatar.cap)->default_value(avatar.cap),
      "Avatar history entries kept per subject")(
      "name-cap", po::value<std::size_t>(&name.cap)->default_value(name.cap),
      "Name history entries kept per subject")(
      "tie-break",
      po::value<std::string>(&raw.tie_break)->default_value(raw.tie_break),
      "Which insert ranks as more recent on equal timestamps: newest|oldest")(
      "log-file",
      po::value<std::string>(&out.log_file)->default_value(out.log_file),
      "Log file path")("verbose,v",
                       po::bool_switch(&out.verbose)->default_value(false),
                       "Enable verbose output")(
      "aggregate", po::value<std::string>(&raw.aggregate),
      "Run one rollup (month|year) and exit")(
      "drop-schema", po::value<std::string>(&raw.drop_schema),
      "Delete every key of the named schema and exit");
  return description;
}

options finish(options out, const raw_options& raw, const po::variables_map& vm) {
  out.help = vm.contains("help");

  auto tie_break =
      strata::schema::try_from_string<strata::schema::tie_break_policy_t>(
          raw.tie_break);
  if (!tie_break) {
    throw strata::common::configuration_error{
        fmt::format("unknown tie-break policy '{}'", raw.tie_break)};
  }
  out.retention.tie_break = *tie_break;

  if (vm.contains("aggregate")) {
    auto token = strata::schema::try_from_string<strata::schema::period_token_t>(
        raw.aggregate);
    if (!token) {
      throw strata::common::configuration_error{
          fmt::format("unknown period token '{}'", raw.aggregate)};
    }
    out.aggregate = *token;
  }
  if (vm.contains("drop-schema")) {
    out.drop_schema = raw.drop_schema;
  }
  return out;
}

options parse(const std::vector<std::string>& arguments) {
  auto out = options{};
  auto raw = raw_options{};
  auto description = make_description(out, raw);
  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(arguments).options(description).run(),
              vm);
    if (vm.contains("config")) {
      auto path = vm["config"].as<std::string>();
      auto file = std::ifstream{path};
      if (!file) {
        throw strata::common::configuration_error{
            fmt::format("cannot open config file '{}'", path)};
      }
      po::store(po::parse_config_file(file, description), vm);
    }
    po::notify(vm);
  } catch (const po::error& e) {
    throw strata::common::configuration_error{e.what()};
  }
  out = finish(std::move(out), raw, vm);
  if (out.help) {
    return out;
  }
  if (!out.tz_database.empty()) {
    strata::schedule::load_time_zone_database(out.tz_database);
  }
  validate(out);
  return out;
}

}  // namespace

po::options_description make_description() {
  // The table keeps pointers to its targets; these outlive it.
  static auto out = options{};
  static auto raw = raw_options{};
  return make_description(out, raw);
}

options parse_options(const std::vector<std::string>& arguments) {
  return parse(arguments);
}

options parse_options(const int argc, char* argv[]) {
  auto arguments = std::vector<std::string>{};
  for (auto i = 1; i < argc; ++i) {
    arguments.emplace_back(argv[i]);
  }
  return parse(arguments);
}

void validate(const options& value) {
  if (!strata::storage::admin::is_valid_schema_name(value.schema)) {
    throw strata::common::configuration_error{
        fmt::format("invalid schema name '{}'", value.schema)};
  }
  if (value.db_path.empty()) {
    throw strata::common::configuration_error{"db-path must not be empty"};
  }
  if (value.storage.lock_timeout_ms <= 0 ||
      value.storage.transaction_timeout_ms <= 0) {
    throw strata::common::configuration_error{
        "lock and transaction timeouts must be positive"};
  }
  strata::retention::validate(value.retention);
  strata::schedule::make_schedule_spec(value.month_schedule, value.time_zone);
  strata::schedule::make_schedule_spec(value.year_schedule, value.time_zone);
  if (value.drop_schema) {
    if (!strata::storage::admin::is_valid_schema_name(*value.drop_schema)) {
      throw strata::common::configuration_error{
          fmt::format("invalid schema name '{}'", *value.drop_schema)};
    }
    if (value.aggregate) {
      throw strata::common::configuration_error{
          "--drop-schema cannot be combined with --aggregate"};
    }
  }
}

}  // namespace strata::config
