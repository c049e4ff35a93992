#pragma once

#include <boost/program_options.hpp>
#include <strata/retention/retention_policy.hpp>
#include <strata/schema/period_token.hpp>
#include <strata/storage/storage.hpp>
#include <optional>
#include <string>
#include <vector>

namespace strata::config {

/// Daemon configuration. Defaults match a fresh deployment.
struct options final {
  std::string db_path{"strata.db"};
  std::string schema{"strata"};
  std::string time_zone{"UTC"};
  /// Boost zonespec CSV that region timezones resolve against.
  std::string tz_database;
  std::string month_schedule{"0 8 1 * *"};
  std::string year_schedule{"0 9 1 1 *"};
  strata::storage::storage_options storage;
  strata::retention::retention_policy retention;
  std::string log_file{"strata.log"};
  bool verbose{false};
  bool help{false};
  /// Run one aggregation and exit instead of serving.
  std::optional<strata::schema::period_token_t> aggregate;
  /// Drop this schema and exit instead of serving.
  std::optional<std::string> drop_schema;
};

/// Option table with defaults, for --help output.
boost::program_options::options_description make_description();

/// Parse command-line arguments (without the program name), then the file
/// named by --config. Command-line values win. Throws
/// strata::common::configuration_error for unknown or invalid options.
options parse_options(const std::vector<std::string>& arguments);
options parse_options(int argc, char* argv[]);

/// Throws strata::common::configuration_error if any value is unusable.
void validate(const options& value);

}  // namespace strata::config
