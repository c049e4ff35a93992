#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <strata/common/error.hpp>
#include <strata/config/options.hpp>
#include <strata/retention/retention_enforcer.hpp>
#include <strata/rollup/aggregator.hpp>
#include <strata/schedule/asio/timer.hpp>
#include <strata/schedule/rollup_jobs.hpp>
#include <strata/schema/encoding/scale/encoder.hpp>
#include <strata/schema/history_log.hpp>
#include <strata/schema/period_token.hpp>
#include <strata/storage/admin.hpp>
#include <strata/storage/rocksdb/storage.hpp>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>

namespace {

void install_logger(const strata::config::options& options) {
  spdlog::init_thread_pool(8192, 1);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");

  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
      options.log_file, false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "main", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);

  spdlog::set_default_logger(logger);
  spdlog::set_level(options.verbose ? spdlog::level::debug
                                    : spdlog::level::info);
}

int serve(const strata::config::options& options,
          strata::rollup::aggregator& aggregator,
          strata::retention::retention_enforcer& retention) {
  const auto& policy = retention.policy();
  spdlog::info("Retention caps presence={} avatar={} name={}, tie-break {}",
               policy.for_log(strata::schema::history_log_t::presence).cap,
               policy.for_log(strata::schema::history_log_t::avatar).cap,
               policy.for_log(strata::schema::history_log_t::name).cap,
               strata::schema::to_string(policy.tie_break));
  retention.enforce_caps();

  auto context = boost::asio::io_context{};
  auto jobs = strata::schedule::schedule_rollups<strata::schedule::asio_timer_tag>(
      aggregator,
      [&context] {
        return strata::schedule::timer<strata::schedule::asio_timer_tag>{
            context};
      },
      options.month_schedule, options.year_schedule, options.time_zone);

  auto signals = boost::asio::signal_set{context, SIGINT, SIGTERM};
  signals.async_wait([&](const boost::system::error_code& ec, const int signal) {
    if (ec) {
      return;
    }
    spdlog::info("Received signal {}, shutting down", signal);
    jobs.stop();
    context.stop();
  });

  spdlog::info("Serving schema '{}' (timezone {})", options.schema,
               options.time_zone);
  context.run();
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto options = strata::config::options{};
  try {
    options = strata::config::parse_options(argc, argv);
  } catch (const strata::common::configuration_error& e) {
    std::cerr << "strata: " << e.what() << std::endl;
    std::cerr << strata::config::make_description() << std::endl;
    return 2;
  }

  if (options.help) {
    std::cout << strata::config::make_description() << std::endl;
    return 0;
  }

  install_logger(options);

  auto encoder = strata::schema::encoding::encoder<
      strata::schema::encoding::scale_encoder_tag>{};
  auto storage =
      strata::storage::make_storage<strata::storage::rocksdb_storage_tag>(
          options.db_path, options.storage);

  auto status = 0;
  try {
    if (options.drop_schema) {
      strata::storage::admin::drop_schema(storage, *options.drop_schema);
    } else {
      auto aggregator = strata::rollup::aggregator{encoder, storage,
                                                   options.schema};
      if (options.aggregate) {
        aggregator.aggregate(*options.aggregate);
      } else {
        auto retention = strata::retention::retention_enforcer{
            encoder, storage, options.schema, options.retention};
        status = serve(options, aggregator, retention);
      }
    }
  } catch (const strata::common::configuration_error& e) {
    spdlog::error("Configuration error: {}", e.what());
    status = 2;
  } catch (const strata::common::error& e) {
    spdlog::error("{}", e.what());
    status = 1;
  }

  spdlog::shutdown();
  return status;
}
