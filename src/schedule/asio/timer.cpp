#include <spdlog/spdlog.h>
#include <strata/schedule/asio/timer.hpp>
#include <strata/schema/calendar.hpp>

namespace strata::schedule {

timer<asio_timer_tag>::timer(boost::asio::io_context& context)
    : context{&context}, handle{context} {}

strata::schema::timestamp_milliseconds_t timer<asio_timer_tag>::now() const {
  return strata::schema::calendar::from_time_point(
      std::chrono::system_clock::now());
}

void timer<asio_timer_tag>::arm(
    const strata::schema::timestamp_milliseconds_t deadline,
    timer_handler_t handler) {
  handle.expires_at(strata::schema::calendar::to_time_point(deadline));
  handle.async_wait(
      [handler = std::move(handler)](const boost::system::error_code& ec) {
        if (ec && ec != boost::asio::error::operation_aborted) {
          spdlog::warn("Timer wait failed: {}", ec.message());
        }
        handler(ec == boost::asio::error::operation_aborted);
      });
}

void timer<asio_timer_tag>::cancel() {
  handle.cancel();
}

void timer<asio_timer_tag>::post(std::function<void()> fn) {
  boost::asio::post(*context, std::move(fn));
}

}  // namespace strata::schedule
