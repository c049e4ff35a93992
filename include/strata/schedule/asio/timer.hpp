#pragma once
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/system_timer.hpp>
#include <strata/schedule/timer.hpp>

namespace strata::schedule {

struct asio_timer_tag {};

template <>
struct timer<asio_timer_tag> final {
  explicit timer(boost::asio::io_context& context);

  strata::schema::timestamp_milliseconds_t now() const;
  void arm(strata::schema::timestamp_milliseconds_t deadline,
           timer_handler_t handler);
  void cancel();
  void post(std::function<void()> fn);

  boost::asio::io_context* context{nullptr};
  boost::asio::system_timer handle;
};

}  // namespace strata::schedule
