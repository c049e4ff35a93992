#include <gtest/gtest.h>
#include <strata/schema/counter_tier.hpp>
#include <strata/schema/counter_type.hpp>
#include <strata/schema/history_log.hpp>
#include <strata/schema/encoding/scale/encoder.hpp>
#include <strata/schema/period_token.hpp>
#include <strata/schema/tie_break_policy.hpp>

#include <string>
#include <tuple>

namespace {

using encoder_t = strata::schema::encoding::encoder<
    strata::schema::encoding::scale_encoder_tag>;

}  // namespace

TEST(encoding, counts_are_fixed_width_little_endian) {
  auto encoder = encoder_t{};
  auto encoded = encoder.encode(strata::schema::count_t{0x0102});
  ASSERT_EQ(encoded.size(), 8u);
  EXPECT_EQ(encoded[0], 0x02);
  EXPECT_EQ(encoded[1], 0x01);
  EXPECT_EQ(encoder.decode<strata::schema::count_t>(encoded), 0x0102u);
}

TEST(encoding, try_decode_rejects_truncated_input) {
  auto encoder = encoder_t{};
  auto truncated = strata::schema::bytes_t{0x01, 0x02, 0x03};
  EXPECT_FALSE(encoder.try_decode<strata::schema::count_t>(truncated));
}

TEST(encoding, history_tuple_keeps_payload_and_detail) {
  auto encoder = encoder_t{};
  auto value = std::tuple<uint16_t, strata::schema::bytes_t, std::string,
                          uint64_t, uint64_t>{
      1, strata::schema::bytes_t{0xDE, 0xAD}, "png", 1700000000000ULL, 3};
  auto encoded = encoder.encode(value);
  EXPECT_EQ(encoder.decode<decltype(value)>(encoded), value);
}

TEST(enum_string, wire_names_resolve) {
  EXPECT_EQ(strata::schema::try_from_string<strata::schema::counter_type_t>(
                "battle"),
            strata::schema::counter_type_t::battle);
  EXPECT_EQ(strata::schema::try_from_string<strata::schema::period_token_t>(
                "year"),
            strata::schema::period_token_t::year);
  EXPECT_EQ(
      strata::schema::try_from_string<strata::schema::tie_break_policy_t>(
          "oldest"),
      strata::schema::tie_break_policy_t::oldest_insert_wins);
  EXPECT_FALSE(strata::schema::try_from_string<strata::schema::period_token_t>(
                   "week")
                   .has_value());
  EXPECT_EQ(strata::schema::to_string(strata::schema::counter_type_t::hunt),
            "hunt");
}

TEST(enum_string, names_round_trip_and_unknown_values_are_labelled) {
  for (const auto& [name, log] :
       strata::schema::enum_names<strata::schema::history_log_t>::kNames) {
    EXPECT_EQ(strata::schema::to_string(log), name);
    EXPECT_EQ(
        strata::schema::try_from_string<strata::schema::history_log_t>(name),
        log);
  }
  EXPECT_EQ(strata::schema::to_string(strata::schema::counter_tier_t::medium),
            "medium");
  EXPECT_EQ(
      strata::schema::to_string(static_cast<strata::schema::counter_tier_t>(9)),
      "unknown");
}
