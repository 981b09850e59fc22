#include <gtest/gtest.h>
#include <bursar/schema/event_type.hpp>
#include <bursar/schema/ledger_error_code.hpp>
#include <bursar/schema/primitives.hpp>
#include <bursar/schema/transaction_state.hpp>

#include <string>

TEST(primitives, try_make_amount_accepts_plain_decimals) {
  EXPECT_TRUE(bursar::schema::try_make_amount("1").has_value());
  EXPECT_TRUE(bursar::schema::try_make_amount("1.5").has_value());
  EXPECT_TRUE(bursar::schema::try_make_amount(".5").has_value());
  EXPECT_TRUE(bursar::schema::try_make_amount("5.").has_value());
  EXPECT_TRUE(bursar::schema::try_make_amount("+2.0001").has_value());
  EXPECT_EQ(*bursar::schema::try_make_amount("-0.25"),
            bursar::schema::amount_t{"-0.25"});
}

TEST(primitives, try_make_amount_rejects_everything_else) {
  for (const auto* text : {"", ".", "-", "1e5", "nan", "inf", "1.2.3", "1,5",
                           "0x10", " 1", "12345678901234567890123456789012345678901"}) {
    EXPECT_FALSE(bursar::schema::try_make_amount(text).has_value()) << text;
  }
}

TEST(primitives, format_amount_uses_fixed_precision) {
  EXPECT_EQ(bursar::schema::format_amount(bursar::schema::amount_t{"1.5"}, 4),
            "1.5000");
  EXPECT_EQ(bursar::schema::format_amount(bursar::schema::amount_t{"11"}, 1),
            "11.0");
  EXPECT_EQ(bursar::schema::format_amount(bursar::schema::amount_t{"-2.25"}, 2),
            "-2.25");
}

TEST(primitives, format_amount_prints_exact_zero_unsigned) {
  auto value = bursar::schema::amount_t{"0.1"};
  value -= bursar::schema::amount_t{"0.1"};
  EXPECT_EQ(bursar::schema::format_amount(value, 4), "0.0000");
}

TEST(primitives, format_amount_with_zero_precision_prints_whole_numbers) {
  EXPECT_EQ(bursar::schema::format_amount(bursar::schema::amount_t{"1.5"}, 0),
            "2");
  EXPECT_EQ(bursar::schema::format_amount(bursar::schema::amount_t{"2.25"}, 0),
            "2");
  EXPECT_EQ(bursar::schema::format_amount(bursar::schema::amount_t{"11"}, 0),
            "11");
  EXPECT_EQ(bursar::schema::format_amount(bursar::schema::amount_t{"0"}, 0),
            "0");
  EXPECT_EQ(bursar::schema::format_amount(bursar::schema::amount_t{"-0.25"}, 0),
            "0");
}

TEST(primitives, format_amount_drops_sign_when_rounding_to_zero) {
  EXPECT_EQ(
      bursar::schema::format_amount(bursar::schema::amount_t{"-0.001"}, 2),
      "0.00");
}

TEST(primitives, serialized_amount_parses_back_exactly) {
  for (const auto* literal :
       {"123456789.0001", "0.1", "-42", "0", "0.0000000000000000000000001"}) {
    auto value = bursar::schema::amount_t{literal};
    auto text = bursar::schema::serialize_amount(value);
    EXPECT_EQ(bursar::schema::amount_t{text.c_str()}, value) << literal;
  }
}

TEST(primitives, serialized_amount_drops_trailing_zeros) {
  auto text =
      bursar::schema::serialize_amount(bursar::schema::amount_t{"0.1"});
  EXPECT_EQ(text.find("0e"), std::string::npos) << text;
  EXPECT_LT(text.size(), 10u) << text;
}

TEST(primitives, bytes_round_trip_strings) {
  auto bytes = bursar::schema::make_bytes(std::string{"abc"});
  ASSERT_EQ(bytes.size(), 3u);
  EXPECT_EQ(bytes[0], 'a');
  EXPECT_EQ(bursar::schema::make_string(bytes), "abc");
}

TEST(enum_string, event_types_parse_exactly) {
  using bursar::schema::event_type_t;
  EXPECT_EQ(bursar::schema::try_from_string<event_type_t>("chargeback"),
            event_type_t::chargeback);
  EXPECT_FALSE(
      bursar::schema::try_from_string<event_type_t>("Chargeback").has_value());
  EXPECT_EQ(bursar::schema::to_string(event_type_t::withdrawal), "withdrawal");
}

TEST(enum_string, ledger_error_names_are_stable) {
  using bursar::schema::ledger_error_code;
  EXPECT_EQ(bursar::schema::to_string(ledger_error_code::account_frozen),
            "account_frozen");
  EXPECT_EQ(bursar::schema::to_string(
                ledger_error_code::transaction_cannot_be_disputed),
            "transaction_cannot_be_disputed");
  EXPECT_EQ(bursar::schema::to_string(static_cast<ledger_error_code>(999)),
            "unknown");
}

TEST(transaction_state, kind_and_amount_follow_the_alternative) {
  auto state = bursar::schema::transaction_state_t{
      bursar::schema::disputed_t{.amount = bursar::schema::amount_t{"4"}}};
  EXPECT_EQ(bursar::schema::kind_of(state),
            bursar::schema::transaction_state_kind::disputed);
  EXPECT_EQ(bursar::schema::amount_of(state), bursar::schema::amount_t{"4"});

  auto rebuilt = bursar::schema::make_transaction_state(
      bursar::schema::transaction_state_kind::withdrawn,
      bursar::schema::amount_t{"2"});
  EXPECT_TRUE(std::holds_alternative<bursar::schema::withdrawn_t>(rebuilt));
}
