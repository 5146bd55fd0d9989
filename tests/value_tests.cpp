#include "widerow/decode/value.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <string>

using namespace widerow::decode;

TEST_CASE("Value distinguishes no value from present alternatives")
{
    const Value empty{};
    CHECK_FALSE(empty.has_value());
    CHECK(empty.holds<std::monostate>());

    const Value number{std::int32_t{42}};
    CHECK(number.has_value());
    CHECK(number.holds<std::int32_t>());
    CHECK_FALSE(number.holds<std::int64_t>());
    CHECK(number.get<std::int32_t>() == 42);
}

TEST_CASE("Value equality compares alternative and payload")
{
    CHECK(Value{std::int32_t{1}} == Value{std::int32_t{1}});
    CHECK_FALSE(Value{std::int32_t{1}} == Value{std::int64_t{1}});
    CHECK(Value{std::string{"a"}} == Value{std::string{"a"}});
    CHECK(make_tuple_value({Value{true}, Value{}}) == make_tuple_value({Value{true}, Value{}}));
    CHECK_FALSE(make_tuple_value({Value{true}, Value{}}) == make_tuple_value({Value{true}, Value{false}}));
}

TEST_CASE("Value renders as text")
{
    CHECK(to_string(Value{}) == "null");
    CHECK(to_string(Value{true}) == "true");
    CHECK(to_string(Value{std::int16_t{-3}}) == "-3");
    CHECK(to_string(Value{std::int64_t{9'000'000'000LL}}) == "9000000000");
    CHECK(to_string(Value{1.5}) == "1.5");
    CHECK(to_string(Value{0.25F}) == "0.25");
    CHECK(to_string(Value{Decimal::from_int64(-1050, 2)}) == "-10.50");
    CHECK(to_string(Value{std::string{"say \"hi\""}}) == "\"say \\\"hi\\\"\"");
    CHECK(to_string(make_tuple_value({Value{std::int32_t{42}}, Value{}, Value{std::string{"x"}}})) ==
          "(42, null, \"x\")");
}
