// tests/unit/values/test_value.cpp - Unit tests for the Value tree

#include <gtest/gtest.h>

#include "chartscan/values/value.hpp"

using namespace chartscan;

TEST(ValuesValue, DefaultIsNull)
{
  const Value v;
  EXPECT_TRUE(v.is_null());
  EXPECT_EQ(v.size(), 0U);
  EXPECT_EQ(v.find("x"), nullptr);
}

TEST(ValuesValue, ScalarFactories)
{
  EXPECT_EQ(Value::make_integer(42).scalar_kind(), ScalarKind::Integer);
  EXPECT_EQ(Value::make_integer(42).scalar_text(), "42");
  EXPECT_EQ(Value::make_bool(true).scalar_text(), "true");
  EXPECT_EQ(Value::make_string("web").scalar_kind(), ScalarKind::String);
  EXPECT_TRUE(Value::make_float(1.5).is_scalar());
}

TEST(ValuesValue, CopyIsDeep)
{
  ValueMapping inner;
  inner.emplace("port", Value::make_integer(80));
  ValueMapping outer;
  outer.emplace("service", Value::make_mapping(std::move(inner)));
  const Value original = Value::make_mapping(std::move(outer));

  Value copy = original;
  copy.as_mapping().at("service").as_mapping().at("port") = Value::make_integer(8080);

  EXPECT_EQ(original.find("service")->find("port")->scalar_text(), "80");
  EXPECT_EQ(copy.find("service")->find("port")->scalar_text(), "8080");
  EXPECT_NE(original, copy);
}

TEST(ValuesValue, WrongKindAccessThrows)
{
  const Value scalar = Value::make_string("x");
  EXPECT_THROW((void)scalar.as_mapping(), std::logic_error);
  EXPECT_THROW((void)scalar.as_sequence(), std::logic_error);
}

TEST(ValuesValue, Equality)
{
  ValueSequence a{Value::make_integer(1), Value::make_string("two")};
  ValueSequence b{Value::make_integer(1), Value::make_string("two")};
  EXPECT_EQ(Value::make_sequence(a), Value::make_sequence(b));
  EXPECT_NE(Value::make_string("1"), Value::make_integer(1));
}

TEST(ValuesValue, ClassifyPlainScalar)
{
  EXPECT_EQ(classify_plain_scalar("true"), ScalarKind::Bool);
  EXPECT_EQ(classify_plain_scalar("False"), ScalarKind::Bool);
  EXPECT_EQ(classify_plain_scalar("123"), ScalarKind::Integer);
  EXPECT_EQ(classify_plain_scalar("-7"), ScalarKind::Integer);
  EXPECT_EQ(classify_plain_scalar("0x1F"), ScalarKind::Integer);
  EXPECT_EQ(classify_plain_scalar("0o17"), ScalarKind::Integer);
  EXPECT_EQ(classify_plain_scalar("1.5"), ScalarKind::Float);
  EXPECT_EQ(classify_plain_scalar("1e3"), ScalarKind::Float);
  EXPECT_EQ(classify_plain_scalar(".inf"), ScalarKind::Float);
  EXPECT_EQ(classify_plain_scalar("yes"), ScalarKind::String);
  EXPECT_EQ(classify_plain_scalar("nginx:1.25"), ScalarKind::String);
}

TEST(ValuesValue, NullSpellings)
{
  EXPECT_TRUE(is_null_spelling(""));
  EXPECT_TRUE(is_null_spelling("~"));
  EXPECT_TRUE(is_null_spelling("null"));
  EXPECT_FALSE(is_null_spelling("nil"));
}
