/* Copyright 2024 The flowexpr Authors. All Rights Reserved.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *    http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "include/flowexpr/utils/value.h"

#include "gtest/gtest.h"

namespace flowexpr {
namespace {

TEST(ValueTest, TypeNames) {
  EXPECT_EQ("NoneType", Value().type_name());
  EXPECT_EQ("bool", Value(true).type_name());
  EXPECT_EQ("int", Value(1).type_name());
  EXPECT_EQ("float", Value(1.5).type_name());
  EXPECT_EQ("str", Value("x").type_name());
  EXPECT_EQ("list", Value(Value::List{}).type_name());
  EXPECT_EQ("dict", Value(Value::Map{}).type_name());
}

TEST(ValueTest, NumericEquality) {
  EXPECT_EQ(Value(1), Value(1.0));
  EXPECT_NE(Value(1), Value(1.5));
  EXPECT_EQ(Value(true), Value(1));
  EXPECT_EQ(Value(false), Value(0));
  EXPECT_EQ(Value(true), Value(1.0));
  EXPECT_NE(Value(true), Value(2));
  EXPECT_NE(Value(false), Value());
  EXPECT_EQ(Value(Value::List{1, 0}), Value(Value::List{true, false}));
  EXPECT_NE(Value("1"), Value(1));
  EXPECT_EQ(Value(), Value(nullptr));
}

TEST(ValueTest, MapEqualityIgnoresOrder) {
  Value a(Value::Map{{"x", 1}, {"y", "two"}});
  Value b(Value::Map{{"y", "two"}, {"x", 1}});
  EXPECT_EQ(a, b);
  b.Set("x", 2);
  EXPECT_NE(a, b);
}

TEST(ValueTest, SetAndFind) {
  Value map;
  map.Set("a", 1);
  map.Set("b", Value::List{1, 2});
  map.Set("a", 3);
  ASSERT_TRUE(map.is_map());
  ASSERT_EQ(2u, map.as_map().size());
  EXPECT_EQ("a", map.as_map()[0].first);
  EXPECT_EQ(Value(3), *map.Find("a"));
  EXPECT_EQ(nullptr, map.Find("missing"));
  EXPECT_EQ(nullptr, Value(1).Find("a"));
}

TEST(ValueTest, Truthiness) {
  EXPECT_FALSE(Value().truthy());
  EXPECT_FALSE(Value(0).truthy());
  EXPECT_FALSE(Value(0.0).truthy());
  EXPECT_FALSE(Value("").truthy());
  EXPECT_FALSE(Value(Value::List{}).truthy());
  EXPECT_TRUE(Value("false").truthy());
  EXPECT_TRUE(Value(Value::Map{{"k", nullptr}}).truthy());
}

TEST(ValueTest, StringForms) {
  EXPECT_EQ("None", ToString(Value()));
  EXPECT_EQ("True", ToString(Value(true)));
  EXPECT_EQ("42", ToString(Value(42)));
  EXPECT_EQ("5.0", ToString(Value(5.0)));
  EXPECT_EQ("0.1", ToString(Value(0.1)));
  EXPECT_EQ("1234.5", ToString(Value(1234.5)));
  EXPECT_EQ("text", ToString(Value("text")));
  EXPECT_EQ("'text'", Repr(Value("text")));
  EXPECT_EQ("[1, \"a\", null]",
            ToString(Value(Value::List{1, "a", nullptr})));
  EXPECT_EQ("{\"b\": 1, \"a\": [true]}",
            ToString(Value(Value::Map{{"b", 1}, {"a", Value::List{true}}})));
}

TEST(ValueTest, PrettyJson) {
  Value value(Value::Map{{"a", Value::List{1, 2}}});
  EXPECT_EQ("{\n  \"a\": [\n    1,\n    2\n  ]\n}", ValueToJson(value, true));
  EXPECT_EQ("[]", ValueToJson(Value(Value::List{}), true));
}

TEST(ValueTest, JsonEscaping) {
  EXPECT_EQ("\"quote\\\" slash\\\\ nl\\n\"",
            ValueToJson(Value("quote\" slash\\ nl\n")));
}

TEST(ValueTest, FromJson) {
  auto parsed = ValueFromJson(
      R"({"name": "John", "age": 30, "ratio": 0.5, "tags": ["a", null],
          "ok": true})");
  ASSERT_TRUE(parsed.ok()) << parsed.status();
  EXPECT_TRUE(parsed->Find("age")->is_int());
  EXPECT_EQ(Value(30), *parsed->Find("age"));
  EXPECT_TRUE(parsed->Find("ratio")->is_double());
  EXPECT_EQ(Value("John"), *parsed->Find("name"));
  EXPECT_EQ(Value(Value::List{"a", nullptr}), *parsed->Find("tags"));
  EXPECT_EQ(Value(true), *parsed->Find("ok"));

  auto scalar = ValueFromJson("42");
  ASSERT_TRUE(scalar.ok());
  EXPECT_EQ(Value(42), *scalar);

  EXPECT_FALSE(ValueFromJson("{not json").ok());
}

TEST(ValueTest, FromJsonKeepsKeyOrderAndExactNumbers) {
  auto parsed = ValueFromJson(
      R"({"z": 1, "a": 2.0, "id": 9007199254740993,
          "big": 18446744073709551615})");
  ASSERT_TRUE(parsed.ok()) << parsed.status();
  const auto& map = parsed->as_map();
  ASSERT_EQ(4u, map.size());
  EXPECT_EQ("z", map[0].first);
  EXPECT_EQ("a", map[1].first);
  EXPECT_TRUE(map[1].second.is_double());
  EXPECT_TRUE(map[2].second.is_int());
  EXPECT_EQ(int64_t{9007199254740993}, map[2].second.as_int());
  EXPECT_TRUE(map[3].second.is_double());
  EXPECT_EQ(
      R"({"z": 1, "a": 2.0, "id": 9007199254740993, )"
      R"("big": 1.8446744073709552e+19})",
      ValueToJson(*parsed));

  std::string deep(1000, '[');
  deep.append(1000, ']');
  EXPECT_FALSE(ValueFromJson(deep).ok());
}

}  // namespace
}  // namespace flowexpr
