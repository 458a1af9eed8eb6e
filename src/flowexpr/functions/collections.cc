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

#include <algorithm>

#include "absl/strings/str_cat.h"
#include "include/flowexpr/utils/status.h"
#include "src/flowexpr/functions/args.h"
#include "src/flowexpr/functions/operators.h"
#include "src/flowexpr/functions/registry.h"
#include "src/flowexpr/utils/status_macros.h"

namespace flowexpr {
namespace functions {
namespace {

constexpr int64_t kMaxRangeLength = 1000000;

bool ListContains(const Value::List& list, const Value& item) {
  return std::find(list.begin(), list.end(), item) != list.end();
}

void AppendUnique(const Value& item, Value::List* out) {
  if (!ListContains(*out, item)) {
    out->push_back(item);
  }
}

absl::StatusOr<size_t> Length(const Value& value, absl::string_view function) {
  switch (value.type()) {
    case Value::Type::kString: {
      // Code points, not bytes.
      size_t count = 0;
      for (char c : value.as_string()) {
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
          ++count;
        }
      }
      return count;
    }
    case Value::Type::kList:
      return value.as_list().size();
    case Value::Type::kMap:
      return value.as_map().size();
    default:
      return EvaluationError(absl::StrCat(function, "() object of type '",
                                          value.type_name(),
                                          "' has no len()"));
  }
}

void Flatten(const Value& value, Value::List* out) {
  if (value.is_list()) {
    for (const auto& item : value.as_list()) {
      Flatten(item, out);
    }
  } else {
    out->push_back(value);
  }
}

absl::StatusOr<Value> ContainsFn(const Args& args, const CallContext&) {
  FLOWEXPR_ASSIGN_OR_RETURN(bool found, Contains(args[1], args[0]));
  return Value(found);
}

absl::StatusOr<Value> DoesNotContain(const Args& args, const CallContext&) {
  FLOWEXPR_ASSIGN_OR_RETURN(bool found, Contains(args[1], args[0]));
  return Value(!found);
}

absl::StatusOr<Value> LengthFn(const Args& args, const CallContext&) {
  FLOWEXPR_ASSIGN_OR_RETURN(size_t size, Length(args[0], "length"));
  return Value(static_cast<int64_t>(size));
}

absl::StatusOr<Value> IsEmpty(const Args& args, const CallContext&) {
  FLOWEXPR_ASSIGN_OR_RETURN(size_t size, Length(args[0], "is_empty"));
  return Value(size == 0);
}

absl::StatusOr<Value> NotEmpty(const Args& args, const CallContext&) {
  FLOWEXPR_ASSIGN_OR_RETURN(size_t size, Length(args[0], "not_empty"));
  return Value(size > 0);
}

absl::StatusOr<Value> FlattenFn(const Args& args, const CallContext&) {
  FLOWEXPR_ASSIGN_OR_RETURN(const Value::List* items,
                            ListArg(args, 0, "flatten"));
  Value::List out;
  for (const auto& item : *items) {
    Flatten(item, &out);
  }
  return Value(std::move(out));
}

// First occurrence order is kept.
absl::StatusOr<Value> Unique(const Args& args, const CallContext&) {
  FLOWEXPR_ASSIGN_OR_RETURN(const Value::List* items, ListArg(args, 0, "unique"));
  Value::List out;
  for (const auto& item : *items) {
    AppendUnique(item, &out);
  }
  return Value(std::move(out));
}

absl::StatusOr<Value> Union(const Args& args, const CallContext&) {
  Value::List out;
  for (size_t i = 0; i < args.size(); ++i) {
    FLOWEXPR_ASSIGN_OR_RETURN(const Value::List* items,
                              ListArg(args, i, "union"));
    for (const auto& item : *items) {
      AppendUnique(item, &out);
    }
  }
  return Value(std::move(out));
}

absl::StatusOr<Value> Difference(const Args& args, const CallContext&) {
  FLOWEXPR_ASSIGN_OR_RETURN(const Value::List* items,
                            ListArg(args, 0, "difference"));
  FLOWEXPR_ASSIGN_OR_RETURN(const Value::List* excluded,
                            ListArg(args, 1, "difference"));
  Value::List out;
  for (const auto& item : *items) {
    if (!ListContains(*excluded, item)) {
      AppendUnique(item, &out);
    }
  }
  return Value(std::move(out));
}

absl::StatusOr<Value> Zip(const Args& args, const CallContext&) {
  std::vector<const Value::List*> lists;
  size_t rows = 0;
  for (size_t i = 0; i < args.size(); ++i) {
    FLOWEXPR_ASSIGN_OR_RETURN(const Value::List* list, ListArg(args, i, "zip"));
    rows = i == 0 ? list->size() : std::min(rows, list->size());
    lists.push_back(list);
  }
  Value::List out;
  for (size_t row = 0; row < rows; ++row) {
    Value::List tuple;
    for (const auto* list : lists) {
      tuple.push_back((*list)[row]);
    }
    out.emplace_back(std::move(tuple));
  }
  return Value(std::move(out));
}

absl::StatusOr<Value> IterProduct(const Args& args, const CallContext&) {
  Value::List product{Value(Value::List{})};
  for (size_t i = 0; i < args.size(); ++i) {
    FLOWEXPR_ASSIGN_OR_RETURN(const Value::List* list,
                              ListArg(args, i, "iter_product"));
    Value::List next;
    for (const auto& prefix : product) {
      for (const auto& item : *list) {
        Value::List tuple = prefix.as_list();
        tuple.push_back(item);
        next.emplace_back(std::move(tuple));
      }
    }
    product = std::move(next);
  }
  return Value(std::move(product));
}

absl::StatusOr<Value> Range(const Args& args, const CallContext&) {
  FLOWEXPR_ASSIGN_OR_RETURN(int64_t start, IntArg(args, 0, "range"));
  FLOWEXPR_ASSIGN_OR_RETURN(int64_t end, IntArg(args, 1, "range"));
  int64_t step = 1;
  if (args.size() > 2) {
    FLOWEXPR_ASSIGN_OR_RETURN(step, IntArg(args, 2, "range"));
  }
  if (step == 0) {
    return EvaluationError("range() arg 3 must not be zero");
  }
  Value::List out;
  for (int64_t i = start; step > 0 ? i < end : i > end; i += step) {
    if (static_cast<int64_t>(out.size()) >= kMaxRangeLength) {
      return EvaluationError(absl::StrCat(
          "range() would produce more than ", kMaxRangeLength, " items"));
    }
    out.emplace_back(i);
  }
  return Value(std::move(out));
}

absl::StatusOr<Value> ToKeys(const Args& args, const CallContext&) {
  FLOWEXPR_ASSIGN_OR_RETURN(const Value::Map* map, MapArg(args, 0, "to_keys"));
  Value::List out;
  for (const auto& entry : *map) {
    out.emplace_back(entry.first);
  }
  return Value(std::move(out));
}

absl::StatusOr<Value> ToValues(const Args& args, const CallContext&) {
  FLOWEXPR_ASSIGN_OR_RETURN(const Value::Map* map, MapArg(args, 0, "to_values"));
  Value::List out;
  for (const auto& entry : *map) {
    out.push_back(entry.second);
  }
  return Value(std::move(out));
}

// Missing keys give null.
absl::StatusOr<Value> Lookup(const Args& args, const CallContext&) {
  if (!args[0].is_map()) {
    return ArgTypeError("lookup", 0, "dict", args[0]);
  }
  if (!args[1].is_string()) {
    return Value();
  }
  const Value* found = args[0].Find(args[1].as_string());
  return found != nullptr ? *found : Value();
}

absl::StatusOr<Value> IndexByKey(const Args& args, const CallContext&) {
  FLOWEXPR_ASSIGN_OR_RETURN(const Value::List* items,
                            ListArg(args, 0, "index_by_key"));
  FLOWEXPR_ASSIGN_OR_RETURN(std::string key, StringArg(args, 1, "index_by_key"));
  const Value& value_key = OptionalArg(args, 2, Value());
  if (!value_key.is_null() && !value_key.is_string()) {
    return ArgTypeError("index_by_key", 2, "str", value_key);
  }
  Value out(Value::Map{});
  for (size_t i = 0; i < items->size(); ++i) {
    const Value& item = (*items)[i];
    const Value* index = item.Find(key);
    if (index == nullptr) {
      return EvaluationError(absl::StrCat("index_by_key() item ", i,
                                          " has no key '", key, "'"));
    }
    if (value_key.is_null()) {
      out.Set(ToString(*index), item);
      continue;
    }
    const Value* selected = item.Find(value_key.as_string());
    out.Set(ToString(*index), selected != nullptr ? *selected : Value());
  }
  return out;
}

// Later maps win on key collisions.
absl::StatusOr<Value> Merge(const Args& args, const CallContext&) {
  Value out(Value::Map{});
  for (size_t i = 0; i < args.size(); ++i) {
    FLOWEXPR_ASSIGN_OR_RETURN(const Value::Map* map, MapArg(args, i, "merge"));
    for (const auto& entry : *map) {
      out.Set(entry.first, entry.second);
    }
  }
  return out;
}

absl::StatusOr<Value> Compact(const Args& args, const CallContext&) {
  FLOWEXPR_ASSIGN_OR_RETURN(const Value::List* items, ListArg(args, 0, "compact"));
  Value::List out;
  for (const auto& item : *items) {
    if (!item.is_null()) {
      out.push_back(item);
    }
  }
  return Value(std::move(out));
}

template <const char* kOperator>
absl::StatusOr<Value> BinaryOperator(const Args& args, const CallContext&) {
  return ApplyBinary(kOperator, args[0], args[1]);
}

constexpr char kEqual[] = "==";
constexpr char kNotEqual[] = "!=";
constexpr char kLess[] = "<";
constexpr char kLessEqual[] = "<=";
constexpr char kGreater[] = ">";
constexpr char kGreaterEqual[] = ">=";
constexpr char kAnd[] = "&&";
constexpr char kOr[] = "||";

absl::StatusOr<Value> IsNull(const Args& args, const CallContext&) {
  return Value(args[0].is_null());
}

absl::StatusOr<Value> NotNull(const Args& args, const CallContext&) {
  return Value(!args[0].is_null());
}

absl::StatusOr<Value> Not(const Args& args, const CallContext&) {
  return ApplyUnary("!", args[0]);
}

}  // namespace

absl::Status RegisterCollectionFunctions(Registry& registry) {
  const FunctionSpec specs[] = {
      {"contains", &ContainsFn, 2, 2, false},
      {"does_not_contain", &DoesNotContain, 2, 2, false},
      {"length", &LengthFn, 1, 1, false},
      {"is_empty", &IsEmpty, 1, 1, false},
      {"not_empty", &NotEmpty, 1, 1, false},
      {"flatten", &FlattenFn, 1, 1, false},
      {"unique", &Unique, 1, 1, false},
      {"union", &Union, 1, 1, true},
      {"difference", &Difference, 2, 2, false},
      {"zip", &Zip, 1, 1, true},
      {"iter_product", &IterProduct, 1, 1, true},
      {"range", &Range, 2, 3, false},
      {"to_keys", &ToKeys, 1, 1, false},
      {"to_values", &ToValues, 1, 1, false},
      {"lookup", &Lookup, 2, 2, false},
      {"index_by_key", &IndexByKey, 2, 3, false},
      {"merge", &Merge, 1, 1, true},
      {"compact", &Compact, 1, 1, false},
      {"is_equal", &BinaryOperator<kEqual>, 2, 2, false},
      {"not_equal", &BinaryOperator<kNotEqual>, 2, 2, false},
      {"less_than", &BinaryOperator<kLess>, 2, 2, false},
      {"less_than_or_equal", &BinaryOperator<kLessEqual>, 2, 2, false},
      {"greater_than", &BinaryOperator<kGreater>, 2, 2, false},
      {"greater_than_or_equal", &BinaryOperator<kGreaterEqual>, 2, 2, false},
      {"is_null", &IsNull, 1, 1, false},
      {"not_null", &NotNull, 1, 1, false},
      {"and", &BinaryOperator<kAnd>, 2, 2, false},
      {"or", &BinaryOperator<kOr>, 2, 2, false},
      {"not", &Not, 1, 1, false},
  };
  for (const auto& spec : specs) {
    FLOWEXPR_RETURN_IF_ERROR(registry.Register(spec));
  }
  return absl::OkStatus();
}

}  // namespace functions
}  // namespace flowexpr
