#include <gtest/gtest.h>
#include <fmt/format.h>

#include <cmath>
#include <limits>
#include <string>

#include <jsondb/core/Object.h>

using namespace jsondb;

struct TestOwner : public Owner
{
    void mark_modified() override { ++modified; }
    int modified = 0;
};

struct TestObject : public Object
{
    TestObject(const Object& object) : Object(object) {}

    using Object::bind;
    using Object::unbind;
};

TEST(Object, TypeName) {
    EXPECT_EQ(Object{}.type_name(), "empty");
    EXPECT_EQ(Object{nil}.type_name(), "nil");
    EXPECT_EQ(Object{true}.type_name(), "bool");
    EXPECT_EQ(Object{-1}.type_name(), "int");
    EXPECT_EQ(Object{1UL}.type_name(), "uint");
    EXPECT_EQ(Object{1.5}.type_name(), "double");
    EXPECT_EQ(Object{"foo"}.type_name(), "string");
    EXPECT_EQ(Object{Object::LIST}.type_name(), "list");
    EXPECT_EQ(Object{Object::MAP}.type_name(), "map");
}

TEST(Object, Nil) {
    Object v{nil};
    EXPECT_TRUE(v.is_nil());
    EXPECT_TRUE(v == nil);
    EXPECT_EQ(v.to_json(), "null");
}

TEST(Object, Bool) {
    Object v{true};
    EXPECT_TRUE(v.is_bool());
    EXPECT_FALSE(v.is_num());
    EXPECT_EQ(v.to_json(), "true");

    v = false;
    EXPECT_EQ(v.to_json(), "false");
    EXPECT_FALSE(v.as<bool>());
}

TEST(Object, Int64) {
    Object v{-0x7FFFFFFFFFFFFFFFLL};
    EXPECT_TRUE(v.is_int());
    EXPECT_TRUE(v.is_num());
    EXPECT_EQ(v.to_json(), "-9223372036854775807");
    EXPECT_EQ(v.as<Int>(), -0x7FFFFFFFFFFFFFFFLL);
    EXPECT_THROW(v.as<UInt>(), WrongType);
}

TEST(Object, UInt64) {
    Object v{0xFFFFFFFFFFFFFFFFULL};
    EXPECT_TRUE(v.is_uint());
    EXPECT_EQ(v.to_json(), "18446744073709551615");
}

TEST(Object, Float) {
    EXPECT_EQ(Object{3.25}.to_json(), "3.25");
    EXPECT_EQ(Object{1.0}.to_json(), "1.0");
    EXPECT_EQ(Object{0.1}.to_json(), "0.1");
    EXPECT_EQ(Object{1e100}.to_json(), "1e+100");
}

TEST(Object, String) {
    Object v{"123"};
    EXPECT_TRUE(v.is_str());
    EXPECT_EQ(v.as<String>(), "123");
    EXPECT_EQ(v.to_str(), "123");
    EXPECT_EQ(v.to_json(), "\"123\"");

    Object quoted{"a\"b\\c\nd\x01"};
    EXPECT_EQ(quoted.to_json(), "\"a\\\"b\\\\c\\nd\\u0001\"");
}

TEST(Object, ToBool) {
    EXPECT_FALSE(Object{nil}.to_bool());
    EXPECT_TRUE(Object{1}.to_bool());
    EXPECT_FALSE(Object{0.0}.to_bool());
    EXPECT_FALSE(Object{""}.to_bool());
    EXPECT_TRUE(Object{List{1}}.to_bool());
    EXPECT_THROW(Object{}.to_bool(), EmptyReference);
}

TEST(Object, ToNumber) {
    EXPECT_EQ(Object{true}.to_int(), 1);
    EXPECT_EQ(Object{3.0}.to_int(), 3);
    EXPECT_EQ(Object{7UL}.to_int(), 7);
    EXPECT_EQ(Object{-2}.to_float(), -2.0);
    EXPECT_EQ(Object{5}.to_uint(), 5);
    EXPECT_THROW(Object{"1"}.to_int(), WrongType);
    EXPECT_THROW(Object{nil}.to_float(), WrongType);
}

TEST(Object, ListToJson) {
    Object list{List{1, "tea", 3.5, true, nil}};
    EXPECT_TRUE(list.is_list());
    EXPECT_EQ(list.to_json(), "[1, \"tea\", 3.5, true, null]");
}

TEST(Object, MapToJsonKeepsInsertionOrder) {
    Object map{Map{{"z", 1}, {"a", 2}, {"m", List{}}}};
    EXPECT_EQ(map.to_json(), "{\"z\": 1, \"a\": 2, \"m\": []}");
}

TEST(Object, ToJsonIndent) {
    Object map{Map{{"a", 1}, {"b", List{1, 2}}, {"c", Map{}}, {"d", List{}}}};
    EXPECT_EQ(map.to_json(2),
        "{\n"
        "  \"a\": 1,\n"
        "  \"b\": [\n"
        "    1,\n"
        "    2\n"
        "  ],\n"
        "  \"c\": {},\n"
        "  \"d\": []\n"
        "}");
    EXPECT_EQ(Object{Map{}}.to_json(2), "{}");
}

TEST(Object, ToJsonRejectsNonFinite) {
    Object list{List{1, std::numeric_limits<Float>::quiet_NaN()}};
    EXPECT_THROW(list.to_json(), SerializationError);
    Object inf{std::numeric_limits<Float>::infinity()};
    EXPECT_THROW(inf.to_json(), SerializationError);
    EXPECT_THROW(Object{}.to_json(), SerializationError);
}

TEST(Object, ReferenceSemantics) {
    Object list{List{}};
    Object alias = list;
    EXPECT_EQ(list.ref_count(), 2);
    EXPECT_TRUE(alias.is(list));

    alias.append(1);
    EXPECT_EQ(list.size(), 1);
    EXPECT_EQ(list.get(0), 1);
}

TEST(Object, MoveLeavesEmpty) {
    Object list{List{1}};
    Object other = std::move(list);
    EXPECT_TRUE(list.is_empty());
    EXPECT_EQ(other.ref_count(), 1);
}

TEST(Object, CopyIsDeep) {
    Object map{Map{{"a", List{1, 2}}}};
    Object copy = map.copy();
    EXPECT_FALSE(copy.is(map));
    EXPECT_EQ(copy, map);

    copy.get("a").append(3);
    EXPECT_EQ(map.get("a").size(), 2);
    EXPECT_EQ(copy.get("a").size(), 3);
}

TEST(Object, MapGetIsPure) {
    Object map{Map{{"a", 1}}};
    EXPECT_EQ(map.get("a"), 1);
    EXPECT_TRUE(map.get("missing").is_nil());
    EXPECT_EQ(map.size(), 1);
    EXPECT_FALSE(map.contains("missing"));
}

TEST(Object, MapGetOrInsert) {
    Object map{Map{}};
    auto list = map.get_or_insert("list", List{});
    EXPECT_TRUE(map.contains("list"));
    list.append(1);
    EXPECT_EQ(map.to_json(), "{\"list\": [1]}");

    // present key is returned, default ignored
    auto again = map.get_or_insert("list", 5);
    EXPECT_TRUE(again.is(list));

    auto absent = map.get_or_insert("x");
    EXPECT_TRUE(absent.is_nil());
    EXPECT_TRUE(map.contains("x"));
}

TEST(Object, SetCopiesContainers) {
    Object map{Map{}};
    Object inner{List{1}};
    auto stored = map.set("a", inner);
    EXPECT_FALSE(stored.is(inner));
    EXPECT_TRUE(stored.is(map.get("a")));

    inner.append(2);
    EXPECT_EQ(map.get("a").size(), 1);
}

TEST(Object, SetReplacesInPlace) {
    Object map{Map{{"a", 1}, {"b", 2}}};
    map.set("a", "x");
    EXPECT_EQ(map.to_json(), "{\"a\": \"x\", \"b\": 2}");
}

TEST(Object, InsertSelfDoesNotCycle) {
    Object list{List{1}};
    list.append(list);
    EXPECT_EQ(list.to_json(), "[1, [1]]");
    list.extend(list);
    EXPECT_EQ(list.to_json(), "[1, [1], 1, [1]]");
}

TEST(Object, KeyTypeError) {
    Object map{Map{}};
    EXPECT_THROW(map.set(1, 1), KeyTypeError);
    EXPECT_THROW(map.get(0), KeyTypeError);
    EXPECT_THROW(map.contains(0), KeyTypeError);

    Object list{List{1}};
    EXPECT_THROW(list.get("a"), KeyTypeError);
    EXPECT_THROW(list.set("a", 1), KeyTypeError);
}

TEST(Object, MapDel) {
    Object map{Map{{"a", 1}, {"b", 2}, {"c", 3}}};
    map.del("b");
    EXPECT_EQ(map.to_json(), "{\"a\": 1, \"c\": 3}");
    EXPECT_THROW(map.del("b"), NotFoundError);
}

TEST(Object, NotFoundMessageQuotesKey) {
    Object map{Map{{"a", 1}}};
    try {
        map.del("missing");
        FAIL();
    } catch (const NotFoundError& err) {
        EXPECT_NE(std::string{err.what()}.find("key not found: \"missing\""), std::string::npos);
    }
}

TEST(Object, ListIndex) {
    Object list{List{1, 2, 3}};
    EXPECT_EQ(list.get(-1), 3);
    EXPECT_TRUE(list.get(3).is_nil());
    EXPECT_TRUE(list.get(-4).is_nil());

    list.set(-1, 30);
    EXPECT_EQ(list.get(2), 30);
    EXPECT_THROW(list.set(3, 0), IndexError);

    list.del(0);
    EXPECT_EQ(list.to_json(), "[2, 30]");
    EXPECT_THROW(list.del(5), IndexError);
}

TEST(Object, AppendExtendConcat) {
    Object list{List{}};
    EXPECT_EQ(list.append(1), 1);
    list.extend(List{2, 3});
    list.concat_in_place(List{4});
    list += List{5};
    EXPECT_EQ(list.to_json(), "[1, 2, 3, 4, 5]");
    EXPECT_THROW(list.extend(1), WrongType);
}

TEST(Object, WrongKindOperations) {
    Object map{Map{}};
    EXPECT_THROW(map.append(1), WrongType);
    EXPECT_THROW(map.extend(List{}), WrongType);

    Object list{List{}};
    EXPECT_THROW(list.get_or_insert(0, 1), WrongType);
    EXPECT_THROW(list.contains(0), WrongType);

    Object num{1};
    EXPECT_THROW(num.get("a"), WrongType);
    EXPECT_THROW(num.size(), WrongType);
    EXPECT_THROW(Object{}.get("a"), EmptyReference);
}

TEST(Object, KeysValuesItems) {
    Object map{Map{{"x", 1}, {"y", "z"}}};
    auto keys = map.keys();
    ASSERT_EQ(keys.size(), 2);
    EXPECT_EQ(keys[0], "x"_key);
    EXPECT_EQ(keys[1], "y"_key);

    auto values = map.values();
    ASSERT_EQ(values.size(), 2);
    EXPECT_EQ(values[1], "z");

    auto items = map.items();
    ASSERT_EQ(items.size(), 2);
    EXPECT_EQ(items[0].first, "x"_key);
    EXPECT_EQ(items[0].second, 1);

    Object list{List{"a", "b"}};
    auto list_items = list.items();
    ASSERT_EQ(list_items.size(), 2);
    EXPECT_EQ(list_items[1].first, Key{1});
    EXPECT_EQ(list_items[1].second, "b");
}

TEST(Object, Equality) {
    EXPECT_EQ(Object{1}, Object{1.0});
    EXPECT_EQ(Object{1}, Object{1UL});
    EXPECT_NE(Object{-1}, Object{0xFFFFFFFFFFFFFFFFULL});
    EXPECT_NE(Object{true}, Object{1});
    EXPECT_NE(Object{"1"}, Object{1});
    EXPECT_EQ(Object{nil}, Object{nil});

    // map equality ignores order
    EXPECT_EQ(Object(Map{{"a", 1}, {"b", 2}}), Object(Map{{"b", 2}, {"a", 1}}));
    EXPECT_NE(Object(List{1, 2}), Object(List{2, 1}));
}

TEST(Object, Subscript) {
    Object map{Map{{"a", Map{}}}};
    map["a"]["b"] = 1;
    map["c"] = List{};
    map["c"].append("x");
    EXPECT_EQ(map.to_json(), "{\"a\": {\"b\": 1}, \"c\": [\"x\"]}");

    Object b = map["a"]["b"];
    EXPECT_EQ(b, 1);
    EXPECT_EQ(map["a"].get("b"), 1);
}

TEST(Object, BoundMutationNotifiesOwner) {
    TestOwner owner;
    TestObject root{Object{Map{{"a", Map{{"b", List{}}}}}}};
    root.bind(&owner);

    EXPECT_EQ(root.owner(), &owner);
    auto inner = root.get("a").get("b");
    EXPECT_EQ(inner.owner(), &owner);

    inner.append(1);
    EXPECT_EQ(owner.modified, 1);

    auto stored = root.get("a").set("c", List{List{}});
    EXPECT_EQ(owner.modified, 2);
    EXPECT_EQ(stored.owner(), &owner);
    EXPECT_EQ(stored.get(0).owner(), &owner);

    // reads do not notify
    root.get("a").get("c");
    root.contains("a");
    EXPECT_EQ(owner.modified, 2);
}

TEST(Object, RemovedValuesAreUnbound) {
    TestOwner owner;
    TestObject root{Object{Map{{"a", List{}}, {"b", List{}}}}};
    root.bind(&owner);

    auto a = root.get("a");
    root.del("a");
    EXPECT_EQ(owner.modified, 1);
    EXPECT_FALSE(a.is_bound());

    a.append(1);
    EXPECT_EQ(owner.modified, 1);

    auto b = root.get("b");
    root.set("b", 1);
    EXPECT_FALSE(b.is_bound());
}

TEST(Object, UnbindStopsNotifications) {
    TestOwner owner;
    TestObject root{Object{List{Map{}}}};
    root.bind(&owner);
    auto inner = root.get(0);

    root.unbind();
    inner.set("x", 1);
    root.append(2);
    EXPECT_EQ(owner.modified, 0);
    EXPECT_FALSE(inner.is_bound());
}
