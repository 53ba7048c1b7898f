#include <gtest/gtest.h>
#include <evals/lua.hpp>
#include <session.hpp>
#include <scope.hpp>
#include <errors.hpp>

class LuaTest : public ::testing::Test {
 protected:
  VariableEnvironment env;
  LuaEvaluator evaluator;

  Value eval(const std::string& source) {
    Scope scope(&env);
    return evaluator.evaluate(source, &scope, Position("test.pug", 1, 1));
  }
};

TEST_F(LuaTest, scalars) {
  EXPECT_EQ(eval("1 + 2").number, 3);
  EXPECT_EQ(eval("'a' .. 'b'").string, "ab");
  EXPECT_TRUE(eval("3 > 2").boolean);
  EXPECT_EQ(eval("nil").type, Value::Null);
}

TEST_F(LuaTest, variables_come_from_the_scope) {
  env.set("name", "ann");
  EXPECT_EQ(eval("name .. '!'").string, "ann!");
  EXPECT_EQ(eval("nobody").type, Value::Null);
  Scope root(&env);
  Scope inner(&root);
  inner.set("name", "bo");
  EXPECT_EQ(evaluator.evaluate("name", &inner, Position()).string, "bo");
}

TEST_F(LuaTest, tables_convert_both_ways) {
  env.set("user", Value::makeMap({ { "name", "ann" }, { "tags", Value::makeList({ "x", "y" }) } }));
  EXPECT_EQ(eval("user.name").string, "ann");
  EXPECT_EQ(eval("user.tags[2]").string, "y");
  EXPECT_EQ(eval("#user.tags").number, 2);
  Value list = eval("{1, 2, 3}");
  ASSERT_EQ(list.type, Value::List);
  EXPECT_EQ(list.list.size(), 3u);
  Value map = eval("{a = 1}");
  ASSERT_EQ(map.type, Value::Map);
  ASSERT_NE(map.get("a"), (const Value*)NULL);
  EXPECT_EQ(map.get("a")->number, 1);
}

TEST_F(LuaTest, errors_become_evaluation_errors) {
  EXPECT_THROW(eval("1 +"), EvaluationError);
  EXPECT_THROW(eval("nobody.field"), EvaluationError);
  EXPECT_THROW(eval("function() end"), EvaluationError);
  EXPECT_EQ(eval("2 * 2").number, 4);
}

TEST_F(LuaTest, chunks_are_cached) {
  eval("1 + 1");
  eval("1 + 1");
  EXPECT_EQ(evaluator.chunks.size(), 1u);
}

TEST(test_lua, renders_with_the_lua_evaluator) {
  MemoryLoader loader;
  CompileOptions options;
  options.evaluator = "lua";
  Session session(&loader, options);
  session.set("items", Value::makeList({ "a", "b" }));
  EXPECT_EQ(session.compileString("each item, i in items\n  li= i .. item\np= #items > 1 and 'many' or 'few'"),
            "<li>0a</li><li>1b</li><p>many</p>");
}

TEST_F(LuaTest, variables_shadow_the_standard_library) {
  env.set("type", "admin");
  env.set("string", "s");
  EXPECT_EQ(eval("type").string, "admin");
  EXPECT_EQ(eval("string .. '!'").string, "s!");
  EXPECT_EQ(eval("math.floor(2.5)").number, 2);
  EXPECT_EQ(eval("tostring(3)").string, "3");
}
