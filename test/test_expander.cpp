#include <gtest/gtest.h>
#include <expander.hpp>
#include <tokenizer.hpp>
#include <parser.hpp>
#include <session.hpp>
#include <errors.hpp>

static std::string compile(const std::string& source) {
  MemoryLoader loader;
  Session session(&loader);
  return session.compileString(source, "test.pug");
}

static std::vector<Node*> expand(NodePool& pool, const std::string& source, const CompileOptions& options) {
  Tokenizer tokenizer(MapView::fromString(source), "test.pug");
  Parser parser(tokenizer.tokenize(), &pool, "test.pug");
  Expander expander(&pool, &options);
  return expander.expand(parser.parse().nodes);
}

static int countMixinNodes(const std::vector<Node*>& nodes) {
  int count = 0;
  for (Node* node : nodes) {
    if (node->type == Node::MIXINDEF || node->type == Node::MIXINCALL) {
      count++;
    }
    std::vector<std::vector<Node*>*> bodies;
    node->bodies(bodies);
    for (auto body : bodies) {
      count += countMixinNodes(*body);
    }
  }
  return count;
}

TEST(test_expander, default_parameter) {
  EXPECT_EQ(compile("mixin icon(name, size='medium')\n  i(class=name + ' ' + size)\n+icon('home')"),
            "<i class=\"home medium\"></i>");
  EXPECT_EQ(compile("mixin icon(name, size='medium')\n  i(class=name + ' ' + size)\n+icon('home', 'large')"),
            "<i class=\"home large\"></i>");
}

TEST(test_expander, defaults_see_earlier_parameters) {
  EXPECT_EQ(compile("mixin greet(name, line='hi ' + name)\n  p= line\n+greet('bo')"), "<p>hi bo</p>");
}

TEST(test_expander, missing_arguments_are_null) {
  EXPECT_EQ(compile("mixin m(a, b)\n  p= a\n  p= b\n+m('x')"), "<p>x</p><p></p>");
}

TEST(test_expander, rest_parameter) {
  EXPECT_EQ(compile("mixin list(title, ...items)\n  h3= title\n  each i in items\n    li= i\n+list('T', 1, 2)\n+list('E')"),
            "<h3>T</h3><li>1</li><li>2</li><h3>E</h3>");
}

TEST(test_expander, call_before_definition) {
  EXPECT_EQ(compile("+hello\nmixin hello\n  p hello"), "<p>hello</p>");
}

TEST(test_expander, last_definition_wins) {
  EXPECT_EQ(compile("mixin m\n  p one\nmixin m\n  p two\n+m"), "<p>two</p>");
}

TEST(test_expander, block_content) {
  EXPECT_EQ(compile("mixin box\n  div.box\n    block\n+box\n  p hi"), "<div class=\"box\"><p>hi</p></div>");
  EXPECT_EQ(compile("mixin box\n  div.box\n    block\n+box"), "<div class=\"box\"></div>");
}

TEST(test_expander, call_site_block_without_a_block_marker_is_dropped) {
  EXPECT_EQ(compile("mixin m\n  p body\n+m\n  span dropped"), "<p>body</p>");
}

TEST(test_expander, block_content_renders_in_the_callers_scope) {
  const char* source =
      "mixin wrap(label)\n"
      "  section\n"
      "    h2= label\n"
      "    block\n"
      "each label in ['x']\n"
      "  +wrap('inner')\n"
      "    p= label";
  EXPECT_EQ(compile(source), "<section><h2>inner</h2><p>x</p></section>");
}

TEST(test_expander, mixin_bodies_dont_see_call_site_locals) {
  EXPECT_EQ(compile("mixin show\n  p= secret\neach secret in ['leak']\n  +show"), "<p></p>");
}

TEST(test_expander, nested_calls_pass_block_content_along) {
  const char* source =
      "mixin outer\n"
      "  div\n"
      "    +inner\n"
      "      block\n"
      "mixin inner\n"
      "  span\n"
      "    block\n"
      "+outer\n"
      "  b deep";
  EXPECT_EQ(compile(source), "<div><span><b>deep</b></span></div>");
}

TEST(test_expander, the_same_mixin_twice) {
  EXPECT_EQ(compile("mixin li(t)\n  li= t\nul\n  +li('a')\n  +li('b')"), "<ul><li>a</li><li>b</li></ul>");
}

TEST(test_expander, unknown_mixin) {
  try {
    compile("p\n+nope");
    FAIL() << "expected an ExpansionError";
  } catch (ExpansionError& e) {
    EXPECT_EQ(e.kind, ExpansionError::UnknownMixin);
    EXPECT_EQ(e.pos.line, 2);
  }
}

TEST(test_expander, recursion_limit) {
  try {
    compile("mixin r\n  +r\n+r");
    FAIL() << "expected an ExpansionError";
  } catch (ExpansionError& e) {
    EXPECT_EQ(e.kind, ExpansionError::RecursionLimit);
  }
}

TEST(test_expander, recursion_limit_is_configurable) {
  CompileOptions options;
  options.mixinDepthLimit = 2;
  NodePool pool;
  EXPECT_NO_THROW(expand(pool, "mixin a\n  +b\nmixin b\n  p\n+a", options));
  EXPECT_THROW(expand(pool, "mixin a\n  +b\nmixin b\n  +c\nmixin c\n  p\n+a", options), ExpansionError);
}

TEST(test_expander, no_definitions_or_calls_survive) {
  CompileOptions options;
  NodePool pool;
  auto nodes = expand(pool, "mixin a(x)\n  if x\n    +b\nmixin b\n  p\ndiv\n  +a(1)\n  each i in [1]\n    +b", options);
  EXPECT_EQ(countMixinNodes(nodes), 0);
  ASSERT_EQ(nodes.size(), 1u);
  EXPECT_EQ(nodes[0]->type, Node::ELEMENT);
}
