#include <gtest/gtest.h>
#include <session.hpp>
#include <renderer.hpp>
#include <errors.hpp>
#include <types/Text.hpp>

class RenderTest : public ::testing::Test {
 protected:
  MemoryLoader loader;
  CompileOptions options;

  std::string render(const std::string& source) {
    Session session(&loader, options);
    for (auto& var : vars.vars) {
      session.set(var.first, var.second);
    }
    return session.compileString(source, "test.pug");
  }

  VariableEnvironment vars;
};

TEST_F(RenderTest, nested_elements) {
  EXPECT_EQ(render("div.container\n  p#importante Hello"), "<div class=\"container\"><p id=\"importante\">Hello</p></div>");
}

TEST_F(RenderTest, interpolated_conditional) {
  vars.set("age", 20);
  EXPECT_EQ(render("p Adult: #{age >= 18 ? 'Yes' : 'No'}"), "<p>Adult: Yes</p>");
  vars.set("age", 9);
  EXPECT_EQ(render("p Adult: #{age >= 18 ? 'Yes' : 'No'}"), "<p>Adult: No</p>");
}

TEST_F(RenderTest, escaping) {
  EXPECT_EQ(render("p #{\"<b>\"}"), "<p>&lt;b&gt;</p>");
  EXPECT_EQ(render("p !{\"<b>\"}"), "<p><b></p>");
  EXPECT_EQ(render("p= '<a href=\"x\">&</a>'"), "<p>&lt;a href=&quot;x&quot;&gt;&amp;&lt;/a&gt;</p>");
  EXPECT_EQ(render("p!= '<i>'"), "<p><i></p>");
  EXPECT_EQ(render("p <literal> & stays"), "<p><literal> & stays</p>");
}

TEST_F(RenderTest, literal_html_lines) {
  EXPECT_EQ(render("<section>\np inside\n</section>"), "<section><p>inside</p></section>");
}

TEST_F(RenderTest, void_and_self_closing) {
  EXPECT_EQ(render("img(src='a.png')"), "<img src=\"a.png\"/>");
  EXPECT_EQ(render("doctype html\nimg(src='a.png')\nfoo/"), "<!DOCTYPE html><img src=\"a.png\"><foo/>");
  EXPECT_EQ(render("foo/"), "<foo/>");
  EXPECT_THROW(render("br\n  | x"), RenderError);
  EXPECT_THROW(render("foo/\n  span"), RenderError);
}

TEST_F(RenderTest, doctypes) {
  EXPECT_EQ(render("doctype xml"), "<?xml version=\"1.0\" encoding=\"utf-8\" ?>");
  EXPECT_EQ(render("doctype custom thing"), "<!DOCTYPE custom thing>");
}

TEST_F(RenderTest, class_merging) {
  EXPECT_EQ(render("p.a(class=['b', 'a'])"), "<p class=\"a b\"></p>");
  EXPECT_EQ(render("p(class={x: true, y: false, z: 1})"), "<p class=\"x z\"></p>");
  EXPECT_EQ(render("p.a(class='b  c' class=null)"), "<p class=\"a b c\"></p>");
  EXPECT_THROW(render("p(class=[[1]])"), EvaluationError);
}

TEST_F(RenderTest, explicit_id_wins) {
  EXPECT_EQ(render("p#a(id='b')"), "<p id=\"b\"></p>");
  EXPECT_EQ(render("p#a(id=false)"), "<p></p>");
  EXPECT_EQ(render("p#a(id=true)"), "<p id=\"a\"></p>");
}

TEST_F(RenderTest, attribute_order) {
  EXPECT_EQ(render("a(href='/' class='x' id='y' title='t')"), "<a class=\"x\" id=\"y\" href=\"/\" title=\"t\"></a>");
}

TEST_F(RenderTest, boolean_and_null_attributes) {
  EXPECT_EQ(render("input(type='checkbox' checked disabled=false data-x=null)"), "<input type=\"checkbox\" checked/>");
  EXPECT_EQ(render("input(checked=true)"), "<input checked/>");
}

TEST_F(RenderTest, repeated_attribute_keeps_the_last_value) {
  EXPECT_EQ(render("a(title='one' href='/' title='two')"), "<a title=\"two\" href=\"/\"></a>");
}

TEST_F(RenderTest, attribute_values) {
  vars.set("id", 7);
  EXPECT_EQ(render("a(href=\"/u/#{id}\" title='\"q\"' data-raw!='<b>' n=1.5)"), "<a href=\"/u/7\" title=\"&quot;q&quot;\" data-raw=\"<b>\" n=\"1.5\"></a>");
  EXPECT_EQ(render("p(style={color: 'red', top: 0})"), "<p style=\"color:red;top:0;\"></p>");
  EXPECT_THROW(render("p(data=[1, 2])"), EvaluationError);
}

TEST_F(RenderTest, text_contexts_reject_lists_and_maps) {
  EXPECT_THROW(render("p= [1, 2]"), EvaluationError);
  EXPECT_THROW(render("p #{ {a: 1} }"), EvaluationError);
  EXPECT_EQ(render("p= null"), "<p></p>");
  EXPECT_EQ(render("p= true"), "<p>true</p>");
}

TEST_F(RenderTest, conditionals) {
  vars.set("n", 2);
  const char* source = "if n == 1\n  p one\nelse if n == 2\n  p two\nelse\n  p many";
  EXPECT_EQ(render(source), "<p>two</p>");
  vars.set("n", 5);
  EXPECT_EQ(render(source), "<p>many</p>");
  EXPECT_EQ(render("unless n\n  p zero\nelse\n  p some"), "<p>some</p>");
}

TEST_F(RenderTest, untaken_branches_are_not_evaluated) {
  EXPECT_EQ(render("if true\n  p a\nelse if missing.x\n  p b"), "<p>a</p>");
}

TEST_F(RenderTest, each_over_a_list) {
  EXPECT_EQ(render("each item, i in ['a', 'b', 'c']\n  li= i + ':' + item"), "<li>0:a</li><li>1:b</li><li>2:c</li>");
}

TEST_F(RenderTest, each_else) {
  const char* source = "each item in items\n  li= item\nelse\n  li none";
  vars.set("items", Value::makeList());
  EXPECT_EQ(render(source), "<li>none</li>");
  vars.set("items", Value::makeList({ "x" }));
  EXPECT_EQ(render(source), "<li>x</li>");
  vars.set("items", Value());
  EXPECT_EQ(render(source), "<li>none</li>");
  vars.set("items", 3);
  EXPECT_THROW(render(source), EvaluationError);
}

TEST_F(RenderTest, each_over_a_map) {
  EXPECT_EQ(render("each v, k in {a: 1, b: 2}\n  p= k + v"), "<p>a1</p><p>b2</p>");
}

TEST_F(RenderTest, loop_variables_stay_in_the_loop) {
  vars.set("x", "outer");
  EXPECT_EQ(render("each x in [1]\n  p= x\np= x"), "<p>1</p><p>outer</p>");
}

TEST_F(RenderTest, while_loop_with_a_counter) {
  EXPECT_EQ(render("- n = 0\nul\n  while n < 3\n    li= n\n    - n = n + 1"), "<ul><li>0</li><li>1</li><li>2</li></ul>");
  EXPECT_EQ(render("while false\n  p x"), "");
}

TEST_F(RenderTest, while_loop_that_never_ends) {
  options.loopLimit = 5;
  try {
    render("p before\nwhile true\n  p again");
    FAIL() << "expected a RenderError";
  } catch (RenderError& e) {
    EXPECT_EQ(e.pos.line, 2);
  }
}

TEST_F(RenderTest, assignments_rebind_the_nearest_variable) {
  EXPECT_EQ(render("- total = 0\neach v in [1, 2, 3]\n  - total = total + v\np= total"), "<p>6</p>");
  EXPECT_EQ(render("each v in [1, 2]\n  - seen = v\np= seen"), "<p></p>");
  vars.set("name", "host");
  EXPECT_EQ(render("- name = 'local'\np= name"), "<p>local</p>");
  EXPECT_EQ(render("p= name"), "<p>host</p>");
}

TEST_F(RenderTest, buffered_code_lines) {
  vars.set("age", 20);
  EXPECT_EQ(render("= age"), "20");
  EXPECT_EQ(render("p\n  = '<b>'\n  != '<i>'"), "<p>&lt;b&gt;<i></p>");
}

TEST_F(RenderTest, attributes_over_several_lines) {
  EXPECT_EQ(render("a(href='/x'\n  title='y') go"), "<a href=\"/x\" title=\"y\">go</a>");
  EXPECT_EQ(render("div\n  input(\n    type='text'\n    name='q'\n  )\n  p after"),
            "<div><input type=\"text\" name=\"q\"/><p>after</p></div>");
}

TEST_F(RenderTest, case_with_fall_through) {
  const char* source = "case n\n  when 1\n  when 2\n    p low\n  when 'x', 'y'\n    p letter\n  default\n    p other";
  vars.set("n", 1);
  EXPECT_EQ(render(source), "<p>low</p>");
  vars.set("n", "y");
  EXPECT_EQ(render(source), "<p>letter</p>");
  vars.set("n", "1");
  EXPECT_EQ(render(source), "<p>other</p>");
  EXPECT_EQ(render("case 1\n  when 2\n    p two"), "");
}

TEST_F(RenderTest, comments) {
  EXPECT_EQ(render("// hi\np"), "<!-- hi--><p></p>");
  EXPECT_EQ(render("//- hidden\n  more hidden\np"), "<p></p>");
  EXPECT_EQ(render("//\n  a\n  b"), "<!--\na\nb-->");
}

TEST_F(RenderTest, block_text) {
  EXPECT_EQ(render("script.\n  if (a < b) go()\n  #{'x'}"), "<script>if (a < b) go()\nx</script>");
}

TEST_F(RenderTest, piped_text) {
  EXPECT_EQ(render("p\n  | one\n  | two"), "<p>one\ntwo</p>");
  EXPECT_EQ(render("p\n  | a\n  b\n  | c"), "<p>a<b></b>c</p>");
}

TEST_F(RenderTest, pretty_output) {
  options.pretty = true;
  EXPECT_EQ(render("ul\n  li a\n  li b"), "<ul>\n  <li>a</li>\n  <li>b</li>\n</ul>");
  options.indentString = "\t";
  EXPECT_EQ(render("div\n  p\n    span x"), "<div>\n\t<p>\n\t\t<span>x</span>\n\t</p>\n</div>");
}

TEST_F(RenderTest, pretty_only_adds_whitespace) {
  const char* source = "doctype html\nhtml\n  head\n    title Hi\n  body\n    each i in [1, 2]\n      p(class='n')= i\n    // note";
  std::string compact = render(source);
  options.pretty = true;
  std::string pretty = render(source);
  std::string squeezed;
  for (size_t i = 0; i < pretty.size(); i++) {
    if (pretty[i] == '\n') {
      while (i + 1 < pretty.size() && pretty[i + 1] == ' ') {
        i++;
      }
      continue;
    }
    squeezed += pretty[i];
  }
  EXPECT_EQ(squeezed, compact);
  EXPECT_NE(pretty, compact);
}

TEST_F(RenderTest, idempotent) {
  vars.set("items", Value::makeList({ 1, 2, 3 }));
  const char* source = "mixin row(v)\n  tr\n    td= v\ntable\n  each v in items\n    +row(v)";
  std::string first = render(source);
  EXPECT_EQ(render(source), first);
}

TEST(test_renderer, render_function) {
  NodePool pool;
  Text* text = pool.make<Text>(Position());
  Segment seg;
  seg.isExpr = true;
  seg.text = "who";
  text->append(seg);
  text->appendLiteral("!", Position());
  VariableEnvironment env;
  env.set("who", "<world>");
  Scope globals(&env);
  std::unique_ptr<Evaluator> evaluator = makeEvaluator("expr");
  EXPECT_EQ(render({ text }, evaluator.get(), &globals, CompileOptions()), "&lt;world&gt;!");
}
