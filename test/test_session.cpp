#include <gtest/gtest.h>
#include <session.hpp>
#include <errors.hpp>

static const std::string head = "<!DOCTYPE html><html><head><title>Home</title><style>body { margin: 0 }</style></head>"
                                "<body><header><h1>Home</h1></header>";

TEST(test_session, compiles_a_layout_from_disk) {
  Session session(ZPUG_FIXTURES);
  session.set("title", "Home");
  session.set("items", Value::makeList({ "a", "b" }));
  EXPECT_EQ(session.compileFile("page"), head + "<div class=\"card\">a</div><div class=\"card\">b</div></body></html>");
  EXPECT_EQ(session.compileFile("plain.pug"), head + "<p>default</p></body></html>");
}

TEST(test_session, recompiling_gives_the_same_bytes) {
  Session session(ZPUG_FIXTURES);
  session.set("title", "Home");
  session.set("items", Value::makeList());
  std::string first = session.compileFile("page");
  EXPECT_EQ(first, head + "<p>nothing yet</p></body></html>");
  EXPECT_EQ(session.compileFile("page"), first);
  EXPECT_EQ(session.compileFile("/page"), first);
}

TEST(test_session, variables_can_change_between_compiles) {
  Session session(ZPUG_FIXTURES);
  session.set("title", "Home");
  session.set("items", Value::makeList({ "a" }));
  std::string one = session.compileFile("page");
  session.env().set("items", Value::makeList({ "z" }));
  std::string two = session.compileFile("page");
  EXPECT_NE(one.find(">a<"), std::string::npos);
  EXPECT_NE(two.find(">z<"), std::string::npos);
}

TEST(test_session, empty_template) {
  Session session(ZPUG_FIXTURES);
  EXPECT_EQ(session.compileFile("empty"), "");
  EXPECT_EQ(session.compileString(""), "");
}

TEST(test_session, missing_template) {
  Session session(ZPUG_FIXTURES);
  try {
    session.compileFile("nothere");
    FAIL() << "expected a LinkError";
  } catch (LinkError& e) {
    EXPECT_EQ(e.kind, LinkError::MissingFile);
    EXPECT_NE(e.message.find("nothere.pug"), std::string::npos);
  }
}

TEST(test_session, file_manager_paths) {
  FileMan files(ZPUG_FIXTURES);
  EXPECT_EQ(files.checkPath("page.pug"), FileMan::File);
  EXPECT_EQ(files.checkPath("partials"), FileMan::Directory);
  EXPECT_EQ(files.checkPath("nope.pug"), FileMan::CNEP);
  EXPECT_EQ(files.resolve("header", "partials/index.pug"), "partials/header.pug");
  EXPECT_EQ(files.resolve("../layout", "partials/header.pug"), "layout.pug");
  EXPECT_EQ(files.resolve("/styles.css", "partials/header.pug"), "styles.css");
  MapView css = files.read("styles.css");
  ASSERT_TRUE(css.isValid());
  EXPECT_EQ(css.toString(), "body { margin: 0 }");
  files.uncache("styles.css");
  EXPECT_TRUE(files.read("styles.css").isValid());
  EXPECT_FALSE(files.read("partials").isValid());
}

TEST(test_session, paths_never_climb_out_of_the_root) {
  FileMan files(ZPUG_FIXTURES);
  EXPECT_EQ(files.resolve("../../../styles.css", "page.pug"), "styles.css");
  EXPECT_EQ(files.resolve("../../../../etc/passwd.txt", "partials/header.pug"), "etc/passwd.txt");
  Session session(ZPUG_FIXTURES);
  EXPECT_EQ(session.compileString("style\n  include:css ../../../styles.css", "partials/x.pug"), "<style>body { margin: 0 }</style>");
}

TEST(test_session, errors_describe_where_they_happened) {
  MemoryLoader loader;
  Session session(&loader);
  try {
    session.compileString("div\n  p\n   span", "bad.pug");
    FAIL() << "expected an IndentationError";
  } catch (ZpugError& e) {
    EXPECT_STREQ(e.kindName(), "IndentationError");
    EXPECT_EQ(e.describe().rfind("bad.pug:3:4: IndentationError: ", 0), 0u);
  }
}

TEST(test_session, every_error_is_a_zpug_error) {
  MemoryLoader loader;
  Session session(&loader);
  const char* broken[] = { "p #{x", "+nope", "include gone", "p= [1]", "br\n  | x" };
  for (const char* source : broken) {
    EXPECT_THROW(session.compileString(source), ZpugError) << source;
  }
}

TEST(test_session, unknown_evaluator) {
  MemoryLoader loader;
  CompileOptions options;
  options.evaluator = "python";
  Session session(&loader, options);
  EXPECT_THROW(session.compileString("p hi"), ZpugError);
}

TEST(test_session, in_memory_templates) {
  MemoryLoader loader;
  loader.add("views/index", "extends base\nblock main\n  p= greeting");
  loader.add("views/base.pug", "main\n  block main");
  Session session(&loader);
  session.set("greeting", "hey");
  EXPECT_EQ(session.compileFile("views/index"), "<main><p>hey</p></main>");
}

TEST(test_session, verbose_mode_renders_the_same) {
  MemoryLoader loader;
  loader.add("a.pug", "mixin m(x)\n  b= x\nmixin m(x)\n  i= x\ndiv\n  +m(1)\n  include b");
  loader.add("b.pug", "// from b\ncase 2\n  when 2\n    span two");
  CompileOptions options;
  Session quiet(&loader, options);
  options.verbose = true;
  Session loud(&loader, options);
  std::string expected = "<div><i>1</i><!-- from b--><span>two</span></div>";
  EXPECT_EQ(quiet.compileFile("a"), expected);
  testing::internal::CaptureStdout();
  std::string html = loud.compileFile("a");
  std::string log = testing::internal::GetCapturedStdout();
  EXPECT_EQ(html, expected);
  EXPECT_NE(log.find("zpug " ZPUG_VERSION " compiling a.pug"), std::string::npos);
  EXPECT_NE(log.find("Rendered a.pug"), std::string::npos);
}
