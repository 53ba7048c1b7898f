#include <gtest/gtest.h>
#include <tokenizer.hpp>
#include <errors.hpp>

static std::vector<Token> lex(const std::string& source) {
  Tokenizer tokenizer(MapView::fromString(source), "test.pug");
  return tokenizer.tokenize();
}

static std::vector<Token::Kind> kinds(const std::vector<Token>& tokens) {
  std::vector<Token::Kind> ret;
  for (const Token& t : tokens) {
    ret.push_back(t.kind);
  }
  return ret;
}

TEST(test_tokenizer, tag_with_shorthands_and_attributes) {
  auto tokens = lex("div.a.b#c(x=1) hi");
  std::vector<Token::Kind> expected = {Token::TagHead, Token::ClassShorthand, Token::ClassShorthand, Token::IdShorthand,
                                       Token::AttrList, Token::TextLiteral, Token::Newline, Token::Eof};
  ASSERT_EQ(kinds(tokens), expected);
  EXPECT_EQ(tokens[0].lexeme, "div");
  EXPECT_EQ(tokens[1].lexeme, "a");
  EXPECT_EQ(tokens[2].lexeme, "b");
  EXPECT_EQ(tokens[3].lexeme, "c");
  EXPECT_EQ(tokens[4].lexeme, "x=1");
  EXPECT_EQ(tokens[5].lexeme, "hi");
}

TEST(test_tokenizer, implicit_div) {
  auto tokens = lex(".box#main");
  ASSERT_GE(tokens.size(), 3u);
  EXPECT_EQ(tokens[0].kind, Token::TagHead);
  EXPECT_EQ(tokens[0].lexeme, "div");
  EXPECT_EQ(tokens[1].kind, Token::ClassShorthand);
  EXPECT_EQ(tokens[2].kind, Token::IdShorthand);
}

TEST(test_tokenizer, one_indent_or_dedent_per_transition) {
  auto tokens = lex("a\n  b\n    c\nd");
  std::vector<Token::Kind> expected = {Token::TagHead, Token::Newline, Token::Indent, Token::TagHead, Token::Newline,
                                       Token::Indent, Token::TagHead, Token::Newline, Token::Dedent, Token::Dedent,
                                       Token::TagHead, Token::Newline, Token::Eof};
  EXPECT_EQ(kinds(tokens), expected);
}

TEST(test_tokenizer, blank_lines_and_crlf_are_ignored) {
  auto tokens = lex("a\r\n\r\n  b\r\n");
  std::vector<Token::Kind> expected = {Token::TagHead, Token::Newline, Token::Indent, Token::TagHead,
                                       Token::Newline, Token::Dedent, Token::Eof};
  ASSERT_EQ(kinds(tokens), expected);
  EXPECT_EQ(tokens[3].lexeme, "b");
}

TEST(test_tokenizer, four_space_unit) {
  auto tokens = lex("a\n    b\n        c");
  int indents = 0;
  for (auto& t : tokens) {
    indents += t.kind == Token::Indent;
  }
  EXPECT_EQ(indents, 2);
}

TEST(test_tokenizer, width_not_a_multiple_of_the_unit) {
  try {
    lex("div\n  p\n   span");
    FAIL() << "expected an IndentationError";
  } catch (IndentationError& e) {
    EXPECT_EQ(e.pos.line, 3);
    EXPECT_EQ(e.pos.column, 4);
  }
  EXPECT_THROW(lex("a\n    b\n  c"), IndentationError);
}

TEST(test_tokenizer, tabs_and_spaces_never_mix) {
  EXPECT_THROW(lex("a\n\tb\n  c"), IndentationError);
  EXPECT_THROW(lex("a\n \tb"), IndentationError);
}

TEST(test_tokenizer, indentation_jumps_one_level_at_a_time) {
  EXPECT_THROW(lex("a\n  b\n      c"), IndentationError);
}

TEST(test_tokenizer, interpolation_spans) {
  auto tokens = lex("p a #{x} b !{y}");
  ASSERT_EQ(tokens.size(), 7u);
  EXPECT_EQ(tokens[1].kind, Token::TextLiteral);
  EXPECT_EQ(tokens[1].lexeme, "a ");
  EXPECT_EQ(tokens[2].kind, Token::Interpolation);
  EXPECT_EQ(tokens[2].lexeme, "x");
  EXPECT_FALSE(tokens[2].raw);
  EXPECT_EQ(tokens[3].lexeme, " b ");
  EXPECT_EQ(tokens[4].lexeme, "y");
  EXPECT_TRUE(tokens[4].raw);
}

TEST(test_tokenizer, interpolation_balances_quotes_and_braces) {
  auto tokens = lex("p #{ {a: \"}\"}.a }");
  ASSERT_EQ(tokens[1].kind, Token::Interpolation);
  EXPECT_EQ(tokens[1].lexeme, "{a: \"}\"}.a");
}

TEST(test_tokenizer, escaped_interpolation_is_literal) {
  auto tokens = lex("p \\#{x}");
  ASSERT_EQ(tokens[1].kind, Token::TextLiteral);
  EXPECT_EQ(tokens[1].lexeme, "#{x}");
}

TEST(test_tokenizer, unterminated_interpolation_reports_its_opening) {
  try {
    lex("p #{x");
    FAIL() << "expected a SyntaxError";
  } catch (SyntaxError& e) {
    EXPECT_EQ(e.pos.line, 1);
    EXPECT_EQ(e.pos.column, 3);
  }
}

TEST(test_tokenizer, unbalanced_attribute_list) {
  try {
    lex("a(href='x'");
    FAIL() << "expected a SyntaxError";
  } catch (SyntaxError& e) {
    EXPECT_EQ(e.pos.column, 2);
  }
}

TEST(test_tokenizer, attribute_list_over_several_lines) {
  auto tokens = lex("a(href='/x'\n  title='y') go\np");
  std::vector<Token::Kind> expected = {Token::TagHead, Token::AttrList, Token::TextLiteral, Token::Newline,
                                       Token::TagHead, Token::Newline, Token::Eof};
  ASSERT_EQ(kinds(tokens), expected);
  EXPECT_EQ(tokens[1].lexeme, "href='/x' title='y'");
  EXPECT_EQ(tokens[2].lexeme, "go");
  EXPECT_EQ(tokens[4].pos.line, 3);
  try {
    lex("p\n  a(href='x'\n    title='y'");
    FAIL() << "expected a SyntaxError";
  } catch (SyntaxError& e) {
    EXPECT_EQ(e.pos.line, 2);
    EXPECT_EQ(e.pos.column, 4);
  }
}

TEST(test_tokenizer, conditional_keywords) {
  auto tokens = lex("if x\nelse if y > 1\nelse");
  ASSERT_EQ(tokens[0].kind, Token::Keyword);
  EXPECT_EQ(tokens[0].lexeme, "if");
  EXPECT_EQ(tokens[0].arg, "x");
  EXPECT_EQ(tokens[2].lexeme, "else if");
  EXPECT_EQ(tokens[2].arg, "y > 1");
  EXPECT_EQ(tokens[4].lexeme, "else");
  EXPECT_THROW(lex("else nonsense"), SyntaxError);
  EXPECT_THROW(lex("if"), SyntaxError);
}

TEST(test_tokenizer, keyword_needs_a_word_boundary) {
  auto tokens = lex("iframe");
  EXPECT_EQ(tokens[0].kind, Token::TagHead);
  EXPECT_EQ(tokens[0].lexeme, "iframe");
}

TEST(test_tokenizer, append_shorthand_becomes_a_block_keyword) {
  auto tokens = lex("append scripts");
  EXPECT_EQ(tokens[0].lexeme, "block");
  EXPECT_EQ(tokens[0].arg, "append scripts");
}

TEST(test_tokenizer, include_with_filter) {
  auto tokens = lex("include:markdown notes.md");
  EXPECT_EQ(tokens[0].lexeme, "include");
  EXPECT_EQ(tokens[0].filter, "markdown");
  EXPECT_EQ(tokens[0].arg, "notes.md");
}

TEST(test_tokenizer, mixin_call) {
  auto tokens = lex("+card('a, b', 1)");
  ASSERT_EQ(tokens[0].kind, Token::MixinCall);
  EXPECT_EQ(tokens[0].lexeme, "card");
  EXPECT_EQ(tokens[0].arg, "'a, b', 1");
  EXPECT_THROW(lex("+card(1) junk"), SyntaxError);
}

TEST(test_tokenizer, comments) {
  auto tokens = lex("//- hidden\n// shown");
  ASSERT_EQ(tokens[0].kind, Token::Comment);
  EXPECT_TRUE(tokens[0].raw);
  EXPECT_EQ(tokens[0].lexeme, " hidden");
  ASSERT_EQ(tokens[2].kind, Token::Comment);
  EXPECT_FALSE(tokens[2].raw);
  EXPECT_EQ(tokens[2].lexeme, " shown");
}

TEST(test_tokenizer, block_text_is_raw) {
  auto tokens = lex("script.\n  if (a < b) {\n    go()\n  }\np");
  std::vector<Token::Kind> expected = {Token::TagHead, Token::BlockText, Token::Newline, Token::Indent,
                                       Token::TextLiteral, Token::Newline, Token::TextLiteral, Token::Newline,
                                       Token::TextLiteral, Token::Newline, Token::Dedent, Token::TagHead,
                                       Token::Newline, Token::Eof};
  ASSERT_EQ(kinds(tokens), expected);
  EXPECT_EQ(tokens[4].lexeme, "if (a < b) {");
  EXPECT_EQ(tokens[6].lexeme, "  go()");
  EXPECT_EQ(tokens[8].lexeme, "}");
}

TEST(test_tokenizer, raw_lines_skip_the_unit_check) {
  EXPECT_NO_THROW(lex("div\n  p.\n     odd\n   indent\n  span"));
}

TEST(test_tokenizer, doctype) {
  EXPECT_EQ(lex("doctype html")[0].lexeme, "html");
  EXPECT_EQ(lex("doctype")[0].lexeme, "html");
  EXPECT_EQ(lex("doctype xml")[0].kind, Token::Doctype);
}

TEST(test_tokenizer, piped_text_and_literal_html) {
  auto tokens = lex("| hello #{name}\n<em>hi</em>");
  EXPECT_EQ(tokens[0].kind, Token::Pipe);
  EXPECT_EQ(tokens[1].lexeme, "hello ");
  EXPECT_EQ(tokens[2].kind, Token::Interpolation);
  EXPECT_EQ(tokens[4].kind, Token::Pipe);
  EXPECT_EQ(tokens[5].lexeme, "<em>hi</em>");
}

TEST(test_tokenizer, buffered_echo) {
  auto tokens = lex("p!= raw\nspan= safe");
  EXPECT_EQ(tokens[1].kind, Token::BufferedEcho);
  EXPECT_TRUE(tokens[1].raw);
  EXPECT_EQ(tokens[1].lexeme, "raw");
  EXPECT_EQ(tokens[4].kind, Token::BufferedEcho);
  EXPECT_FALSE(tokens[4].raw);
  EXPECT_THROW(lex("p="), SyntaxError);
}

TEST(test_tokenizer, buffered_code_on_its_own_line) {
  auto tokens = lex("= age\n!= html");
  ASSERT_EQ(tokens[0].kind, Token::BufferedEcho);
  EXPECT_EQ(tokens[0].lexeme, "age");
  EXPECT_FALSE(tokens[0].raw);
  ASSERT_EQ(tokens[2].kind, Token::BufferedEcho);
  EXPECT_EQ(tokens[2].lexeme, "html");
  EXPECT_TRUE(tokens[2].raw);
  EXPECT_THROW(lex("="), SyntaxError);
}

TEST(test_tokenizer, unbuffered_code_assigns) {
  auto tokens = lex("- n = n + 1\n- var total = 0");
  ASSERT_EQ(tokens[0].kind, Token::Code);
  EXPECT_EQ(tokens[0].lexeme, "n");
  EXPECT_EQ(tokens[0].arg, "n + 1");
  ASSERT_EQ(tokens[2].kind, Token::Code);
  EXPECT_EQ(tokens[2].lexeme, "total");
  EXPECT_EQ(tokens[2].arg, "0");
  EXPECT_THROW(lex("- launch()"), SyntaxError);
  EXPECT_THROW(lex("- n == 1"), SyntaxError);
  EXPECT_THROW(lex("- n ="), SyntaxError);
  EXPECT_THROW(lex("-"), SyntaxError);
}

TEST(test_tokenizer, while_keyword) {
  auto tokens = lex("while n < 3\n  p= n");
  ASSERT_EQ(tokens[0].kind, Token::Keyword);
  EXPECT_EQ(tokens[0].lexeme, "while");
  EXPECT_EQ(tokens[0].arg, "n < 3");
  EXPECT_THROW(lex("while"), SyntaxError);
}

TEST(test_tokenizer, one_id_per_tag) {
  EXPECT_THROW(lex("p#a#b"), SyntaxError);
}

TEST(test_tokenizer, self_close) {
  auto tokens = lex("foo/");
  EXPECT_EQ(tokens[1].kind, Token::SelfClose);
}
