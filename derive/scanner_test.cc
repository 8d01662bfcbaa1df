#include "derive/scanner.h"

#include <string>
#include <string_view>
#include <vector>

#include "absl/status/status_matchers.h"
#include "derive/diagnostic.h"
#include "derive/diagnostic_testing.h"
#include "derive/lexer.h"
#include "derive/options.h"
#include "derive/source_location.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::absl_testing::IsOk;
using ::absl_testing::IsOkAndHolds;
using ::otel_derive::derive::AnnotatedItem;
using ::otel_derive::derive::AttributeBlock;
using ::otel_derive::derive::DiagnosticKind;
using ::otel_derive::derive::ItemKind;
using ::otel_derive::derive::JoinTokens;
using ::otel_derive::derive::NamespaceComponent;
using ::otel_derive::derive::ScanSource;
using ::otel_derive::derive::SourceLocation;
using ::otel_derive::testing::DiagnosticIs;
using ::testing::AllOf;
using ::testing::ElementsAre;
using ::testing::Field;
using ::testing::IsEmpty;
using ::testing::ResultOf;
using ::testing::SizeIs;

auto BlockIs(std::string_view const arguments) {
  return ResultOf(
      [](AttributeBlock const& block) { return JoinTokens(block.arguments); },
      std::string(arguments));
}

auto BlockIs(std::string_view const arguments, SourceLocation const location) {
  return AllOf(BlockIs(arguments), Field(&AttributeBlock::location, location));
}

NamespaceComponent Ns(std::string_view const name, bool const is_inline = false) {
  return NamespaceComponent{.name = std::string(name), .is_inline = is_inline};
}

TEST(ScannerTest, NoItems) {
  EXPECT_THAT(ScanSource("struct Foo {};\nnamespace bar { class Baz; }\n"),
              IsOkAndHolds(IsEmpty()));
}

TEST(ScannerTest, Empty) { EXPECT_THAT(ScanSource(""), IsOkAndHolds(IsEmpty())); }

TEST(ScannerTest, DeriveAttribute) {
  auto const status_or_items = ScanSource("struct [[otel::derive(Key, Value)]] Foo {};");
  ASSERT_THAT(status_or_items, IsOk());
  auto const& items = status_or_items.value();
  ASSERT_THAT(items, SizeIs(1));
  auto const& item = items[0];
  EXPECT_EQ(item.kind, ItemKind::kStruct);
  EXPECT_EQ(item.name, "Foo");
  EXPECT_EQ(item.location, (SourceLocation{.line = 1, .column = 10}));
  EXPECT_EQ(item.name_location, (SourceLocation{.line = 1, .column = 37}));
  EXPECT_THAT(item.namespace_path, IsEmpty());
  EXPECT_THAT(item.class_path, IsEmpty());
  EXPECT_TRUE(item.has_body);
  EXPECT_FALSE(item.has_qualified_name);
  EXPECT_FALSE(item.is_template);
  EXPECT_FALSE(item.in_class_template);
  EXPECT_FALSE(item.is_local);
  EXPECT_THAT(item.option_blocks, IsEmpty());
  EXPECT_THAT(item.derive_blocks,
              ElementsAre(BlockIs("Key, Value", {.line = 1, .column = 10})));
}

TEST(ScannerTest, OptionsAttribute) {
  auto const status_or_items =
      ScanSource("struct [[otel::derive(Key)]] [[otel(key = \"custom\")]] Foo {};");
  ASSERT_THAT(status_or_items, IsOk());
  auto const& items = status_or_items.value();
  ASSERT_THAT(items, SizeIs(1));
  EXPECT_EQ(items[0].location, (SourceLocation{.line = 1, .column = 10}));
  EXPECT_THAT(items[0].derive_blocks, ElementsAre(BlockIs("Key")));
  EXPECT_THAT(items[0].option_blocks,
              ElementsAre(BlockIs("key=\"custom\"", {.line = 1, .column = 32})));
}

TEST(ScannerTest, SeveralAttributesInOneList) {
  auto const status_or_items =
      ScanSource("class [[nodiscard, otel::derive(Key), otel(key = \"x\")]] Foo {};");
  ASSERT_THAT(status_or_items, IsOk());
  auto const& items = status_or_items.value();
  ASSERT_THAT(items, SizeIs(1));
  EXPECT_EQ(items[0].kind, ItemKind::kClass);
  EXPECT_THAT(items[0].derive_blocks, ElementsAre(BlockIs("Key")));
  EXPECT_THAT(items[0].option_blocks, ElementsAre(BlockIs("key=\"x\"")));
}

TEST(ScannerTest, UsingPrefix) {
  auto const status_or_items = ScanSource("struct [[using otel: derive(Key, KeyValue)]] Foo {};");
  ASSERT_THAT(status_or_items, IsOk());
  auto const& items = status_or_items.value();
  ASSERT_THAT(items, SizeIs(1));
  EXPECT_THAT(items[0].derive_blocks, ElementsAre(BlockIs("Key, KeyValue")));
  EXPECT_THAT(items[0].option_blocks, IsEmpty());
}

TEST(ScannerTest, UsingOtherNamespace) {
  EXPECT_THAT(ScanSource("struct [[using gnu: derive(Key)]] Foo {};"), IsOkAndHolds(IsEmpty()));
}

TEST(ScannerTest, QualifiedNameAfterUsing) {
  EXPECT_THAT(ScanSource("struct [[using otel: otel::derive(Key)]] Foo {};").status(),
              DiagnosticIs(DiagnosticKind::kSyntaxError, {.line = 1, .column = 26}));
}

TEST(ScannerTest, ForeignAttributes) {
  EXPECT_THAT(ScanSource("struct [[deprecated(\"x\"), gnu::packed]] alignas(8) Foo {};"),
              IsOkAndHolds(IsEmpty()));
}

TEST(ScannerTest, MixedWithForeignSpecifiers) {
  auto const status_or_items = ScanSource(
      "struct alignas(16) [[deprecated]] __attribute__((packed)) [[otel::derive(Key)]] Foo {};");
  ASSERT_THAT(status_or_items, IsOk());
  ASSERT_THAT(status_or_items.value(), SizeIs(1));
  EXPECT_EQ(status_or_items.value()[0].name, "Foo");
}

TEST(ScannerTest, UnknownOtelAttribute) {
  EXPECT_THAT(ScanSource("struct [[otel::derived(Key)]] Foo {};").status(),
              DiagnosticIs(DiagnosticKind::kUnknownOption, {.line = 1, .column = 10}));
}

TEST(ScannerTest, DeriveWithoutArguments) {
  EXPECT_THAT(ScanSource("struct [[otel::derive]] Foo {};").status(),
              DiagnosticIs(DiagnosticKind::kSyntaxError, {.line = 1, .column = 10}));
}

TEST(ScannerTest, OptionsWithoutArguments) {
  EXPECT_THAT(ScanSource("struct [[otel]] Foo {};").status(),
              DiagnosticIs(DiagnosticKind::kSyntaxError, {.line = 1, .column = 10}));
}

TEST(ScannerTest, EmptyArgumentsAreKept) {
  auto const status_or_items = ScanSource("struct [[otel::derive()]] Foo {};");
  ASSERT_THAT(status_or_items, IsOk());
  ASSERT_THAT(status_or_items.value(), SizeIs(1));
  EXPECT_THAT(status_or_items.value()[0].derive_blocks, ElementsAre(BlockIs("")));
}

TEST(ScannerTest, NestedParenthesesInArguments) {
  auto const status_or_items =
      ScanSource("struct [[otel::derive(Key), otel(variant = std::array<int, (1 + 2)>)]] Foo {};");
  ASSERT_THAT(status_or_items, IsOk());
  ASSERT_THAT(status_or_items.value(), SizeIs(1));
  EXPECT_THAT(status_or_items.value()[0].option_blocks,
              ElementsAre(BlockIs("variant=std::array<int, (1+2)>")));
}

TEST(ScannerTest, UnclosedAttributeList) {
  EXPECT_THAT(ScanSource("struct [[otel::derive(Key)] Foo {};").status(),
              DiagnosticIs(DiagnosticKind::kSyntaxError));
}

TEST(ScannerTest, MissingComma) {
  EXPECT_THAT(ScanSource("struct [[otel::derive(Key) otel(key = \"x\")]] Foo {};").status(),
              DiagnosticIs(DiagnosticKind::kSyntaxError, {.line = 1, .column = 28}));
}

TEST(ScannerTest, Enum) {
  auto const status_or_items = ScanSource(
      "enum [[otel::derive(StringValue)]] Color { kRed, kGreen };\n"
      "enum class [[otel::derive(Key)]] Method : uint8_t { kGet, kPost };\n"
      "enum struct [[otel::derive(Key)]] Mode { kA };\n");
  ASSERT_THAT(status_or_items, IsOk());
  auto const& items = status_or_items.value();
  ASSERT_THAT(items, SizeIs(3));
  EXPECT_EQ(items[0].kind, ItemKind::kEnum);
  EXPECT_EQ(items[0].name, "Color");
  EXPECT_TRUE(items[0].has_body);
  EXPECT_EQ(items[1].kind, ItemKind::kScopedEnum);
  EXPECT_EQ(items[1].name, "Method");
  EXPECT_TRUE(items[1].has_body);
  EXPECT_EQ(items[1].name_location, (SourceLocation{.line = 2, .column = 34}));
  EXPECT_EQ(items[2].kind, ItemKind::kScopedEnum);
  EXPECT_EQ(items[2].name, "Mode");
}

TEST(ScannerTest, EnumsDontOpenClassScopes) {
  auto const status_or_items = ScanSource(
      "enum class E { kA };\n"
      "struct [[otel::derive(Key)]] Foo {};\n");
  ASSERT_THAT(status_or_items, IsOk());
  ASSERT_THAT(status_or_items.value(), SizeIs(1));
  EXPECT_THAT(status_or_items.value()[0].class_path, IsEmpty());
  EXPECT_FALSE(status_or_items.value()[0].is_local);
}

TEST(ScannerTest, Union) {
  auto const status_or_items = ScanSource("union [[otel::derive(Key)]] U { int i; };");
  ASSERT_THAT(status_or_items, IsOk());
  ASSERT_THAT(status_or_items.value(), SizeIs(1));
  EXPECT_EQ(status_or_items.value()[0].kind, ItemKind::kUnion);
}

TEST(ScannerTest, BaseClauseAndFinal) {
  auto const status_or_items = ScanSource(
      "struct [[otel::derive(Key)]] Foo final : public Bar<int, (1 > 0)>, private Baz {\n"
      "  struct [[otel::derive(Value), otel(variant = int)]] Inner {};\n"
      "};\n");
  ASSERT_THAT(status_or_items, IsOk());
  auto const& items = status_or_items.value();
  ASSERT_THAT(items, SizeIs(2));
  EXPECT_EQ(items[0].name, "Foo");
  EXPECT_TRUE(items[0].has_body);
  EXPECT_EQ(items[1].name, "Inner");
  EXPECT_THAT(items[1].class_path, ElementsAre("Foo"));
}

TEST(ScannerTest, ForwardDeclaration) {
  auto const status_or_items = ScanSource("struct [[otel::derive(Key)]] Foo;");
  ASSERT_THAT(status_or_items, IsOk());
  ASSERT_THAT(status_or_items.value(), SizeIs(1));
  EXPECT_FALSE(status_or_items.value()[0].has_body);
}

TEST(ScannerTest, AnonymousStruct) {
  auto const status_or_items = ScanSource("struct [[otel::derive(Key)]] { int x; } foo;");
  ASSERT_THAT(status_or_items, IsOk());
  ASSERT_THAT(status_or_items.value(), SizeIs(1));
  EXPECT_EQ(status_or_items.value()[0].name, "");
  EXPECT_EQ(status_or_items.value()[0].name_location, (SourceLocation{.line = 1, .column = 1}));
  EXPECT_TRUE(status_or_items.value()[0].has_body);
}

TEST(ScannerTest, Namespaces) {
  auto const status_or_items = ScanSource(
      "namespace a {\n"
      "namespace b::inline c {\n"
      "struct [[otel::derive(Key)]] Foo {};\n"
      "}  // namespace b::c\n"
      "inline namespace v1 {\n"
      "namespace {\n"
      "struct [[otel::derive(Key)]] Bar {};\n"
      "}\n"
      "}\n"
      "}  // namespace a\n"
      "struct [[otel::derive(Key)]] Baz {};\n");
  ASSERT_THAT(status_or_items, IsOk());
  auto const& items = status_or_items.value();
  ASSERT_THAT(items, SizeIs(3));
  EXPECT_EQ(items[0].name, "Foo");
  EXPECT_THAT(items[0].namespace_path, ElementsAre(Ns("a"), Ns("b"), Ns("c", true)));
  EXPECT_EQ(items[1].name, "Bar");
  EXPECT_THAT(items[1].namespace_path, ElementsAre(Ns("a"), Ns("v1", true), Ns("")));
  EXPECT_EQ(items[2].name, "Baz");
  EXPECT_THAT(items[2].namespace_path, IsEmpty());
}

TEST(ScannerTest, UsingDirectivesAndAliases) {
  auto const status_or_items = ScanSource(
      "using namespace std;\n"
      "namespace fs = std::filesystem;\n"
      "namespace app {\n"
      "struct [[otel::derive(Key)]] Foo {};\n"
      "}\n");
  ASSERT_THAT(status_or_items, IsOk());
  ASSERT_THAT(status_or_items.value(), SizeIs(1));
  EXPECT_THAT(status_or_items.value()[0].namespace_path, ElementsAre(Ns("app")));
}

TEST(ScannerTest, LinkageSpecificationIsTransparent) {
  auto const status_or_items = ScanSource(
      "extern \"C++\" {\n"
      "struct [[otel::derive(Key)]] Foo {};\n"
      "}\n");
  ASSERT_THAT(status_or_items, IsOk());
  ASSERT_THAT(status_or_items.value(), SizeIs(1));
  EXPECT_FALSE(status_or_items.value()[0].is_local);
  EXPECT_THAT(status_or_items.value()[0].namespace_path, IsEmpty());
}

TEST(ScannerTest, NestedClasses) {
  auto const status_or_items = ScanSource(
      "namespace app {\n"
      "class Outer {\n"
      " public:\n"
      "  struct Middle {\n"
      "    enum class [[otel::derive(Key)]] Inner { kA };\n"
      "  };\n"
      "  void Method() const {}\n"
      "};\n"
      "}\n");
  ASSERT_THAT(status_or_items, IsOk());
  auto const& items = status_or_items.value();
  ASSERT_THAT(items, SizeIs(1));
  EXPECT_EQ(items[0].name, "Inner");
  EXPECT_THAT(items[0].namespace_path, ElementsAre(Ns("app")));
  EXPECT_THAT(items[0].class_path, ElementsAre("Outer", "Middle"));
  EXPECT_FALSE(items[0].is_local);
  EXPECT_FALSE(items[0].in_class_template);
}

TEST(ScannerTest, AccessSpecifiers) {
  auto const status_or_items = ScanSource(
      "class Outer : public Base {\n"
      "  struct [[otel::derive(Key)]] A {};\n"
      " public:\n"
      "  struct [[otel::derive(Key)]] B {};\n"
      " protected:\n"
      "  struct [[otel::derive(Key)]] C {};\n"
      " private:\n"
      "  struct [[otel::derive(Key)]] D {};\n"
      " public:\n"
      "  struct Middle {\n"
      "    struct [[otel::derive(Key)]] E {};\n"
      "   private:\n"
      "    struct [[otel::derive(Key)]] F {};\n"
      "  };\n"
      "  struct [[otel::derive(Key)]] G {};\n"
      "};\n"
      "struct [[otel::derive(Key)]] H {};\n");
  ASSERT_THAT(status_or_items, IsOk());
  EXPECT_THAT(status_or_items.value(),
              ElementsAre(AllOf(Field(&AnnotatedItem::name, "A"),
                                Field(&AnnotatedItem::is_public, false)),
                          AllOf(Field(&AnnotatedItem::name, "B"),
                                Field(&AnnotatedItem::is_public, true)),
                          AllOf(Field(&AnnotatedItem::name, "C"),
                                Field(&AnnotatedItem::is_public, false)),
                          AllOf(Field(&AnnotatedItem::name, "D"),
                                Field(&AnnotatedItem::is_public, false)),
                          AllOf(Field(&AnnotatedItem::name, "E"),
                                Field(&AnnotatedItem::is_public, true)),
                          AllOf(Field(&AnnotatedItem::name, "F"),
                                Field(&AnnotatedItem::is_public, false)),
                          AllOf(Field(&AnnotatedItem::name, "G"),
                                Field(&AnnotatedItem::is_public, true)),
                          AllOf(Field(&AnnotatedItem::name, "H"),
                                Field(&AnnotatedItem::is_public, true))));
}

TEST(ScannerTest, NestedInPrivateClass) {
  auto const status_or_items = ScanSource(
      "class Outer {\n"
      "  struct Middle {\n"
      "    enum class [[otel::derive(Key)]] Inner {};\n"
      "  };\n"
      "};\n");
  ASSERT_THAT(status_or_items, IsOk());
  ASSERT_THAT(status_or_items.value(), SizeIs(1));
  EXPECT_FALSE(status_or_items.value()[0].is_public);
}

TEST(ScannerTest, BothPreprocessorBranchesAreScanned) {
  auto const status_or_items = ScanSource(
      "#ifdef FOO\n"
      "struct [[otel::derive(Key)]] Foo { int a; };\n"
      "#else\n"
      "struct [[otel::derive(Key)]] Foo { long a; };\n"
      "#endif\n");
  ASSERT_THAT(status_or_items, IsOk());
  EXPECT_THAT(status_or_items.value(), ElementsAre(Field(&AnnotatedItem::name, "Foo"),
                                                   Field(&AnnotatedItem::name, "Foo")));
}

TEST(ScannerTest, Templates) {
  auto const status_or_items = ScanSource(
      "template <typename T, typename U = std::vector<std::pair<T, int>>>\n"
      "struct [[otel::derive(Key)]] Foo {};\n"
      "template <>\n"
      "struct [[otel::derive(Key)]] Foo<int, bool> {};\n"
      "struct [[otel::derive(Key)]] Bar {};\n");
  ASSERT_THAT(status_or_items, IsOk());
  auto const& items = status_or_items.value();
  ASSERT_THAT(items, SizeIs(3));
  EXPECT_EQ(items[0].name, "Foo");
  EXPECT_TRUE(items[0].is_template);
  EXPECT_EQ(items[1].name, "Foo<int, bool>");
  EXPECT_TRUE(items[1].is_template);
  EXPECT_EQ(items[2].name, "Bar");
  EXPECT_FALSE(items[2].is_template);
}

TEST(ScannerTest, TemplateFunctionDoesNotLeak) {
  auto const status_or_items = ScanSource(
      "template <typename T>\n"
      "void Foo(T const& value) {}\n"
      "struct [[otel::derive(Key)]] Bar {};\n");
  ASSERT_THAT(status_or_items, IsOk());
  ASSERT_THAT(status_or_items.value(), SizeIs(1));
  EXPECT_FALSE(status_or_items.value()[0].is_template);
}

TEST(ScannerTest, InClassTemplate) {
  auto const status_or_items = ScanSource(
      "template <typename T>\n"
      "class Outer {\n"
      "  struct [[otel::derive(Key)]] Inner {};\n"
      "};\n");
  ASSERT_THAT(status_or_items, IsOk());
  auto const& items = status_or_items.value();
  ASSERT_THAT(items, SizeIs(1));
  EXPECT_FALSE(items[0].is_template);
  EXPECT_TRUE(items[0].in_class_template);
  EXPECT_THAT(items[0].class_path, ElementsAre("Outer"));
}

TEST(ScannerTest, LocalType) {
  auto const status_or_items = ScanSource(
      "void Foo() {\n"
      "  struct [[otel::derive(Key)]] Local {};\n"
      "}\n");
  ASSERT_THAT(status_or_items, IsOk());
  ASSERT_THAT(status_or_items.value(), SizeIs(1));
  EXPECT_TRUE(status_or_items.value()[0].is_local);
}

TEST(ScannerTest, QualifiedName) {
  auto const status_or_items = ScanSource("struct [[otel::derive(Key)]] Outer::Inner {};");
  ASSERT_THAT(status_or_items, IsOk());
  ASSERT_THAT(status_or_items.value(), SizeIs(1));
  EXPECT_EQ(status_or_items.value()[0].name, "Outer::Inner");
  EXPECT_TRUE(status_or_items.value()[0].has_qualified_name);
}

TEST(ScannerTest, MisplacedAttribute) {
  auto const status_or_items = ScanSource(
      "[[otel::derive(Key)]] int x;\n"
      "struct Foo {\n"
      "  [[otel(key = \"a\")]] void f();\n"
      "};\n");
  ASSERT_THAT(status_or_items, IsOk());
  auto const& items = status_or_items.value();
  ASSERT_THAT(items, SizeIs(2));
  EXPECT_EQ(items[0].kind, ItemKind::kOther);
  EXPECT_EQ(items[0].location, (SourceLocation{.line = 1, .column = 3}));
  EXPECT_THAT(items[0].derive_blocks, ElementsAre(BlockIs("Key")));
  EXPECT_EQ(items[1].kind, ItemKind::kOther);
  EXPECT_THAT(items[1].class_path, ElementsAre("Foo"));
  EXPECT_THAT(items[1].option_blocks, ElementsAre(BlockIs("key=\"a\"")));
}

TEST(ScannerTest, AttributeBeforeClassKey) {
  auto const status_or_items = ScanSource("[[otel::derive(Key)]] struct Foo {};");
  ASSERT_THAT(status_or_items, IsOk());
  auto const& items = status_or_items.value();
  ASSERT_THAT(items, SizeIs(1));
  EXPECT_EQ(items[0].kind, ItemKind::kOther);
}

TEST(ScannerTest, AttributeOnNamespace) {
  auto const status_or_items = ScanSource("namespace [[otel::derive(Key)]] app {}");
  ASSERT_THAT(status_or_items, IsOk());
  auto const& items = status_or_items.value();
  ASSERT_THAT(items, SizeIs(1));
  EXPECT_EQ(items[0].kind, ItemKind::kOther);
}

TEST(ScannerTest, CommentsAndStringsAreIgnored) {
  EXPECT_THAT(ScanSource("// struct [[otel::derive(Key)]] Foo {};\n"
                         "/* struct [[otel::derive(Key)]] Bar {}; */\n"
                         "char const* s = \"struct [[otel::derive(Key)]] Baz {};\";\n"
                         "#define X struct [[otel::derive(Key)]] Qux {};\n"),
              IsOkAndHolds(IsEmpty()));
}

TEST(ScannerTest, ElaboratedTypeSpecifiers) {
  EXPECT_THAT(ScanSource("struct Foo* p;\n"
                         "void f(struct Bar b, class Baz& c);\n"
                         "friend class Qux;\n"),
              IsOkAndHolds(IsEmpty()));
}

TEST(ScannerTest, UnbalancedClosingBrace) {
  EXPECT_THAT(ScanSource("namespace app {\n}\n}\n").status(),
              DiagnosticIs(DiagnosticKind::kSyntaxError, {.line = 3, .column = 1}));
}

TEST(ScannerTest, UnbalancedOpeningBrace) {
  EXPECT_THAT(ScanSource("namespace app {\nstruct Foo {\n").status(),
              DiagnosticIs(DiagnosticKind::kSyntaxError, {.line = 2, .column = 12}));
}

TEST(ScannerTest, LexerErrorsArePropagated) {
  EXPECT_THAT(ScanSource("struct Foo {}; /*").status(),
              DiagnosticIs(DiagnosticKind::kSyntaxError, {.line = 1, .column = 16}));
}

}  // namespace
