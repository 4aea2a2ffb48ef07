#include "declaration.h"
#include "line_classifier.h"
#include <gtest/gtest.h>

using namespace marginalia;

class LineClassifierTest : public ::testing::Test {
protected:
    auto kind_of(const std::string& line) -> LineKind { return classify_line(line).kind; }

    auto declared(const std::string& line) -> Declaration {
        auto decl = find_declaration(line);
        EXPECT_TRUE(decl.valid) << line;
        return decl;
    }
};

// Declarations
TEST_F(LineClassifierTest, FunctionDeclarations) {
    auto decl = declared("def foo(x):");
    EXPECT_EQ(decl.symbol, "foo");
    EXPECT_EQ(decl.type, SymbolType::Function);

    EXPECT_EQ(declared("async def fetch_all (session):").symbol, "fetch_all");
    EXPECT_EQ(declared("    def method(self):").symbol, "method");
    EXPECT_EQ(declared("async   def  _private():").type, SymbolType::Function);
}

TEST_F(LineClassifierTest, ClassDeclarations) {
    auto decl = declared("class Scanner(Base):");
    EXPECT_EQ(decl.symbol, "Scanner");
    EXPECT_EQ(decl.type, SymbolType::Class);

    EXPECT_EQ(declared("class Plain:").symbol, "Plain");
    EXPECT_EQ(declared("class Spaced :").symbol, "Spaced");
}

TEST_F(LineClassifierTest, AssignmentDeclarations) {
    auto decl = declared("DEFAULT_INCLUDE = [\"*.py\"]");
    EXPECT_EQ(decl.symbol, "DEFAULT_INCLUDE");
    EXPECT_EQ(decl.type, SymbolType::Variable);

    EXPECT_EQ(declared("db=[]").symbol, "db");
}

TEST_F(LineClassifierTest, NonDeclarations) {
    EXPECT_FALSE(find_declaration("x == 1").valid);
    EXPECT_FALSE(find_declaration("self.x = 1").valid);
    EXPECT_FALSE(find_declaration("print(x=1)").valid);
    EXPECT_FALSE(find_declaration("define(x)").valid);
    EXPECT_FALSE(find_declaration("def foo").valid);
    EXPECT_FALSE(find_declaration("class Foo").valid);
    EXPECT_FALSE(find_declaration("return value").valid);
    EXPECT_FALSE(find_declaration("").valid);
}

TEST_F(LineClassifierTest, FunctionWinsOverAssignment) {
    auto decl = declared("def f(x=1): pass");
    EXPECT_EQ(decl.symbol, "f");
    EXPECT_EQ(decl.type, SymbolType::Function);
}

// Doc lines
TEST_F(LineClassifierTest, DocLinePayload) {
    auto classified = classify_line("# doc: Parse a meta line.");
    EXPECT_EQ(classified.kind, LineKind::Doc);
    EXPECT_EQ(classified.doc_text, "Parse a meta line.");
}

TEST_F(LineClassifierTest, DocLineStripsAtMostOneSpace) {
    EXPECT_EQ(classify_line("# doc:   indented").doc_text, "  indented");
    EXPECT_EQ(classify_line("# doc:tight").doc_text, "tight");
    EXPECT_EQ(classify_line("# doc:").doc_text, "");
    EXPECT_EQ(classify_line("    # doc: in a method").kind, LineKind::Doc);
}

TEST_F(LineClassifierTest, DocMarkerIsExact) {
    EXPECT_EQ(kind_of("#doc: no space"), LineKind::Skippable);
    EXPECT_EQ(kind_of("# Doc: capital"), LineKind::Skippable);
}

// Meta, skippable, other
TEST_F(LineClassifierTest, MetaLines) {
    EXPECT_EQ(kind_of("# meta: systems=db"), LineKind::Meta);
    EXPECT_EQ(kind_of("  #meta: @anchor"), LineKind::Meta);
}

TEST_F(LineClassifierTest, SkippableLines) {
    EXPECT_EQ(kind_of(""), LineKind::Skippable);
    EXPECT_EQ(kind_of("   \t"), LineKind::Skippable);
    EXPECT_EQ(kind_of("@decorator"), LineKind::Skippable);
    EXPECT_EQ(kind_of("    @property"), LineKind::Skippable);
    EXPECT_EQ(kind_of("# ordinary comment"), LineKind::Skippable);
}

TEST_F(LineClassifierTest, OtherLines) {
    EXPECT_EQ(kind_of("    return x"), LineKind::Other);
    EXPECT_EQ(kind_of("\"\"\"docstring\"\"\""), LineKind::Other);
}

TEST_F(LineClassifierTest, DeclarationCarriesSymbol) {
    auto classified = classify_line("class Foo(object):");
    EXPECT_EQ(classified.kind, LineKind::Declaration);
    EXPECT_EQ(classified.declaration.symbol, "Foo");
    EXPECT_STREQ(line_kind_name(classified.kind), "declaration");
}
