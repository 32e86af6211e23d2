#include "scope.hpp"
#include "source_text.hpp"

#include <iostream>
#include <optional>
#include <string>
#include <string_view>

using makemock::BraceCounter;
using makemock::find_class_header;
using makemock::select_class_scope;
using makemock::select_scope;

struct Run {
    int failures = 0;
    void expect(bool ok, std::string_view msg) {
        if (!ok) {
            ++failures;
            std::cerr << "FAIL: " << msg << "\n";
        }
    }
};

int main() {
    Run t;

    {
        BraceCounter counter;
        counter.process("{");
        t.expect(counter.depth() == 1, "one opening brace");
        counter.process("}");
        t.expect(counter.depth() == 0, "opening then closing brace");
    }

    {
        BraceCounter counter;
        counter.process("{}");
        t.expect(counter.depth() == 0, "balanced pair in one fragment");
        counter.process("}}");
        t.expect(counter.depth() == -2, "unbalanced input goes below zero");
    }

    {
        const std::string text = "virtual int f();\nclass A {};\n";
        t.expect(select_scope(text, std::nullopt) == text, "no target returns text unchanged");
    }

    {
        const std::string text = "\n"
                                 "void do_not_mock() override;\n"
                                 "\n"
                                 "class TestClass\n"
                                 "{\n"
                                 "    void do_mock() override;\n"
                                 "};\n";
        const std::string scoped = select_scope(text, std::string("TestClass"));
        t.expect(scoped.find("do_mock") != std::string::npos, "class body collected");
        t.expect(scoped.find("do_not_mock") == std::string::npos, "declaration before the class excluded");
        t.expect(scoped.find('}') == std::string::npos, "closing brace excluded");
    }

    {
        const std::string scoped = select_scope("void A();\nclass T { void B() override; };", std::string("T"));
        t.expect(scoped.find("void B() override;") != std::string::npos, "one-line class body collected");
        t.expect(scoped.find("A()") == std::string::npos, "sibling declaration excluded");
    }

    {
        const std::string text = "class Target {\n"
                                 "    struct Inner {\n"
                                 "        virtual void inner();\n"
                                 "    };\n"
                                 "    virtual void after_inner();\n"
                                 "};\n"
                                 "class Other {\n"
                                 "    virtual void other();\n"
                                 "};\n";
        const std::string scoped = select_scope(text, std::string("Target"));
        t.expect(scoped.find("after_inner") != std::string::npos, "nested class close does not end the scope");
        t.expect(scoped.find("other()") == std::string::npos, "following class excluded");
    }

    {
        const std::string text = "namespace ns {\n"
                                 "class Widget\n"
                                 "    : public Base\n"
                                 "{\n"
                                 "public:\n"
                                 "    virtual int size() const;\n"
                                 "};\n"
                                 "virtual int outside();\n"
                                 "}\n";
        const std::string scoped = select_scope(text, std::string("Widget"));
        t.expect(scoped.find("size()") != std::string::npos, "base clause on its own line before the brace");
        t.expect(scoped.find("outside") == std::string::npos, "scope ends at the class brace inside a namespace");
    }

    {
        const std::string text = "class Widget;\n"
                                 "class Widget {\n"
                                 "    virtual void draw();\n"
                                 "};\n";
        const std::string scoped = select_scope(text, std::string("Widget"));
        t.expect(scoped.find("draw") != std::string::npos, "forward declaration skipped");
    }

    {
        t.expect(select_scope("class A {\n virtual void f();\n};\n", std::string("Missing")).empty(), "missing class selects nothing");
        t.expect(find_class_header("class WidgetFactory {", "Widget") == std::string_view::npos, "name must be a whole identifier");
        t.expect(find_class_header("enum class Widget {", "Widget") == std::string_view::npos, "enum class is not a class header");
        t.expect(find_class_header("  struct Widget {", "Widget") == 2, "struct header found at keyword");
        t.expect(find_class_header("Widget make_class();", "Widget") == std::string_view::npos, "no class keyword");
    }

    {
        const std::string scoped = select_scope("Widget *make(); class Widget {\n virtual void f();\n};\n", std::string("Widget"));
        t.expect(scoped.find("virtual void f()") != std::string::npos, "header found after an earlier mention on the same line");
        t.expect(select_scope("class Derived : public Widget {\n virtual void d();\n};\n", std::string("Widget")).empty(),
                 "base class name is not a header");
        t.expect(select_scope("template <class T> class Box {\n virtual T get() const;\n};\n", std::string("T")).empty(),
                 "template parameter is not a header");
        t.expect(find_class_header("template <typename U, class T> struct Pair {", "T") == std::string_view::npos,
                 "second template parameter is not a header");
        t.expect(find_class_header("class [[nodiscard]] Widget {", "Widget") == 0, "attribute between keyword and name");
    }

    {
        const auto empty_body = select_class_scope("class T {};\n", std::string("T"));
        t.expect(empty_body.class_found, "empty class body still counts as found");
        t.expect(empty_body.text.empty(), "empty class body selects nothing");
        const auto missing = select_class_scope("class A {};\n", std::string("T"));
        t.expect(!missing.class_found, "missing class is reported as not found");
        t.expect(!select_class_scope("class T {};\n", std::nullopt).class_found, "no target finds no class");
    }

    {
        const std::string cleaned = makemock::strip_comments_and_directives("// class Widget {\n"
                                                                             "#include <widget.h>\n"
                                                                             "class Widget { /* } */\n"
                                                                             "  virtual void f();\n"
                                                                             "};\n");
        const std::string scoped  = select_scope(cleaned, std::string("Widget"));
        t.expect(scoped.find("virtual void f()") != std::string::npos, "braces inside comments do not close the scope");
        t.expect(scoped.find("include") == std::string::npos, "directive line dropped");
    }

    if (t.failures) {
        std::cerr << "Total failures: " << t.failures << "\n";
        return 1;
    }
    return 0;
}
