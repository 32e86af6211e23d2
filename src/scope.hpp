// Class scoping: brace-depth tracking and selection of one class body.
#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace makemock {

// Running tally of '{' minus '}' seen so far in one scan. Unbalanced input
// simply leaves the depth away from its starting value.
class BraceCounter {
  public:
    void process(std::string_view fragment);

    [[nodiscard]] int depth() const { return depth_; }

  private:
    int depth_ = 0;
};

// Offset of the `class`/`struct` keyword opening `class_name` on this line, or
// npos. Every whole-word occurrence of the name is tried; one counts only when
// the token right before it (attributes aside) is the keyword. Forward
// declarations (`class T;`), template parameters and `enum class` do not count.
std::size_t find_class_header(std::string_view line, std::string_view class_name);

struct ScopeSelection {
    std::string text;
    bool        class_found = false; // header seen, even when the body is empty
};

// Like select_scope, but also tells a missing class from an empty body.
ScopeSelection select_class_scope(std::string_view full_text, const std::optional<std::string> &target_class);

// Text inside the outermost brace pair of `target_class`, or `full_text`
// unchanged when no target is given. Returns an empty string when the class
// is never found.
std::string select_scope(std::string_view full_text, const std::optional<std::string> &target_class);

} // namespace makemock
