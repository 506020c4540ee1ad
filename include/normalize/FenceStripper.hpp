#pragma once
#include <string>

namespace normalize {

// Removes ``` markers; a ```json opener loses its tag too. Other tags stay as text.
std::string remove_code_fences(const std::string& text);

// Markdown/prose cleanup applied to every string the UI renders:
// - drops a leading conversational opener ("Here is ...:", "Sure, ...:") through its colon
// - unwraps **x**, __x__, *x*, _x_ (a '*' touching another '*' never counts as single emphasis)
// - rewrites "- " / "* " line markers to "• "
// Rules run to a fixed point, so the result is stable under re-application.
std::string clean_markdown(const std::string& text);

// clean_markdown() plus code-fence removal.
std::string strip(const std::string& text);

}  // namespace normalize
