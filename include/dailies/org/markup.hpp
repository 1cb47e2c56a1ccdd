/*
 * dailies C++17 - Org markup helpers
 *
 * strip_org_markup() turns a slice of an org buffer into the plain text a
 * reader would see as the message. markdown_to_org() goes the other way for
 * assistant replies written in markdown.
 */
#ifndef dailies_ORG_MARKUP_HPP
#define dailies_ORG_MARKUP_HPP

#include <string>

namespace dailies {

// Removes drawers, block delimiters (keeping src/quote/example bodies
// verbatim), #+ directives, heading stars, link brackets and role markers,
// then collapses runs of blank lines and trims. Pure; offsets of the input
// are never consulted.
std::string strip_org_markup(const std::string& text);

// Fenced code -> #+begin_src/#+end_src, "#" headings -> heading_offset + level
// stars, `code` -> ~code~, **bold** -> *bold*, images and links -> [[...]].
std::string markdown_to_org(const std::string& markdown, int heading_offset = 3);

// "* " at the start of a line would open a new top-level section; rewrite it
// as a list item.
std::string escape_org_headlines(const std::string& text);

// Runs of 3+ newlines become exactly one blank line
std::string collapse_blank_lines(const std::string& text);

} // namespace dailies

#endif // dailies_ORG_MARKUP_HPP
