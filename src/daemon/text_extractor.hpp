#pragma once

#include <string>

namespace pagewatch {

/**
 * Extract the human-visible text of an HTML document.
 *
 * The markup is parsed with lexbor's HTML5 parser, which recovers from any
 * malformed input. Text nodes are visited in document order; text inside
 * script, style and template elements and all comments are skipped. Every
 * node is trimmed of surrounding whitespace, empty nodes are dropped and the
 * rest are joined with a single '\n'.
 *
 * The output depends only on the input bytes, so equal pages compare equal.
 */
std::string extractVisibleText(const std::string &html);

} // namespace pagewatch
