#ifndef INKWEATHER_TEXT_LAYOUT_H
#define INKWEATHER_TEXT_LAYOUT_H

#include <string>
#include <vector>

#include "inkweather/surface.h"

namespace inkweather
{

constexpr char ELLIPSIS[] = "...";

std::string capitalizeWords(const std::string &text);

// Shortens text with a trailing ellipsis until it fits maxWidth.
std::string fitText(const Surface &surface, const std::string &text, FontRole font, int maxWidth);

// Greedy word wrap; never returns more than maxLines lines and ellipsizes
// the last one when words were left over.
std::vector<std::string> wrapText(const Surface &surface, const std::string &text, FontRole font, int maxWidth,
                                  size_t maxLines);

} // namespace inkweather

#endif // INKWEATHER_TEXT_LAYOUT_H
