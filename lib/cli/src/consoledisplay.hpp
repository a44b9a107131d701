#ifndef CLI_CONSOLEDISPLAY_HPP
#define CLI_CONSOLEDISPLAY_HPP

#include "ui/display.hpp"

#include <cstdio>
#include <memory>

namespace cli {

std::unique_ptr<ui::IDisplay> CreateConsoleDisplay(FILE * out);

} // namespace cli

#endif // CLI_CONSOLEDISPLAY_HPP
