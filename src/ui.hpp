#pragma once

#include <ftxui/component/screen_interactive.hpp>

#include "calculator.hpp"

namespace ui {

// Interactive p-adic calculator; returns when the user quits.
void run(ftxui::ScreenInteractive &screen, const calculator::Settings &defaults);

} // namespace ui
