#include "ui.hpp"
#include "calculator.hpp"

#include <ftxui/component/component.hpp>
#include <ftxui/component/component_options.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/dom/elements.hpp>

#include <stdexcept>
#include <string>
#include <vector>

using namespace ftxui;

namespace ui {

// Number typed into a numeric field, or fallback while it is empty/too long
static long parse_field(const std::string &s, long fallback) {
  if (s.empty()) return fallback;
  try {
    return std::stol(s);
  } catch (const std::logic_error &) {
    return fallback;
  }
}

// Swallows keys that would make the field non-numeric or too long
static ComponentDecorator digits_only(const std::string *value, size_t max_len) {
  return CatchEvent([value, max_len](Event e) {
    return e.is_character() &&
           !calculator::field_accepts(*value, e.character()[0], max_len);
  });
}

static ButtonOption SmallAnimatedButtonOption(Color color) {
  ButtonOption option;
  option.transform = [](const EntryState &s) {
    auto element = text(s.label);
    if (s.focused) {
      element |= bold;
    }
    return element;
  };
  option.animated_colors.foreground.Set(
      Color::Interpolate(0.10F, color, Color::White),
      Color::Interpolate(0.85F, color, Color::White));
  option.animated_colors.background.Set(
      Color::Interpolate(0.85F, color, Color::Black),
      Color::Interpolate(0.10F, color, Color::Black));
  return option;
}

static Element label(const std::string &s) {
  return text("  " + s) | color(Color::Yellow) | size(WIDTH, EQUAL, 22);
}

void run(ScreenInteractive &screen, const calculator::Settings &defaults) {
  std::string input_a = "3/7";
  std::string input_b = "1/2";
  std::string prime_str = std::to_string(defaults.prime);
  std::string precision_str = std::to_string(defaults.precision);
  std::string show_str = std::to_string(defaults.show_digits);
  int selected_op = 0;

  InputOption single_line;
  single_line.multiline = false;

  auto input_a_comp = Input(&input_a, "rational or series...", single_line);
  auto input_b_comp = Input(&input_b, "rational or series...", single_line);

  auto input_prime = Input(&prime_str, "5", single_line) |
                     digits_only(&prime_str, calculator::PRIME_FIELD_DIGITS);
  auto input_precision =
      Input(&precision_str, "20", single_line) |
      digits_only(&precision_str, calculator::PRECISION_FIELD_DIGITS);
  auto input_show = Input(&show_str, "10", single_line) |
                    digits_only(&show_str, calculator::SHOW_FIELD_DIGITS);

  auto dropdown = Dropdown(&calculator::operation_names(), &selected_op);

  auto quit_btn = Button("  Quit  ", screen.ExitLoopClosure(),
                         SmallAnimatedButtonOption(Color::Red));

  auto all = Container::Vertical({
      input_a_comp,
      input_b_comp,
      Container::Horizontal({input_prime, input_precision, input_show}),
      dropdown,
      quit_btn,
  });

  auto renderer = Renderer(all, [&] {
    calculator::Settings settings = defaults;
    settings.prime = parse_field(prime_str, defaults.prime);
    settings.precision = parse_field(precision_str, defaults.precision);
    settings.show_digits = parse_field(show_str, defaults.show_digits);

    const auto op = static_cast<calculator::Operation>(selected_op);
    const bool binary = (op != calculator::Operation::Convert);

    std::vector<calculator::Row> rows;
    std::string error_str;

    if (input_a.empty() || (binary && input_b.empty())) {
      error_str = "(waiting for input)";
    } else {
      try {
        rows = calculator::evaluate(op, input_a, input_b, settings);
      } catch (const std::exception &ex) {
        error_str = ex.what();
      }
    }

    Elements result_lines;
    if (!error_str.empty()) {
      bool idle = rows.empty() && error_str.front() == '(';
      result_lines.push_back(text("  " + error_str) |
                             color(idle ? Color::GrayDark : Color::RedLight));
    } else {
      for (const auto &[name, value] : rows) {
        result_lines.push_back(hbox({
            label(name + ":"),
            paragraph(value) | color(Color::GreenLight) | bold,
        }));
      }
    }

    auto title = hbox({
        text(" p-adic calculator ") | bold | color(Color::Cyan),
    });

    Element operand_b =
        binary ? hbox({label("Operand B   :"), input_b_comp->Render()})
               : hbox({label("Operand B   :"),
                       text("(not used)") | color(Color::GrayDark) | dim});

    return vbox({
               separatorEmpty(),
               title | hcenter,
               separatorEmpty(),
               separator(),
               separatorEmpty(),
               hbox({label("Operand A   :"), input_a_comp->Render()}),
               separatorEmpty(),
               operand_b,
               separatorEmpty(),
               hbox({
                   label("p           :"),
                   input_prime->Render() | size(WIDTH, EQUAL, 6),
                   text("  digits: ") | color(Color::Yellow),
                   input_precision->Render() | size(WIDTH, EQUAL, 5),
                   text("  shown: ") | color(Color::Yellow),
                   input_show->Render() | size(WIDTH, EQUAL, 5),
               }),
               separatorEmpty(),
               hbox({label("Operation   :"), dropdown->Render()}),
               separatorEmpty(),
               separator(),
               separatorEmpty(),
               vbox(std::move(result_lines)),
               separatorEmpty(),
               separator(),
               separatorEmpty(),
               quit_btn->Render() | hcenter,
               separatorEmpty(),
           }) |
           border | size(WIDTH, EQUAL, 90);
  });

  screen.Loop(renderer);
}

} // namespace ui
