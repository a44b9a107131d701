#include "fsm/prompt.hpp"

#include "ctrl/input.hpp"
#include "dice/probability.hpp"

#include "utils/log.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <string_view>
#include <type_traits>
#include <variant>

namespace fsm {
namespace {

constexpr auto TAG = "FSM";

constexpr std::string_view USAGE[] = {
   "Each of us throws one die, the higher face wins. Equal faces are a tie.",
   "Before the game I commit to a secret value and show you its HMAC (SHA3-256).",
   "You guess the value, then I reveal it together with the KEY, so you can recompute",
   "HMAC(KEY, value) yourself and check that I did not change it after your guess.",
   "The table shows how often the die in a row beats the die in a column:",
};

std::string FormatRow(std::string_view label,
                      const std::vector<std::string> & cells,
                      size_t labelWidth,
                      size_t cellWidth)
{
   std::ostringstream ss;
   ss << std::left << std::setw(static_cast<int>(labelWidth)) << label << std::right;
   for (const auto & cell : cells)
      ss << std::setw(static_cast<int>(cellWidth)) << cell;
   return ss.str();
}

} // namespace

void ShowHelp(Context & ctx)
{
   const dice::DiceSet & dice = *ctx.dice;
   const dice::ProbabilityMatrix matrix = dice::CalculateProbabilities(dice);

   std::vector<std::string> header;
   header.reserve(dice.size());
   for (size_t i = 0; i < dice.size(); ++i)
      header.push_back(fmt::ToString("Die {}", i));

   size_t cellWidth = 0;
   for (const auto & label : header)
      cellWidth = std::max(cellWidth, label.size());
   for (const auto & row : matrix) {
      for (const auto & cell : row)
         cellWidth = std::max(cellWidth, cell.size());
   }
   cellWidth += 2;
   const size_t labelWidth = header.empty() ? 0 : header.back().size();

   for (std::string_view line : USAGE)
      ctx.display.Show("{}", line);
   ctx.display.Show("{}", FormatRow("", header, labelWidth, cellWidth));
   for (size_t i = 0; i < matrix.size(); ++i)
      ctx.display.Show("{}", FormatRow(header[i], matrix[i], labelWidth, cellWidth));
}

cr::TaskHandle<std::optional<uint32_t>> AwaitChoice(Context ctx,
                                                    uint32_t optionCount,
                                                    std::function<void()> showMenu,
                                                    std::string invalidNotice)
{
   for (;;) {
      if (showMenu)
         showMenu();
      ctx.display.Prompt("Your selection: ");
      const std::string line = co_await ctx.input->ReadLine();

      const core::Input input = core::ParseInput(line, optionCount);
      if (std::holds_alternative<core::input::Exit>(input)) {
         Log::Info(TAG, "Exit requested");
         co_return std::nullopt;
      }
      if (std::holds_alternative<core::input::Help>(input)) {
         ShowHelp(ctx);
         continue;
      }
      if (const auto * choice = std::get_if<core::input::Choice>(&input))
         co_return choice->index;

      Log::Debug(TAG, "Rejected input [{}]", line);
      ctx.display.Show("{}", invalidNotice);
   }
}

} // namespace fsm
