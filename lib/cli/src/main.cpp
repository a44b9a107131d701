#include "consoledisplay.hpp"
#include "mainloop.hpp"

#include "ctrl/controller.hpp"
#include "ctrl/timer.hpp"
#include "dice/config.hpp"
#include "dice/engine.hpp"

#include "utils/log.hpp"

#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <exception>
#include <functional>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace {

constexpr auto TAG = "Main";
constexpr auto USAGE_EXAMPLE = "Example: fairdice 2,2,4,4,9,9 6,8,1,1,8,6 7,5,3,7,5,3";
constexpr int EXIT_SESSION_FAILURE = 2;

bool g_verbose = false;

// stdout belongs to the game, the log goes to stderr
void StderrLog(Log::Level lvl, const char * tag, const char * text)
{
   if (lvl < Log::Level::WARNING && !g_verbose)
      return;

   static constexpr char letters[] = {'D', 'I', 'W', 'E', 'F'};
   char timeBuf[64];
   const std::time_t t = std::time(nullptr);
   if (std::strftime(std::data(timeBuf), std::size(timeBuf), "%F %T", std::gmtime(&t)) == 0)
      timeBuf[0] = '\0';
   std::fprintf(stderr,
                "%s %c/%s: %s\n",
                std::data(timeBuf),
                letters[static_cast<int>(lvl)],
                tag,
                text);
}

bool VerboseRequested()
{
   const char * value = std::getenv("FAIRDICE_VERBOSE");
   return value && *value && std::string_view(value) != "0";
}

int RunSession(dice::DiceSet diceSet)
{
   cli::MainLoop loop;
   auto ctrl = core::CreateController(dice::CreateUniformEngine(),
                                      std::make_unique<core::Timer>(std::ref(loop)),
                                      std::move(diceSet));
   ctrl->Start(cli::CreateConsoleDisplay(stdout));

   for (;;) {
      loop.RunUntilIdle();
      if (const auto & outcome = ctrl->GetOutcome()) {
         if (std::holds_alternative<core::Aborted>(*outcome))
            Log::Info(TAG, "Session aborted by the player");
         return EXIT_SUCCESS;
      }

      std::string line;
      if (std::getline(std::cin, line))
         ctrl->OnLineReceived(std::move(line));
      else
         ctrl->OnInputClosed();
   }
}

} // namespace

int main(int argc, char * argv[])
{
   g_verbose = VerboseRequested();
   Log::s_handler = StderrLog;

   const std::vector<std::string> tokens(argv + 1, argv + argc);

   dice::DiceSet diceSet;
   try {
      diceSet = dice::ParseDiceSet(tokens);
   }
   catch (const dice::ConfigurationError & e) {
      std::fprintf(stderr, "Error: %s\n", e.what());
      std::fprintf(stdout, "%s\n", USAGE_EXAMPLE);
      return EXIT_FAILURE;
   }
   Log::Info(TAG, "Loaded {} dice", diceSet.size());

   try {
      return RunSession(std::move(diceSet));
   }
   catch (const std::exception & e) {
      Log::Error(TAG, "Session failed: {}", e.what());
      return EXIT_SESSION_FAILURE;
   }
}
