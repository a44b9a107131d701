#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <functional>
#include <list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "fakelogger.hpp"
#include "commit/commitment.hpp"
#include "ctrl/controller.hpp"
#include "ctrl/timer.hpp"
#include "dice/config.hpp"
#include "dice/engine.hpp"
#include "ui/display.hpp"

namespace {
using namespace std::chrono_literals;

class MockTimerEngine
{
public:
   MockTimerEngine()
      : m_processing(false)
   {}
   ~MockTimerEngine() { ExhaustQueue(); }

   void FastForwardTime(std::chrono::seconds sec = 0s)
   {
      if (sec == 0s)
         return ProcessTimers();

      const auto end = m_now + sec;
      do {
         m_now += 1s;
         ProcessTimers();
      } while (m_now < end);
   }

   void operator()(std::function<void()> && task, std::chrono::milliseconds period)
   {
      const auto timeToFire = m_now + period;
      m_timers.push_back({std::move(task), timeToFire});
   }

   bool Empty() const { return m_timers.empty(); }

   void ExhaustQueue()
   {
      while (!m_timers.empty())
         FastForwardTime(1s);
   }

private:
   struct Timer
   {
      std::function<void()> task;
      std::chrono::steady_clock::time_point time;
   };
   void ProcessTimers()
   {
      if (m_processing)
         return;
      m_processing = true;
      for (auto it = std::begin(m_timers); it != std::end(m_timers);) {
         if (it->time <= m_now) {
            it->task();
            it = m_timers.erase(it);
         } else {
            ++it;
         }
      }
      m_processing = false;
   }

   std::chrono::steady_clock::time_point m_now;
   std::list<Timer> m_timers;
   bool m_processing;
};

class StubGenerator : public dice::IEngine
{
public:
   size_t index = 5;

private:
   size_t GenerateIndex(size_t size) override { return index % size; }
};

class FakeDisplay : public ui::IDisplay
{
public:
   FakeDisplay(std::vector<std::string> & lines, size_t & prompts)
      : m_lines(lines)
      , m_prompts(prompts)
   {}

private:
   void ShowLine(std::string_view text) override { m_lines.emplace_back(text); }
   void ShowPrompt(std::string_view text) override
   {
      EXPECT_EQ("Your selection: ", text);
      ++m_prompts;
   }

   std::vector<std::string> & m_lines;
   size_t & m_prompts;
};

class SessionFixture : public ::testing::Test
{
protected:
   std::unique_ptr<core::IController> CreateController(
      std::vector<std::string> config = {"2,2,4,4,9,9", "6,8,1,1,8,6", "7,5,3,7,5,3"})
   {
      generator = new StubGenerator;
      auto ctrl = core::CreateController(std::unique_ptr<dice::IEngine>(generator),
                                         std::make_unique<core::Timer>(std::ref(m_timer)),
                                         dice::ParseDiceSet(config));
      ctrl->Start(std::make_unique<FakeDisplay>(shown, prompts));
      m_timer.FastForwardTime();
      return ctrl;
   }

   void Send(core::IController & ctrl, std::string line)
   {
      ctrl.OnLineReceived(std::move(line));
      m_timer.FastForwardTime();
   }

   bool Shown(std::string_view text) const
   {
      return std::find(shown.cbegin(), shown.cend(), text) != shown.cend();
   }
   std::optional<size_t> IndexOf(std::string_view text) const
   {
      auto it = std::find(shown.cbegin(), shown.cend(), text);
      if (it == shown.cend())
         return std::nullopt;
      return static_cast<size_t>(it - shown.cbegin());
   }
   std::string FindStartingWith(std::string_view prefix) const
   {
      auto it = std::find_if(shown.cbegin(), shown.cend(), [&](const std::string & line) {
         return line.starts_with(prefix);
      });
      return it == shown.cend() ? std::string() : *it;
   }
   bool AnyStartingWith(std::string_view prefix) const { return !FindStartingWith(prefix).empty(); }

   // Guesses 0 and waits for the dice menu. Returns whether the player moves first.
   bool PassNegotiation(core::IController & ctrl)
   {
      EXPECT_EQ("New state: StateNegotiating", logger.GetLastStateLine());
      Send(ctrl, "0");
      EXPECT_EQ("New state: StateSelecting", logger.GetLastStateLine());
      const bool playerFirst = Shown("You make the first move!");
      EXPECT_NE(playerFirst, Shown("I make the first move!"));
      return playerFirst;
   }

   MockTimerEngine m_timer;
   StubGenerator * generator = nullptr;
   std::vector<std::string> shown;
   size_t prompts = 0;
   FakeLogger logger;
};

TEST_F(SessionFixture, session_starts_with_published_commitment)
{
   auto ctrl = CreateController();
   EXPECT_EQ("New state: StateNegotiating", logger.GetLastStateLine());
   EXPECT_TRUE(logger.NoWarningsOrErrors());

   ASSERT_FALSE(shown.empty());
   const std::string & first = shown.front();
   EXPECT_TRUE(first.starts_with("I selected a random value in the range 0..1 (HMAC="));
   const size_t pos = first.find("HMAC=");
   ASSERT_NE(std::string::npos, pos);
   const std::string tag = first.substr(pos + 5, commit::TAG_SIZE * 2);
   EXPECT_TRUE(commit::FromHex(tag).has_value());
   EXPECT_EQ(").", first.substr(pos + 5 + commit::TAG_SIZE * 2));

   EXPECT_TRUE(Shown("Try to guess my selection."));
   EXPECT_TRUE(Shown("0 - 0"));
   EXPECT_TRUE(Shown("1 - 1"));
   EXPECT_TRUE(Shown("X - exit"));
   EXPECT_TRUE(Shown("? - help"));
   EXPECT_EQ(1U, prompts);
   EXPECT_FALSE(ctrl->GetOutcome());
}

TEST_F(SessionFixture, exit_during_negotiation_aborts_before_any_throw)
{
   auto ctrl = CreateController();
   logger.Clear();

   Send(*ctrl, "x");
   ASSERT_TRUE(ctrl->GetOutcome());
   EXPECT_TRUE(std::holds_alternative<core::Aborted>(*ctrl->GetOutcome()));
   EXPECT_TRUE(Shown("Goodbye!"));
   EXPECT_FALSE(AnyStartingWith("My selection:"));
   EXPECT_FALSE(AnyStartingWith("Your throw:"));
   EXPECT_FALSE(AnyStartingWith("My throw:"));
   EXPECT_TRUE(logger.GetLastStateLine().empty());
   EXPECT_TRUE(logger.NoWarningsOrErrors());
   EXPECT_TRUE(m_timer.Empty());
}

TEST_F(SessionFixture, invalid_guess_is_rejected_and_prompt_repeated)
{
   auto ctrl = CreateController();
   logger.Clear();
   shown.clear();

   for (const char * line : {"2", "", "abc", "-1", "0 1"}) {
      Send(*ctrl, line);
      EXPECT_TRUE(Shown("Invalid input. Please choose a number from 0 to 1.")) << line;
      EXPECT_TRUE(Shown("Try to guess my selection.")) << line;
      shown.clear();
   }
   EXPECT_EQ(6U, prompts);
   EXPECT_TRUE(logger.GetLastStateLine().empty());
   EXPECT_FALSE(ctrl->GetOutcome());

   Send(*ctrl, "1");
   EXPECT_EQ("New state: StateSelecting", logger.GetLastStateLine());
}

TEST_F(SessionFixture, disclosed_key_verifies_published_tag)
{
   auto ctrl = CreateController();
   const std::string first = shown.front();
   const std::string tag = first.substr(first.find("HMAC=") + 5, commit::TAG_SIZE * 2);

   const bool playerFirst = PassNegotiation(*ctrl);

   const std::string reveal = FindStartingWith("My selection: ");
   ASSERT_FALSE(reveal.empty());
   const char digit = reveal[std::string_view("My selection: ").size()];
   ASSERT_TRUE(digit == '0' || digit == '1') << reveal;
   const uint32_t value = static_cast<uint32_t>(digit - '0');
   const size_t keyPos = reveal.find("KEY=");
   ASSERT_NE(std::string::npos, keyPos);
   const std::string key = reveal.substr(keyPos + 4, commit::KEY_SIZE * 2);

   EXPECT_TRUE(commit::VerifyCommitment(tag, key, value));
   EXPECT_FALSE(commit::VerifyCommitment(tag, key, value ^ 1U));
   EXPECT_EQ(value == 0U, playerFirst);
   EXPECT_TRUE(logger.NoWarningsOrErrors());
}

TEST_F(SessionFixture, help_during_negotiation_keeps_awaiting_guess)
{
   auto ctrl = CreateController();
   logger.Clear();
   shown.clear();
   const size_t promptsBefore = prompts;

   Send(*ctrl, "?");
   EXPECT_TRUE(logger.GetLastStateLine().empty());
   EXPECT_EQ(promptsBefore + 1, prompts);
   EXPECT_FALSE(ctrl->GetOutcome());
   EXPECT_FALSE(AnyStartingWith("My selection:"));

   const std::string row0 = FindStartingWith("Die 0");
   ASSERT_FALSE(row0.empty());
   EXPECT_NE(std::string::npos, row0.find("55.56%"));
   const auto table = IndexOf(row0);
   const auto menu = IndexOf("Try to guess my selection.");
   ASSERT_TRUE(table);
   ASSERT_TRUE(menu);
   EXPECT_LT(*table, *menu);

   Send(*ctrl, "0");
   EXPECT_EQ("New state: StateSelecting", logger.GetLastStateLine());
   EXPECT_TRUE(AnyStartingWith("My selection:"));
}

TEST_F(SessionFixture, help_during_selection_prints_table_without_state_change)
{
   auto ctrl = CreateController();
   PassNegotiation(*ctrl);
   EXPECT_TRUE(Shown("Choose your dice:"));
   EXPECT_TRUE(Shown("0 - 2,2,4,4,9,9"));
   EXPECT_TRUE(Shown("1 - 6,8,1,1,8,6"));
   EXPECT_TRUE(Shown("2 - 7,5,3,7,5,3"));
   logger.Clear();
   shown.clear();
   const size_t promptsBefore = prompts;

   Send(*ctrl, "?");
   EXPECT_TRUE(logger.GetLastStateLine().empty());
   EXPECT_EQ(promptsBefore + 1, prompts);
   EXPECT_FALSE(ctrl->GetOutcome());

   const std::string header = FindStartingWith(" ");
   EXPECT_NE(std::string::npos, header.find("Die 0"));
   EXPECT_NE(std::string::npos, header.find("Die 2"));

   const std::string row0 = FindStartingWith("Die 0");
   ASSERT_FALSE(row0.empty());
   EXPECT_NE(std::string::npos, row0.find("-"));
   EXPECT_NE(std::string::npos, row0.find("55.56%"));
   EXPECT_NE(std::string::npos, row0.find("44.44%"));
   EXPECT_FALSE(FindStartingWith("Die 1").empty());
   EXPECT_FALSE(FindStartingWith("Die 2").empty());

   // still selecting
   Send(*ctrl, "0");
   EXPECT_TRUE(Shown("You chose the [2,2,4,4,9,9] dice."));
}

TEST_F(SessionFixture, house_takes_first_remaining_die)
{
   auto ctrl = CreateController();
   PassNegotiation(*ctrl);
   logger.Clear();

   Send(*ctrl, "0");
   EXPECT_TRUE(Shown("You chose the [2,2,4,4,9,9] dice."));
   EXPECT_TRUE(Shown("I chose the [6,8,1,1,8,6] dice."));
   EXPECT_EQ("New state: StatePlaying", logger.GetLastStateLine());
}

TEST_F(SessionFixture, full_round_player_wins)
{
   auto ctrl = CreateController();
   const bool playerFirst = PassNegotiation(*ctrl);

   Send(*ctrl, "0");
   ASSERT_TRUE(ctrl->GetOutcome());
   const auto * result = std::get_if<dice::RoundResult>(&*ctrl->GetOutcome());
   ASSERT_TRUE(result);
   EXPECT_EQ(9, result->playerFace);
   EXPECT_EQ(6, result->houseFace);
   EXPECT_EQ(dice::Verdict::PLAYER_WINS, result->verdict);

   const auto yours = IndexOf("Your throw: 9.");
   const auto mine = IndexOf("My throw: 6.");
   ASSERT_TRUE(yours);
   ASSERT_TRUE(mine);
   EXPECT_EQ(playerFirst, *yours < *mine);
   EXPECT_TRUE(Shown("You win (9 > 6)!"));
   EXPECT_TRUE(logger.NoWarningsOrErrors());
   EXPECT_TRUE(m_timer.Empty());
}

TEST_F(SessionFixture, full_round_house_wins)
{
   auto ctrl = CreateController();
   generator->index = 2;
   PassNegotiation(*ctrl);

   Send(*ctrl, "1");
   EXPECT_TRUE(Shown("You chose the [6,8,1,1,8,6] dice."));
   EXPECT_TRUE(Shown("I chose the [2,2,4,4,9,9] dice."));
   EXPECT_TRUE(Shown("Your throw: 1."));
   EXPECT_TRUE(Shown("My throw: 4."));
   EXPECT_TRUE(Shown("I win (4 > 1)!"));

   ASSERT_TRUE(ctrl->GetOutcome());
   const auto * result = std::get_if<dice::RoundResult>(&*ctrl->GetOutcome());
   ASSERT_TRUE(result);
   EXPECT_EQ(dice::Verdict::HOUSE_WINS, result->verdict);
}

TEST_F(SessionFixture, identical_dice_are_distinct_by_position)
{
   auto ctrl = CreateController({"3,3,3,3,3,3", "3,3,3,3,3,3", "1,1,1,1,1,1"});
   PassNegotiation(*ctrl);

   Send(*ctrl, "0");
   EXPECT_TRUE(Shown("I chose the [3,3,3,3,3,3] dice."));
   EXPECT_TRUE(Shown("It's a tie (3 = 3)!"));
   ASSERT_TRUE(ctrl->GetOutcome());
   const auto * result = std::get_if<dice::RoundResult>(&*ctrl->GetOutcome());
   ASSERT_TRUE(result);
   EXPECT_EQ(dice::Verdict::TIE, result->verdict);
}

TEST_F(SessionFixture, invalid_selection_is_rejected)
{
   auto ctrl = CreateController();
   PassNegotiation(*ctrl);
   logger.Clear();

   Send(*ctrl, "3");
   EXPECT_TRUE(Shown("Invalid selection. Please choose a valid dice index."));
   EXPECT_TRUE(logger.GetLastStateLine().empty());
   EXPECT_FALSE(ctrl->GetOutcome());

   Send(*ctrl, "X");
   ASSERT_TRUE(ctrl->GetOutcome());
   EXPECT_TRUE(std::holds_alternative<core::Aborted>(*ctrl->GetOutcome()));
   EXPECT_FALSE(AnyStartingWith("You chose"));
}

TEST_F(SessionFixture, closed_input_aborts_the_session)
{
   auto ctrl = CreateController();
   PassNegotiation(*ctrl);

   shown.clear();
   ctrl->OnInputClosed();
   m_timer.FastForwardTime();
   ASSERT_TRUE(ctrl->GetOutcome());
   EXPECT_TRUE(std::holds_alternative<core::Aborted>(*ctrl->GetOutcome()));
   EXPECT_EQ(std::vector<std::string>{"Goodbye!"}, shown);
   EXPECT_TRUE(m_timer.Empty());
}

TEST_F(SessionFixture, lines_after_the_end_are_ignored)
{
   auto ctrl = CreateController();
   Send(*ctrl, "x");
   ASSERT_TRUE(ctrl->GetOutcome());
   shown.clear();
   logger.Clear();

   Send(*ctrl, "0");
   EXPECT_TRUE(shown.empty());
   EXPECT_EQ(0U, logger.CountWithTag("Display"));
   EXPECT_EQ(2U, logger.CountWithTag("Input"));
   EXPECT_TRUE(std::holds_alternative<core::Aborted>(*ctrl->GetOutcome()));
   EXPECT_FALSE(logger.NoWarningsOrErrors());
}

} // namespace
