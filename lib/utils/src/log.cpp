#include "utils/log.hpp"

#include <cstdio>
#include <cstdlib>
#include <ctime>

namespace {

char LevelLetter(Log::Level lvl)
{
   switch (lvl) {
   case Log::Level::DEBUG:
      return 'D';
   case Log::Level::INFO:
      return 'I';
   case Log::Level::WARNING:
      return 'W';
   case Log::Level::ERROR:
      return 'E';
   case Log::Level::FATAL:
      return 'F';
   }
   return '?';
}

void StdLog(FILE * file, Log::Level lvl, const char * tag, const char * text)
{
   char timeBuf[64];
   const std::time_t t = std::time(nullptr);
   if (std::strftime(std::data(timeBuf), std::size(timeBuf), "%F %T", std::gmtime(&t)) == 0)
      timeBuf[0] = '\0';

   fprintf(file, "%s %c/%s: %s\n", std::data(timeBuf), LevelLetter(lvl), tag, text);
}

} // namespace


Log::Handler Log::s_handler = nullptr;

void Log::Write(Level lvl, const char * tag, const char * text)
{
   if (s_handler)
      s_handler(lvl, tag, text);
   else
      StdLog(lvl < Level::WARNING ? stdout : stderr, lvl, tag, text);
}

void Log::Debug(const char * tag, const char * text)
{
   Write(Level::DEBUG, tag, text);
}

void Log::Info(const char * tag, const char * text)
{
   Write(Level::INFO, tag, text);
}

void Log::Warning(const char * tag, const char * text)
{
   Write(Level::WARNING, tag, text);
}

void Log::Error(const char * tag, const char * text)
{
   Write(Level::ERROR, tag, text);
}

void Log::Fatal(const char * tag, const char * text)
{
   Write(Level::FATAL, tag, text);
   std::abort();
}
