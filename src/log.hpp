#pragma once
#include <string>

// Console logging shared by detection threads.
// Lines keep the rover console register: "✓ ..." for success,
// "WARN: ..." / "ERROR: ..." on stderr, "[TAG] ..." for subsystem chatter.
namespace nmeascout
{
namespace log
{
void setVerbose(bool enabled);

void info(const std::string &line);
void ok(const std::string &line);
void debug(const std::string &line);  // printed only when verbose
void warn(const std::string &line);
void error(const std::string &line);
} // namespace log
} // namespace nmeascout
