/*
 *  Client interface for local Exta Life controller access
 *
 *  Logging module
 *
 *  Log lines are written to an output stream (std::cout unless changed) or
 *  handed to a callback if one is installed. Compiling with DEBUG defined
 *  lowers the default level to LEVEL_DEBUG, which includes the raw frame
 *  traces of the socket session.
 *
 *
 *  Copyright 2026 - extalifepp contributors
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved. See COPYING, AUTHORS.
 *
 *  @license GPL-3.0+
 */

#ifndef _extalifeLog
#define _extalifeLog

#include <functional>
#include <ostream>
#include <sstream>
#include <string>


namespace ExtaLife {
  namespace Log {
    enum value {
      LEVEL_ERROR,
      LEVEL_WARNING,
      LEVEL_INFO,
      LEVEL_DEBUG
    }; // enum value

    typedef std::function<void(const value level, const std::string &message)> Callback;

    void setLevel(const value level);
    value getLevel();
    bool isEnabled(const value level);

    // output stream used when no callback is installed, nullptr silences output
    void setOutput(std::ostream *out);
    void setCallback(Callback callback);

    void write(const value level, const std::string &message);
    const char* levelName(const value level);


    // Collects one log line and writes it on destruction:
    //   ExtaLife::Log::Line(ExtaLife::Log::LEVEL_DEBUG) << "value " << x;
    class Line
    {
    public:
      explicit Line(const value level) : m_level(level), m_enabled(isEnabled(level)) {}
      ~Line() { if (m_enabled) write(m_level, m_stream.str()); }

      template <typename T>
      Line& operator<<(const T &item)
      {
        if (m_enabled)
          m_stream << item;
        return *this;
      }

    private:
      Line(const Line&);
      Line& operator=(const Line&);

      value m_level;
      bool m_enabled;
      std::ostringstream m_stream;
    };

  }; // namespace Log
}; // namespace ExtaLife

#endif
