//++
// LogFile.hpp -> CLog (emulator library log file) class
//
//   COPYRIGHT (C) 2015-2026 BY SPARE TIME GIZMOS.  ALL RIGHTS RESERVED.
//
// LICENSE:
//    This file is part of the emulator library project.  EMULIB is free
// software; you may redistribute it and/or modify it under the terms of
// the GNU Affero General Public License as published by the Free Software
// Foundation, either version 3 of the License, or (at your option) any
// later version.
//
//    EMULIB is distributed in the hope that it will be useful, but WITHOUT
// ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
// FITNESS FOR A PARTICULAR PURPOSE.  See the GNU Affero General Public License
// for more details.  You should have received a copy of the GNU Affero General
// Public License along with EMULIB.  If not, see http://www.gnu.org/licenses/.
//
// DESCRIPTION:
//   The CLog class is a simple logging facility.  Messages are sent to the
// console (stderr, or stdout for CMDOUT), to a log file, or both, depending
// on the message severity and the current console and file levels.
//
//   Messages are normally generated with the LOGF() (printf style) and LOGS()
// (iostream style) macros.  These macros test the level BEFORE evaluating any
// of the arguments, so a disabled TRACE message costs almost nothing.  All of
// the macros are also harmless if no CLog object has ever been created, and
// that allows library code (e.g. the disassembler) to log freely even when
// the host program doesn't care about logging.
//
// REVISION HISTORY:
// 20-May-15  RLA   New file.
//  6-FEB-24  RLA   Create single threaded version.
// 19-OCT-26        Remove the console window and command parser dependencies.
//                    Make all the macros safe when there's no CLog instance.
//--
#pragma once
#include <stdio.h>              // FILE, fopen(), fprintf(), etc ...
#include <string>               // C++ std::string class, et al ...
#include <sstream>              // C++ std::ostringstream, for LOGS() ...
#if defined(_WIN32)
#include <sys/timeb.h>          // struct __timeb64, _ftime64_s(), etc ...
#else
#include <sys/time.h>           // struct timeval, gettimeofday(), ...
#endif
using std::string;              // ...
using std::ostringstream;       // ...


class CLog {
  //++
  // Emulator library message logging ...
  //--

  // Message severity levels ...
public:
  //   Note that the order here is significant - a message is logged if its
  // level is greater than or equal to the current console or file level.
  // NOLOG must always be last!
  enum _SEVERITIES {
    TRACE,      // instruction level tracing (very verbose!)
    DEBUG,      // debugging messages
    WARNING,    // warnings (the default console level)
    ERROR,      // errors
    CMDOUT,     // normal command output
    CMDERR,     // command errors
    ABORT,      // fatal errors
    NOLOG       // don't log anything
  };
  typedef enum _SEVERITIES SEVERITY;

  // Other magic numbers ...
  enum {
    MAXMSG  = 1024,           // longest single message we'll ever log
  };

  // Time stamps for the log file ...
#if defined(_WIN32)
  typedef struct __timeb64 TIMESTAMP;
#else
  typedef struct timeval TIMESTAMP;
#endif

  // Constructor and destructor ...
public:
  CLog (const char *pszProgram);
  virtual ~CLog();
private:
  // Disallow copy and assignments!
  CLog (const CLog &) = delete;
  CLog& operator= (CLog const &) = delete;

  // Public properties ...
public:
  // Return a pointer to the one and only CLog instance (if any) ...
  static CLog *GetLog() {return m_pLog;}
  // Return the program name (used as a message prefix) ...
  string GetProgram() const {return m_sProgram;}
  // Get or set the console and log file message levels ...
  void SetDefaultConsoleLevel (SEVERITY nLevel) {m_lvlConsole = nLevel;}
  void SetDefaultFileLevel (SEVERITY nLevel) {m_lvlFile = nLevel;}
  SEVERITY GetDefaultConsoleLevel() const {return m_lvlConsole;}
  SEVERITY GetDefaultFileLevel() const {return m_lvlFile;}
  SEVERITY GetConsoleLevel() const;
  SEVERITY GetFileLevel() const;
  // Return TRUE if messages of the specified level will be logged ...
  bool IsLoggedToConsole (SEVERITY nLevel) const {return nLevel >= GetConsoleLevel();}
  bool IsLoggedToFile (SEVERITY nLevel) const {return IsLogFileOpen() && (nLevel >= GetFileLevel());}
  bool IsLogged (SEVERITY nLevel) const {return IsLoggedToConsole(nLevel) || IsLoggedToFile(nLevel);}
  // Return TRUE if a log file is open and the name of that file ...
  bool IsLogFileOpen() const {return m_pLogFile != NULL;}
  string GetLogFileName() const {return m_sLogName;}

  // Public methods ...
public:
  // Open or close the log file ...
  bool OpenLog (const string &sFileName, SEVERITY nLevel=WARNING, bool fAppend=true);
  void CloseLog();
  // Log a message (these are used by the LOGF() and LOGS() macros) ...
  void Print (SEVERITY nLevel, const char *pszFormat, ...);
  void Print (SEVERITY nLevel, ostringstream &osText);
  // Send text directly to the log file or the console ...
  void SendLog (SEVERITY nLevel, const char *pszText, const TIMESTAMP *ptb=NULL);
  void SendConsole (SEVERITY nLevel, const char *pszText);
  // Time stamp functions ...
  static void GetTimeStamp (TIMESTAMP *ptb);
  static string GetTimeStamp();
  static string TimeStampToString (const TIMESTAMP *ptb);
  static string LevelToString (SEVERITY nLevel);

  // Private methods ...
private:
  string GetDefaultLogFileName();
  void Dispatch (SEVERITY nLevel, const char *pszText);
  void LogSingleLine (const TIMESTAMP *ptb, const string &sPrefix, const char *pszText);
  void LogSingleLine (const TIMESTAMP *ptb, SEVERITY nLevel, const char *pszText)
    {LogSingleLine(ptb, LevelToString(nLevel), pszText);}

  // Private member data ...
private:
  const string  m_sProgram;     // program name for message prefixes
  FILE         *m_pLogFile;     // handle of the log file (NULL if none)
  string        m_sLogName;     // name of the log file
  SEVERITY      m_lvlConsole;   // current console message level
  SEVERITY      m_lvlFile;      //    "    log file   "  "    "
  static CLog  *m_pLog;         // pointer to the one and only CLog instance
};


//++
//   These macros are the normal way of logging messages.  Note that the
// severity is given WITHOUT the "CLog::" prefix - e.g. LOGF(DEBUG, ...) ...
//--
#define ISLOGGED(l)   ((CLog::GetLog() != NULL) && CLog::GetLog()->IsLogged(CLog::l))
#define LOGF(l,...)   do {                                              \
    if (ISLOGGED(l)) CLog::GetLog()->Print(CLog::l, __VA_ARGS__);       \
  } while (0)
#define LOGS(l,t)     do {                                              \
    if (ISLOGGED(l)) {                                                  \
      ostringstream osLOG;  osLOG << t;                                 \
      CLog::GetLog()->Print(CLog::l, osLOG);                            \
    }                                                                   \
  } while (0)

// Command output and command errors ...
#define CMDOUTF(...)  LOGF(CMDOUT, __VA_ARGS__)
#define CMDOUTS(t)    LOGS(CMDOUT, t)
#define CMDERRF(...)  LOGF(CMDERR, __VA_ARGS__)
#define CMDERRS(t)    LOGS(CMDERR, t)
