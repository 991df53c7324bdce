//++
// LogFile.cpp -> CLog (emulator library log file) methods
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
//   Every message has a severity, and there are two thresholds - one for the
// console and one for the log file.  A message goes to each destination whose
// threshold it meets.  Lines in the log file get a "HH:MM:SS.mmm LEVEL" time
// stamp prefix; console lines get a prefix that depends on the severity.
//
//   There's at most one CLog at a time.  The host program creates it, and
// everybody else finds it with CLog::GetLog().  The disassembler library
// never creates one itself, so unless the host program asks for logging the
// LOGF() and LOGS() calls in the library do nothing at all.
//
//   Only the host program should open and close the log or change levels.
// Print() touches nothing except the two FILE handles, so it's safe to call
// from more than one thread as long as nobody is reconfiguring the log.
//
// REVISION HISTORY:
// 20-May-15  RLA   New file.
//  6-FEB-24  RLA   Create single threaded version.
// 19-OCT-26        Rewrite for the MSP430 disassembler library.  Remove the
//                    console window and operator/script logging.  Allow the
//                    log to be destroyed and created again.
//--
//000000001111111111222222222233333333334444444444555555555566666666667777777777
//234567890123456789012345678901234567890123456789012345678901234567890123456789
#include <stdlib.h>             // exit(), system(), etc ...
#include <stdint.h>	        // uint8_t, uint32_t, etc ...
#include <stdarg.h>             // va_start(), va_end(), et al ...
#include <assert.h>             // assert() (what else??)
#include <errno.h>              // errno ...
#include <string.h>             // strerror(), etc ...
#include <time.h>               // localtime_r(), ...
#include "EMULIB.hpp"           // emulator library definitions
#include "LogFile.hpp"          // declarations for this module

// The current CLog, or NULL if there isn't one ...
CLog *CLog::m_pLog = NULL;

// Names of the severity levels, as they appear in the log file ...
PRIVATE const char *g_apszLevels[] = {
  "TRACE", "DEBUG", "WARN", "ERROR", "CMDOUT", "CMDERR", "ABORT"
};
#define LEVEL_COUNT (sizeof(g_apszLevels)/sizeof(g_apszLevels[0]))


CLog::CLog (const char *pszProgram)
  : m_sProgram(pszProgram), m_pLogFile(NULL), m_lvlFile(NOLOG)
{
  //++
  //   The program name is only used to prefix console messages.  The log
  // file starts out closed, and the console shows warnings and up (or
  // everything from DEBUG up in a debug build).
  //--
  assert(m_pLog == NULL);
  m_pLog = this;
#if defined(_DEBUG)
  m_lvlConsole = DEBUG;
#else
  m_lvlConsole = WARNING;
#endif
}

CLog::~CLog()
{
  //++
  //   Close the log file, if one is open, and forget about this instance so
  // that a new CLog may be created later.
  //--
  CloseLog();
  assert(m_pLog == this);
  m_pLog = NULL;
}

/*static*/ string CLog::LevelToString (SEVERITY nLevel)
{
  if ((unsigned) nLevel >= LEVEL_COUNT) return string("UNKNOWN");
  return string(g_apszLevels[nLevel]);
}

CLog::SEVERITY CLog::GetConsoleLevel() const
{
  //++
  //   There are no per thread levels in this version, so the current level
  // is just the default level.  The same goes for the file level.
  //--
  return GetDefaultConsoleLevel();
}

CLog::SEVERITY CLog::GetFileLevel() const
{
  return GetDefaultFileLevel();
}

/*static*/ void CLog::GetTimeStamp (TIMESTAMP *ptb)
{
#if defined(_WIN32)
  _ftime64_s(ptb);
#else
  gettimeofday(ptb, NULL);
#endif
}

/*static*/ string CLog::TimeStampToString (const TIMESTAMP *ptb)
{
  //++
  //   Convert a time stamp to "HH:MM:SS.mmm" in local time.  There's no date,
  // but there are milliseconds since a burst of messages often arrives in
  // well under a second.
  //--
  struct tm tmLocal;  long lMilliseconds;
#if defined(_WIN32)
  _localtime64_s(&tmLocal, &(ptb->time));
  lMilliseconds = (long) ptb->millitm;
#else
  time_t tSeconds = ptb->tv_sec;
  localtime_r(&tSeconds, &tmLocal);
  lMilliseconds = (long) (ptb->tv_usec / 1000);
#endif
  return FormatString("%02d:%02d:%02d.%03ld",
    tmLocal.tm_hour, tmLocal.tm_min, tmLocal.tm_sec, lMilliseconds);
}

/*static*/ string CLog::GetTimeStamp()
{
  TIMESTAMP tbNow;
  GetTimeStamp(&tbNow);
  return TimeStampToString(&tbNow);
}

string CLog::GetDefaultLogFileName()
{
  //++
  // With no name given, the log is called "<program>_yyyymmdd.log" ...
  //--
  time_t tNow = time(NULL);  struct tm tmLocal;
#if defined(_WIN32)
  localtime_s(&tmLocal, &tNow);
#else
  localtime_r(&tNow, &tmLocal);
#endif
  return FormatString("%s_%04d%02d%02d.log", m_sProgram.c_str(),
    tmLocal.tm_year+1900, tmLocal.tm_mon+1, tmLocal.tm_mday);
}

PRIVATE string SetDefaultExtension (const string &sFileName, const char *pszExtension)
{
  //++
  //   Append pszExtension unless the last path component already has a
  // dot in it.  A dot in a directory name doesn't count.
  //--
  size_t nSlash = sFileName.find_last_of("/\\");
  size_t nDot = sFileName.find_last_of('.');
  bool fHasExtension = (nDot != string::npos) && ((nSlash == string::npos) || (nDot > nSlash));
  return fHasExtension ? sFileName : (sFileName + pszExtension);
}

bool CLog::OpenLog (const string &sFileName, SEVERITY nLevel, bool fAppend)
{
  //++
  //   Open a log file, closing any previous one first, and set the file
  // threshold to nLevel.  An empty name gets the default name, and a name
  // without an extension gets ".log".  The file is created if necessary and
  // either appended to or truncated.  Returns false if it can't be opened.
  //--
  CloseLog();
  string sName = SetDefaultExtension(sFileName.empty() ? GetDefaultLogFileName() : sFileName, ".log");
  FILE *pFile = fopen(sName.c_str(), fAppend ? "a+" : "w+");
  if (pFile == NULL) {
    CMDERRF("unable to open log %s - %s", sName.c_str(), strerror(errno));
    return false;
  }
  m_pLogFile = pFile;  m_sLogName = sName;
  SetDefaultFileLevel(nLevel);
  LOGF(DEBUG, "log %s opened", m_sLogName.c_str());
  return true;
}

void CLog::CloseLog()
{
  //++
  // Close the log file, if any.  The console is unaffected ...
  //--
  if (!IsLogFileOpen()) return;
  LOGF(DEBUG, "log %s closed", m_sLogName.c_str());
  fclose(m_pLogFile);
  m_pLogFile = NULL;  m_sLogName.clear();
  SetDefaultFileLevel(NOLOG);
}

void CLog::Dispatch (SEVERITY nLevel, const char *pszText)
{
  //++
  // Send one message to the log file and/or console, as the levels dictate ...
  //--
  if (IsLoggedToFile(nLevel)) SendLog(nLevel, pszText);
  if (IsLoggedToConsole(nLevel)) SendConsole(nLevel, pszText);
}

void CLog::Print (SEVERITY nLevel, ostringstream &osText)
{
  //++
  // LOGS() ends up here with the message already formatted ...
  //--
  Dispatch(nLevel, osText.str().c_str());
}

void CLog::Print (SEVERITY nLevel, const char *pszFormat, ...)
{
  //++
  //   And LOGF() ends up here.  Messages longer than MAXMSG are quietly
  // truncated.
  //--
  char szBuffer[MAXMSG];  va_list args;
  va_start(args, pszFormat);
  vsnprintf(szBuffer, sizeof(szBuffer), pszFormat, args);
  va_end(args);
  Dispatch(nLevel, szBuffer);
}

void CLog::LogSingleLine (const TIMESTAMP *ptb, const string &sPrefix, const char *pszText)
{
  //++
  //   Write exactly one line, with its time stamp and severity, to the log
  // file.  pszText must not contain any newlines.  The file is flushed every
  // time so nothing is lost if the program dies.
  //--
  if (!IsLogFileOpen()) return;
  fprintf(m_pLogFile, "%s %s\t%s\n", TimeStampToString(ptb).c_str(), sPrefix.c_str(), pszText);
  fflush(m_pLogFile);
}

void CLog::SendLog (SEVERITY nLevel, const char *pszText, const TIMESTAMP *ptb)
{
  //++
  //   Write a message to the log file.  A message with embedded newlines
  // becomes several log lines, all with the same time stamp (which is "now"
  // unless the caller supplies one).
  //--
  TIMESTAMP tbNow;
  if (ptb == NULL) {
    GetTimeStamp(&tbNow);  ptb = &tbNow;
  }
  string sText(pszText);  size_t nStart = 0, nEnd;
  while ((nEnd = sText.find('\n', nStart)) != string::npos) {
    LogSingleLine(ptb, nLevel, sText.substr(nStart, nEnd-nStart).c_str());
    nStart = nEnd+1;
  }
  LogSingleLine(ptb, nLevel, sText.c_str()+nStart);
}

void CLog::SendConsole (SEVERITY nLevel, const char *pszText)
{
  //++
  //   Write a message to the console.  CMDOUT is ordinary command output and
  // goes to stdout with no decoration.  Everything else goes to stderr -
  // TRACE with a "--" prefix, DEBUG in brackets, and the rest prefixed by
  // the program name.
  //--
  if (nLevel == CMDOUT)
    fprintf(stdout, "%s\n", pszText);
  else if (nLevel == TRACE)
    fprintf(stderr, "-- %s\n", pszText);
  else if (nLevel == DEBUG)
    fprintf(stderr, "[%s]\n", pszText);
  else
    fprintf(stderr, "%s: %s\n", m_sProgram.c_str(), pszText);
}
