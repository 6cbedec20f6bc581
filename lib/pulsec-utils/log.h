/*************************************************************************
 *   Copyright (c) 2026 - 2026 Yichao Yu <yyc1992@gmail.com>             *
 *                                                                       *
 *   This library is free software; you can redistribute it and/or       *
 *   modify it under the terms of the GNU Lesser General Public          *
 *   License as published by the Free Software Foundation; either        *
 *   version 3.0 of the License, or (at your option) any later version.  *
 *                                                                       *
 *   This library is distributed in the hope that it will be useful,     *
 *   but WITHOUT ANY WARRANTY; without even the implied warranty of      *
 *   MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU    *
 *   Lesser General Public License for more details.                     *
 *                                                                       *
 *   You should have received a copy of the GNU Lesser General Public    *
 *   License along with this library. If not,                            *
 *   see <http://www.gnu.org/licenses/>.                                 *
 *************************************************************************/

#ifndef _PULSEC_UTILS_LOG_H_
#define _PULSEC_UTILS_LOG_H_

#include "utils.h"

#include <functional>

#include <stdarg.h>

namespace PulseC {
namespace Log {

typedef enum {
    Debug,
    Info,
    Warn,
    Error,
    Force
} Level;

extern Level level;

// Parse a level name (`debug`, `info`, `warn`/`warning`, `error`, `none`).
// Returns `false` if the name is not recognized.
bool parseLevel(const char *name, Level *out);

static PULSEC_INLINE bool checkLevel(unsigned _level)
{
    return PulseC::unlikely(_level <= Force && _level >= level);
}

// Loggers are kept per thread.
// The most recently pushed one receives every message that passes the level check,
// the default one prints to `stderr`.
using cb_t = std::function<void(Level, const char *func, const char *msg)>;
void pushLogger(cb_t cb);
void popLogger();

bool printPID();
void printPID(bool b);

__attribute__((format(printf, 3, 4)))
void _log(Level level, const char *func, const char *fmt, ...);

__attribute__((format(printf, 3, 0)))
void _logV(Level level, const char *func, const char *fmt, va_list ap);

__attribute__((format(printf, 1, 0))) void debugV(const char *fmt, va_list ap);
__attribute__((format(printf, 1, 0))) void infoV(const char *fmt, va_list ap);
__attribute__((format(printf, 1, 0))) void warnV(const char *fmt, va_list ap);
__attribute__((format(printf, 1, 0))) void errorV(const char *fmt, va_list ap);
__attribute__((format(printf, 1, 0))) void logV(const char *fmt, va_list ap);

__attribute__((format(printf, 1, 2))) void debug(const char *fmt, ...);
__attribute__((format(printf, 1, 2))) void info(const char *fmt, ...);
__attribute__((format(printf, 1, 2))) void warn(const char *fmt, ...);
__attribute__((format(printf, 1, 2))) void error(const char *fmt, ...);
__attribute__((format(printf, 1, 2))) void log(const char *fmt, ...);

} // Log
} // PulseC

#define __pulsecLog(__level, fmt, args...)                      \
    do {                                                        \
        auto level = (PulseC::Log::Level)(__level);             \
        if (!PulseC::Log::checkLevel(level))                    \
            break;                                              \
        PulseC::Log::_log(level, __FUNCTION__, fmt, ##args);    \
    } while (0)

#define pulsecDebug(fmt, args...)                       \
    __pulsecLog(PulseC::Log::Debug, fmt, ##args)
#define pulsecInfo(fmt, args...)                        \
    __pulsecLog(PulseC::Log::Info, fmt, ##args)
#define pulsecWarn(fmt, args...)                        \
    __pulsecLog(PulseC::Log::Warn, fmt, ##args)
#define pulsecError(fmt, args...)                       \
    __pulsecLog(PulseC::Log::Error, fmt, ##args)

#endif
