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

#include "log.h"

#include <mutex>
#include <string>
#include <vector>

#include <assert.h>
#include <stdarg.h>
#include <stdlib.h>
#include <strings.h>
#include <unistd.h>

namespace PulseC {
namespace Log {

static thread_local std::vector<cb_t> loggers;

PULSEC_EXPORT() void pushLogger(cb_t cb)
{
    loggers.push_back(cb);
}

PULSEC_EXPORT() void popLogger()
{
    if (loggers.empty())
        return;
    loggers.pop_back();
}

static cb_t get_logger()
{
    if (loggers.empty())
        return cb_t();
    return loggers.back();
}

PULSEC_EXPORT() bool parseLevel(const char *name, Level *out)
{
    if (strcasecmp(name, "debug") == 0) {
        *out = Debug;
    }
    else if (strcasecmp(name, "info") == 0) {
        *out = Info;
    }
    else if (strcasecmp(name, "warn") == 0 || strcasecmp(name, "warning") == 0) {
        *out = Warn;
    }
    else if (strcasecmp(name, "error") == 0) {
        *out = Error;
    }
    else if (strcasecmp(name, "none") == 0) {
        *out = Force;
    }
    else {
        return false;
    }
    return true;
}

PULSEC_EXPORT() Level level = [] {
    Level res = Info;
    if (auto env = getenv("PULSEC_LOG"))
        parseLevel(env, &res);
    return res;
}();

static bool print_pid = false;
PULSEC_EXPORT() bool printPID()
{
    return print_pid;
}

PULSEC_EXPORT() void printPID(bool b)
{
    print_pid = b;
}

PULSEC_EXPORT() void _logV(Level level, const char *func, const char *fmt, va_list ap)
{
    PULSEC_RET_IF_FAIL(checkLevel(level));
    auto logger = get_logger();
    if (logger) {
        va_list aq;
        va_copy(aq, ap);
        auto size = vsnprintf(nullptr, 0, fmt, aq);
        va_end(aq);
        // size doesn't include the NUL byte at the end.
        std::string str(size, '\0');
        auto size2 = vsnprintf(&str[0], size + 1, fmt, ap);
        assert(size == size2);
        (void)size2;
        logger(level, func, str.c_str());
        return;
    }

    // Indexed by `Level`, `Force` has no prefix.
    static const char *const log_prefixes[] = {"Debug", "Info", "Warn", "Error"};

    static std::mutex log_lock;
    {
        std::lock_guard<std::mutex> lk(log_lock);
        if (print_pid) {
            int pid = getpid();
            if (level == Force) {
                fprintf(stderr, "%d: ", pid);
            }
            else if (func) {
                fprintf(stderr, "%s-%d %s ", log_prefixes[(int)level], pid, func);
            }
            else {
                fprintf(stderr, "%s-%d ", log_prefixes[(int)level], pid);
            }
        }
        else if (level == Force) {
        }
        else if (func) {
            fprintf(stderr, "%s: %s ", log_prefixes[(int)level], func);
        }
        else {
            fprintf(stderr, "%s: ", log_prefixes[(int)level]);
        }
        vfprintf(stderr, fmt, ap);
    }
    fflush(stderr);
}

PULSEC_EXPORT() void _log(Level level, const char *func, const char *fmt, ...)
{
    PULSEC_RET_IF_FAIL(checkLevel(level));
    va_list ap;
    va_start(ap, fmt);
    _logV(level, func, fmt, ap);
    va_end(ap);
}

PULSEC_EXPORT() void debugV(const char *fmt, va_list ap)
{
    _logV(Debug, nullptr, fmt, ap);
}
PULSEC_EXPORT() void infoV(const char *fmt, va_list ap)
{
    _logV(Info, nullptr, fmt, ap);
}
PULSEC_EXPORT() void warnV(const char *fmt, va_list ap)
{
    _logV(Warn, nullptr, fmt, ap);
}
PULSEC_EXPORT() void errorV(const char *fmt, va_list ap)
{
    _logV(Error, nullptr, fmt, ap);
}
PULSEC_EXPORT() void logV(const char *fmt, va_list ap)
{
    _logV(Force, nullptr, fmt, ap);
}

PULSEC_EXPORT() void debug(const char *fmt, ...)
{
    PULSEC_RET_IF_FAIL(checkLevel(Debug));
    va_list ap;
    va_start(ap, fmt);
    debugV(fmt, ap);
    va_end(ap);
}

PULSEC_EXPORT() void info(const char *fmt, ...)
{
    PULSEC_RET_IF_FAIL(checkLevel(Info));
    va_list ap;
    va_start(ap, fmt);
    infoV(fmt, ap);
    va_end(ap);
}

PULSEC_EXPORT() void warn(const char *fmt, ...)
{
    PULSEC_RET_IF_FAIL(checkLevel(Warn));
    va_list ap;
    va_start(ap, fmt);
    warnV(fmt, ap);
    va_end(ap);
}

PULSEC_EXPORT() void error(const char *fmt, ...)
{
    PULSEC_RET_IF_FAIL(checkLevel(Error));
    va_list ap;
    va_start(ap, fmt);
    errorV(fmt, ap);
    va_end(ap);
}

PULSEC_EXPORT() void log(const char *fmt, ...)
{
    va_list ap;
    va_start(ap, fmt);
    logV(fmt, ap);
    va_end(ap);
}

} // Log
} // PulseC
