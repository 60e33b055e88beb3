#pragma once

#include <plog/Record.h>
#include <plog/Severity.h>
#include <plog/Util.h>

// "LEVEL: message" lines, no timestamp or thread id
struct LevelFormatter {
    static plog::util::nstring header() { return plog::util::nstring(); }

    static plog::util::nstring format(const plog::Record& record) {
        plog::util::nostringstream ss;
        ss << level_name(record.getSeverity()) << PLOG_NSTR(": ") << record.getMessage()
           << PLOG_NSTR("\n");
        return ss.str();
    }

    static const plog::util::nchar* level_name(plog::Severity severity) {
        switch (severity) {
        case plog::fatal:
            return PLOG_NSTR("CRITICAL");
        case plog::error:
            return PLOG_NSTR("ERROR");
        case plog::warning:
            return PLOG_NSTR("WARNING");
        case plog::info:
            return PLOG_NSTR("INFO");
        case plog::debug:
        case plog::verbose:
            return PLOG_NSTR("DEBUG");
        default:
            return PLOG_NSTR("NOTSET");
        }
    }
};

// Default logger writing through LevelFormatter to stderr
void init_logging(plog::Severity severity);
