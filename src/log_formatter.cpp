#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Init.h>
#include <plog/Log.h>

#include "log_formatter.hpp"

void init_logging(plog::Severity severity) {
    static plog::ConsoleAppender<LevelFormatter> console_appender(plog::streamStdErr);

    if (auto* logger = plog::get()) {
        logger->setMaxSeverity(severity);
        return;
    }

    plog::init(severity, &console_appender);
}
