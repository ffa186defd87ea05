#pragma once

#include <memory>

#include <plog/Appenders/IAppender.h>
#include <plog/Severity.h>

namespace relaycast
{
namespace internal
{
/**
 * @brief Attaches an appender to the default plog logger and sets its maximum severity.
 * @remark The logger is created on the first call.  Later calls only adjust the severity and add
 * the appender if it has not been attached before, so several clients may share one logger.
 * Attached appenders are kept alive for the life of the process, since plog holds them by raw
 * pointer.
 */
void initLogging(std::shared_ptr<plog::IAppender> appender, plog::Severity severity);
} // namespace internal
} // namespace relaycast
