#pragma once

#include <plog/Log.h>
#include <noscrypt.h>

/*
* @brief Logs a noscrypt result code with the function name and line number where the
* failing call was made.  Successful results are not logged.
*/
#define RC_LOG_NC_ERROR(result) relaycast::internal::logNoscryptError(result, __func__, __LINE__)

namespace relaycast
{
namespace internal
{
/**
 * @returns True if `result` indicates success, false otherwise.
 */
bool logNoscryptError(NCResult result, const char* func, int line);
} // namespace internal
} // namespace relaycast
