#include <algorithm>
#include <mutex>
#include <vector>

#include <plog/Init.h>
#include <plog/Log.h>

#include "logging.hpp"

using namespace std;

namespace relaycast
{
namespace internal
{
void initLogging(shared_ptr<plog::IAppender> appender, plog::Severity severity)
{
    static mutex registryMutex;
    static vector<shared_ptr<plog::IAppender>> registeredAppenders;

    lock_guard<mutex> lock(registryMutex);

    plog::Logger<PLOG_DEFAULT_INSTANCE_ID>* logger = plog::get();
    if (logger == nullptr)
    {
        plog::init(severity, appender.get());
        if (appender)
        {
            registeredAppenders.push_back(appender);
        }
        return;
    }

    logger->setMaxSeverity(severity);

    if (!appender)
    {
        return;
    }

    auto it = find(registeredAppenders.begin(), registeredAppenders.end(), appender);
    if (it == registeredAppenders.end())
    {
        logger->addAppender(appender.get());
        registeredAppenders.push_back(appender);
    }
};
} // namespace internal
} // namespace relaycast
