#pragma once
#include <QLoggingCategory>
#include <QString>

namespace Medgate
{
Q_DECLARE_LOGGING_CATEGORY(lcHost)
Q_DECLARE_LOGGING_CATEGORY(lcConversation)
Q_DECLARE_LOGGING_CATEGORY(lcGeneration)
Q_DECLARE_LOGGING_CATEGORY(lcPose)
Q_DECLARE_LOGGING_CATEGORY(lcHttp)
Q_DECLARE_LOGGING_CATEGORY(lcWebSocket)
Q_DECLARE_LOGGING_CATEGORY(lcOcr)
Q_DECLARE_LOGGING_CATEGORY(lcUploads)
Q_DECLARE_LOGGING_CATEGORY(lcAudio)

// Installs the process-wide message handler.
// rules follows QLoggingCategory::setFilterRules, one rule per ';' or line.
void installLogging(const QString& rules, bool verbose);
}
