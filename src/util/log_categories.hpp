#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(folioZipLog)
Q_DECLARE_LOGGING_CATEGORY(folioImportLog)
Q_DECLARE_LOGGING_CATEGORY(folioExportLog)
Q_DECLARE_LOGGING_CATEGORY(folioCompileLog)
Q_DECLARE_LOGGING_CATEGORY(folioCliLog)
