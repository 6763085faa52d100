#include "util/log_categories.hpp"

Q_LOGGING_CATEGORY(folioZipLog, "folio.zip")
Q_LOGGING_CATEGORY(folioImportLog, "folio.scrivener.import")
Q_LOGGING_CATEGORY(folioExportLog, "folio.scrivener.export")
Q_LOGGING_CATEGORY(folioCompileLog, "folio.compile")
Q_LOGGING_CATEGORY(folioCliLog, "folio.cli")
