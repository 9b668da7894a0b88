#include "roomboard/core/Logging.hpp"

Q_LOGGING_CATEGORY(lcCore, "roomboard.core")
Q_LOGGING_CATEGORY(lcEngine, "roomboard.engine")
Q_LOGGING_CATEGORY(lcData, "roomboard.data")
Q_LOGGING_CATEGORY(lcUi, "roomboard.ui")
