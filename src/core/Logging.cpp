#include "taskdash/core/Logging.hpp"

Q_LOGGING_CATEGORY(tdCore, "taskdash.core")
Q_LOGGING_CATEGORY(tdData, "taskdash.data")
Q_LOGGING_CATEGORY(tdCli, "taskdash.cli")
