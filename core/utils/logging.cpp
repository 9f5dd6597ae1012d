#include "logging.hpp"

Q_LOGGING_CATEGORY(lcJob, "converter.job")
Q_LOGGING_CATEGORY(lcProcess, "converter.process")
Q_LOGGING_CATEGORY(lcProbe, "converter.probe")
Q_LOGGING_CATEGORY(lcConfig, "converter.config")
