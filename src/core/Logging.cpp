#include "meetings/core/Logging.hpp"

Q_LOGGING_CATEGORY(lcStore, "meetings.store")
Q_LOGGING_CATEGORY(lcConflicts, "meetings.conflicts")
Q_LOGGING_CATEGORY(lcProtocol, "meetings.protocol")
Q_LOGGING_CATEGORY(lcSession, "meetings.session")
Q_LOGGING_CATEGORY(lcServer, "meetings.server")
Q_LOGGING_CATEGORY(lcClient, "meetings.client")
