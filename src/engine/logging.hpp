#pragma once

#include <QString>

namespace tidemark {

// Installs a Qt message handler that appends every message to `path` as
// "<UTC timestamp> <level> <category> <message>". Every message is then passed
// on to the handler that was installed before (Qt's default prints to stderr).
// Returns false if the file cannot be opened; the handler is not installed then.
bool install_file_logging(const QString& path);

// Restores the previous handler and closes the log file.
void uninstall_file_logging();

} // namespace tidemark
