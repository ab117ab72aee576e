#pragma once

#include <QString>
#include <QStringList>

#include "common/command_runner.hpp"
#include "common/config.hpp"

namespace pkgsnap {

class SnapshotCli
{
public:
    explicit SnapshotCli(RunConfig config);

    // Use runner instead of spawning real processes. Not owned.
    void setCommandRunner(CommandRunner *runner);

    // Parses flags, runs one snapshot and reports the outcome.
    // returns exit code
    int run(int argc, char *argv[]);

    // True when args select test mode in any spelling the parser accepts
    // ("--test" or "-test"). Lets main() silence file logging before the
    // first event is written.
    static bool requestsTestMode(const QStringList &args);

private:
    int runSnapshot(const QStringList &args);

    RunConfig m_config;
    CommandRunner *m_runner = nullptr;
};

} // namespace pkgsnap
