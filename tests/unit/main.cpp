/**
 * (c) 2026 by the Synapse transfer engine authors
 *
 * This file is part of the Synapse transfer engine.
 *
 * The Synapse transfer engine is distributed in the hope that it will be
 * useful, but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
 *
 * @copyright Simplified (2-clause) BSD License.
 *
 * You should have received a copy of the license along with this
 * program.
 */

#include <cstdlib>

#include <gtest/gtest.h>

#include <synapse/logging.h>

int main (int argc, char *argv[])
{
    // Let the environment raise the verbosity when diagnosing failures.
    if (auto level = std::getenv("SYNAPSE_TEST_LOG_LEVEL"))
    {
        synapse::SimpleLogger::setLogLevel(synapse::toLogLevel(level));
        synapse::externalLogger().setLogToConsole(true);
    }
    else
    {
        synapse::SimpleLogger::setLogLevel(synapse::logWarning);
    }

    testing::InitGoogleTest(&argc, argv);
    int rc = RUN_ALL_TESTS();
    return rc;
}
