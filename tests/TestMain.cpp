#include <catch2/catch_session.hpp>

#include "sh/core/Logger.hpp"

int main(int argc, char* argv[]) {
    sh::core::Logger::ConfigureFromEnvironment();

    Catch::Session session;
    int returnCode = session.applyCommandLine(argc, argv);
    if (returnCode != 0) {
        return returnCode;
    }
    return session.run();
}
