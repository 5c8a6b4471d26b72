// Copyright (c) 2025 The Synclink Authors
// Distributed under the MIT software license
// Test runner: logging is silent unless SYNCLINK_TEST_LOG_LEVEL is set

#include <catch2/catch_session.hpp>
#include <cstdlib>
#include <string>

void InitializeTestLogging(const std::string& level);
void ShutdownTestLogging();

int main(int argc, char* argv[]) {
    const char* env_level = std::getenv("SYNCLINK_TEST_LOG_LEVEL");
    InitializeTestLogging(env_level ? env_level : "off");

    int result = Catch::Session().run(argc, argv);

    ShutdownTestLogging();
    return result;
}
