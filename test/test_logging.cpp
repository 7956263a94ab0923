// Copyright (c) 2025 The NearLink Developers
// Distributed under the MIT software license
// Test logging initialization helpers

#include "util/logging.hpp"
#include <string>

// Initialize logging for tests (console only, no file)
void InitializeTestLogging(const std::string& level) {
    nearlink::util::LogManager::Initialize(level, false, "");

    // If level is "trace", also enable TRACE for all components
    if (level == "trace") {
        for (const auto& component : nearlink::util::LogManager::Components()) {
            nearlink::util::LogManager::SetComponentLevel(component, "trace");
        }
    }
}

// Shutdown logging system after tests complete
void ShutdownTestLogging() {
    nearlink::util::LogManager::Shutdown();
}
