#pragma once
#include <chrono>
#include "backend/generation_client.hpp"

namespace crew::orchestrator {

// Orchestrator configuration
struct OrchestratorConfig {
    backend::GenerationConfig generation;
    std::chrono::milliseconds cancel_grace{5000};   // In-flight budget after cancel()

    // Reads CREW_* variables (after load_dotenv), falling back to the defaults above.
    static OrchestratorConfig from_env();
};

} // namespace crew::orchestrator
