#pragma once

#include <memory>

#include "session_engine.hpp"

// Wires the configured detector, emotion classifier and identity
// repository into an engine, then loads identities and (optionally) the
// report history. Throws std::runtime_error when a required model or the
// database cannot be opened.
std::unique_ptr<SessionEngine> buildEngine(const Config& config);
