#pragma once

#include "replay.hpp"

#include <cstdint>
#include <string>

// Feeds a recorded command stream through Game::playerAct and compares the
// H checkpoints against Game::stateHash().

struct ReplayRunOptions {
    bool verifyHashes = true;
    uint32_t maxTurns = 0; // 0 = no limit
};

enum class ReplayFailureKind : uint8_t {
    None = 0,
    HashMismatch,
    SafetyLimit,
};

inline const char* replayFailureKindName(ReplayFailureKind k) {
    switch (k) {
        case ReplayFailureKind::None:         return "None";
        case ReplayFailureKind::HashMismatch: return "HashMismatch";
        case ReplayFailureKind::SafetyLimit:  return "SafetyLimit";
    }
    return "?";
}

struct ReplayRunStats {
    uint32_t actionsDispatched = 0;
    uint32_t checkpointsVerified = 0;
    uint32_t turns = 0;

    // Filled if the run fails.
    ReplayFailureKind failure = ReplayFailureKind::None;
    uint32_t failedTurn = 0;
    uint32_t failedCheckpointTurn = 0;
    uint64_t expectedHash = 0;
    uint64_t gotHash = 0;
};

// Configures `game` from the replay header and starts a new run with the
// recorded seed. Autosave is disabled.
bool prepareGameForReplay(Game& game, const ReplayFile& replay, std::string* err = nullptr);

// Runs a replay against a prepared game. Save commands are skipped so
// verification never writes files. Returns true on success.
bool runReplayHeadless(Game& game,
                       const ReplayFile& replay,
                       const ReplayRunOptions& opt = {},
                       ReplayRunStats* outStats = nullptr,
                       std::string* err = nullptr);
