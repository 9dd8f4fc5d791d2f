#include "replay_runner.hpp"

#include <sstream>

namespace {

void formatHashMismatch(const ReplayRunStats& st, std::string& out) {
    std::ostringstream ss;
    if (st.failedCheckpointTurn != st.failedTurn) {
        ss << "REPLAY DESYNC: checkpoint for turn " << st.failedCheckpointTurn
           << " reached at turn " << st.failedTurn;
    } else {
        ss << "REPLAY DESYNC at turn " << st.failedTurn
           << " (expected 0x" << std::hex << st.expectedHash
           << ", got 0x" << std::hex << st.gotHash << ")";
    }
    out = ss.str();
}

} // namespace

bool prepareGameForReplay(Game& game, const ReplayFile& replay, std::string* err) {
    game.setConfig(gameConfigFromReplay(replay.meta));
    if (replay.meta.seed == 0) {
        if (err) *err = "replay has no seed";
        return false;
    }
    return game.newGame(replay.meta.seed, err);
}

bool runReplayHeadless(Game& game,
                       const ReplayFile& replay,
                       const ReplayRunOptions& opt,
                       ReplayRunStats* outStats,
                       std::string* err) {
    ReplayRunStats local;
    ReplayRunStats& st = outStats ? *outStats : local;
    st = ReplayRunStats{};

    auto failWith = [&](ReplayFailureKind kind, const std::string& msg) -> bool {
        st.failure = kind;
        st.turns = game.turnCount();
        if (err) *err = msg;
        return false;
    };

    for (const auto& ev : replay.events) {
        if (ev.kind == ReplayEventType::StateHash) {
            if (!opt.verifyHashes) continue;

            const uint64_t got = game.stateHash();
            if (game.turnCount() != ev.turn || got != ev.hash) {
                st.failedTurn = game.turnCount();
                st.failedCheckpointTurn = ev.turn;
                st.expectedHash = ev.hash;
                st.gotHash = got;
                std::string msg;
                formatHashMismatch(st, msg);
                return failWith(ReplayFailureKind::HashMismatch, msg);
            }
            ++st.checkpointsVerified;
            continue;
        }

        if (ev.action == Action::Save) continue;

        ++st.actionsDispatched;
        const ActionResult r = game.playerAct(ev.action);
        if (r == ActionResult::Quit) break;

        if (opt.maxTurns > 0 && game.turnCount() > opt.maxTurns) {
            return failWith(ReplayFailureKind::SafetyLimit, "replay exceeded the turn limit");
        }
    }

    st.turns = game.turnCount();
    return true;
}
