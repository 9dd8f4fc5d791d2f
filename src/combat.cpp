#include "game.hpp"

#include <algorithm>
#include <sstream>

namespace {

std::string displayName(const Entity& e) {
    if (e.kind == EntityKind::Player) return "YOU";
    return std::string("THE ") + kindName(e.kind);
}

} // namespace

void Game::attackMelee(Entity& attacker, Entity& defender) {
    if (attacker.hp <= 0 || defender.hp <= 0) return;

    const bool playerAttacking = (attacker.kind == EntityKind::Player);
    const int dmg = std::max(0, attacker.atk - defender.def);

    std::ostringstream ss;
    if (dmg <= 0) {
        if (playerAttacking) {
            ss << "YOU MISS " << displayName(defender) << ".";
        } else {
            ss << displayName(attacker) << " MISSES YOU.";
        }
    } else {
        defender.hp -= dmg;
        if (playerAttacking) {
            ss << "YOU HIT " << displayName(defender) << " FOR " << dmg << ".";
        } else {
            ss << displayName(attacker) << " HITS YOU FOR " << dmg << ".";
        }
    }
    pushMsg(ss.str(), MessageKind::Combat);

    // Getting hit wakes a monster up.
    if (playerAttacking && defender.hp > 0 && !defender.alerted) {
        defender.alerted = true;
        defender.lastKnownPlayerPos = attacker.pos;
    }

    if (defender.hp <= 0 && defender.kind != EntityKind::Player) {
        pushMsg(displayName(defender) + " DIES.", MessageKind::Combat);
        if (playerAttacking) ++killCount_;
    }
}

void Game::cleanupDead() {
    for (const auto& e : ents) {
        if (e.alive()) continue;
        (void)queue.remove(e.id);
        (void)occ.remove(e.id, e.pos);

        if (e.id == playerId_ && !gameOver_) {
            gameOver_ = true;
            pushMsg("YOU DIE...", MessageKind::System);
        }
    }

    // The player entry stays so the final state can still be inspected.
    ents.erase(std::remove_if(ents.begin(), ents.end(), [&](const Entity& e) {
        return !e.alive() && e.id != playerId_;
    }), ents.end());
}
