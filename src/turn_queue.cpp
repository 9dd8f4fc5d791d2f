#include "turn_queue.hpp"

#include <algorithm>

void TurnQueue::clear() {
    slots_.clear();
}

void TurnQueue::push(int id, uint64_t time) {
    // An entity is scheduled at most once.
    (void)remove(id);
    slots_.insert(Slot{ std::max(time, now_), nextSeq_++, id });
}

int TurnQueue::popFront() {
    if (slots_.empty()) return 0;
    const Slot cur = *slots_.begin();
    slots_.erase(slots_.begin());
    now_ = std::max(now_, cur.time);
    return cur.id;
}

void TurnQueue::reschedule(uint32_t delay) {
    if (slots_.empty()) return;
    const Slot cur = *slots_.begin();
    slots_.erase(slots_.begin());
    now_ = std::max(now_, cur.time);
    slots_.insert(Slot{ cur.time + delay, nextSeq_++, cur.id });
}

bool TurnQueue::remove(int id) {
    auto it = std::find_if(slots_.begin(), slots_.end(), [id](const Slot& s) { return s.id == id; });
    if (it == slots_.end()) return false;
    slots_.erase(it);
    return true;
}

bool TurnQueue::contains(int id) const {
    return std::any_of(slots_.begin(), slots_.end(), [id](const Slot& s) { return s.id == id; });
}

int TurnQueue::front() const {
    if (slots_.empty()) return 0;
    return slots_.begin()->id;
}

uint64_t TurnQueue::frontTime() const {
    if (slots_.empty()) return now_;
    return slots_.begin()->time;
}

std::vector<TurnQueue::Slot> TurnQueue::slots() const {
    return std::vector<Slot>(slots_.begin(), slots_.end());
}

void TurnQueue::restore(uint64_t now, uint64_t nextSeq, const std::vector<Slot>& slots) {
    slots_.clear();
    slots_.insert(slots.begin(), slots.end());
    now_ = now;
    nextSeq_ = nextSeq;
}
