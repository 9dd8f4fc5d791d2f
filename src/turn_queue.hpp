#pragma once

#include <cstddef>
#include <cstdint>
#include <set>
#include <vector>

// Action cost at speed 100, in scheduler time units.
constexpr int ENERGY_PER_ACTION = 100;

// Time until an entity with the given speed may act again.
inline uint32_t actionDelayFor(int speed) {
    if (speed < 10) speed = 10;
    if (speed > 400) speed = 400;
    return static_cast<uint32_t>((ENERGY_PER_ACTION * 100) / speed);
}

// Initiative order for a level.
//
// Entries are ordered by (time, sequence). The sequence number grows with
// every insertion, so entities due at the same time act in the order they were
// scheduled and nobody acts twice before an equally fast entity gets its turn.
// The front entry is the one entity allowed to act.
class TurnQueue {
public:
    struct Slot {
        uint64_t time = 0;
        uint64_t seq = 0;
        int id = 0;
    };

    void clear();

    void push(int id, uint64_t time);

    // Removes the front entry and returns its id (0 when empty). The clock
    // advances to the popped slot's time.
    int popFront();

    // Pops the front entity and re-inserts it `delay` units after its current
    // slot. The clock advances to the popped slot's time.
    void reschedule(uint32_t delay);

    // Drops an entity from the schedule. Returns false if it was not queued.
    bool remove(int id);

    bool contains(int id) const;
    bool empty() const { return slots_.empty(); }
    size_t size() const { return slots_.size(); }

    // 0 when empty.
    int front() const;
    uint64_t frontTime() const;
    uint64_t now() const { return now_; }

    // Snapshot in initiative order (front first).
    std::vector<Slot> slots() const;

    // Used by save/load to rebuild a queue exactly.
    void restore(uint64_t now, uint64_t nextSeq, const std::vector<Slot>& slots);
    uint64_t nextSeq() const { return nextSeq_; }

private:
    struct Order {
        bool operator()(const Slot& a, const Slot& b) const {
            if (a.time != b.time) return a.time < b.time;
            return a.seq < b.seq;
        }
    };

    std::set<Slot, Order> slots_;
    uint64_t now_ = 0;
    uint64_t nextSeq_ = 0;
};
