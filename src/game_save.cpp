#include "game.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>
#include <utility>

namespace {
constexpr uint32_t SAVE_MAGIC = 0x53564C44u; // 'DLVS'
constexpr uint32_t SAVE_VERSION = 1u;

// Upper bounds used to reject garbage before allocating.
constexpr int32_t MAX_MAP_DIM = 1024;
constexpr uint32_t MAX_LIST = 1u << 20;
// Entity stats outside these bounds only come from a tampered file.
constexpr int32_t MAX_STAT = 100000;

uint32_t crc32(const uint8_t* data, size_t n) {
    static uint32_t table[256];
    static bool inited = false;
    if (!inited) {
        for (uint32_t i = 0; i < 256; ++i) {
            uint32_t c = i;
            for (int k = 0; k < 8; ++k) {
                c = (c & 1u) ? (0xEDB88320u ^ (c >> 1)) : (c >> 1);
            }
            table[i] = c;
        }
        inited = true;
    }

    uint32_t crc = 0xFFFFFFFFu;
    for (size_t i = 0; i < n; ++i) {
        crc = table[(crc ^ data[i]) & 0xFFu] ^ (crc >> 8);
    }
    return crc ^ 0xFFFFFFFFu;
}

uint32_t readU32LE(const uint8_t* p) {
    return static_cast<uint32_t>(p[0])
        | (static_cast<uint32_t>(p[1]) << 8)
        | (static_cast<uint32_t>(p[2]) << 16)
        | (static_cast<uint32_t>(p[3]) << 24);
}

void appendU32LE(std::string& s, uint32_t v) {
    char b[4];
    b[0] = static_cast<char>(v & 0xFFu);
    b[1] = static_cast<char>((v >> 8) & 0xFFu);
    b[2] = static_cast<char>((v >> 16) & 0xFFu);
    b[3] = static_cast<char>((v >> 24) & 0xFFu);
    s.append(b, 4);
}

template <typename T>
void writePod(std::ostream& out, const T& v) {
    out.write(reinterpret_cast<const char*>(&v), static_cast<std::streamsize>(sizeof(T)));
}

template <typename T>
bool readPod(std::istream& in, T& v) {
    return static_cast<bool>(in.read(reinterpret_cast<char*>(&v), static_cast<std::streamsize>(sizeof(T))));
}

void writeString(std::ostream& out, const std::string& s) {
    uint32_t len = static_cast<uint32_t>(s.size());
    writePod(out, len);
    if (len) out.write(s.data(), static_cast<std::streamsize>(len));
}

bool readString(std::istream& in, std::string& s) {
    uint32_t len = 0;
    if (!readPod(in, len)) return false;
    if (len > MAX_LIST) return false;
    s.assign(len, '\0');
    if (len) {
        if (!in.read(s.data(), static_cast<std::streamsize>(len))) return false;
    }
    return true;
}

void writeVec(std::ostream& out, const Vec2i& v) {
    int32_t x = v.x;
    int32_t y = v.y;
    writePod(out, x);
    writePod(out, y);
}

bool readVec(std::istream& in, Vec2i& v) {
    int32_t x = 0;
    int32_t y = 0;
    if (!readPod(in, x) || !readPod(in, y)) return false;
    v = {x, y};
    return true;
}

void writeEntity(std::ostream& out, const Entity& e) {
    int32_t id = e.id;
    writePod(out, id);
    uint8_t kind = static_cast<uint8_t>(e.kind);
    writePod(out, kind);
    writeVec(out, e.pos);
    int32_t hp = e.hp;
    int32_t hpMax = e.hpMax;
    int32_t atk = e.atk;
    int32_t def = e.def;
    int32_t speed = e.speed;
    writePod(out, hp);
    writePod(out, hpMax);
    writePod(out, atk);
    writePod(out, def);
    writePod(out, speed);
    uint8_t alerted = e.alerted ? 1 : 0;
    writePod(out, alerted);
    writeVec(out, e.lastKnownPlayerPos);
}

bool readEntity(std::istream& in, Entity& e) {
    int32_t id = 0;
    uint8_t kind = 0;
    int32_t hp = 0;
    int32_t hpMax = 0;
    int32_t atk = 0;
    int32_t def = 0;
    int32_t speed = 0;
    uint8_t alerted = 0;

    if (!readPod(in, id)) return false;
    if (!readPod(in, kind)) return false;
    if (!readVec(in, e.pos)) return false;
    if (!readPod(in, hp) || !readPod(in, hpMax) || !readPod(in, atk) || !readPod(in, def) || !readPod(in, speed)) return false;
    if (!readPod(in, alerted)) return false;
    if (!readVec(in, e.lastKnownPlayerPos)) return false;
    if (kind >= static_cast<uint8_t>(ENTITY_KIND_COUNT)) return false;

    e.id = id;
    e.kind = static_cast<EntityKind>(kind);
    e.hp = hp;
    e.hpMax = hpMax;
    e.atk = atk;
    e.def = def;
    e.speed = speed;
    e.alerted = (alerted != 0);
    return true;
}

bool statsInRange(const Entity& e) {
    if (e.hpMax < 1 || e.hpMax > MAX_STAT) return false;
    if (e.hp > e.hpMax || e.hp < -MAX_STAT) return false;
    if (e.atk < 0 || e.atk > MAX_STAT || e.def < 0 || e.def > MAX_STAT) return false;
    return e.speed >= 10 && e.speed <= 400;
}

} // namespace

bool Game::saveToFile(const std::string& path, std::string* err) const {
    if (!hasSession()) {
        if (err) *err = "no game in progress";
        return false;
    }

    std::filesystem::path p(path);
    std::filesystem::path dir = p.parent_path();
    if (!dir.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
    }

    // Build the payload in memory so the CRC footer can be appended before the
    // atomic write.
    std::ostringstream mem(std::ios::binary | std::ios::out);

    writePod(mem, SAVE_MAGIC);
    writePod(mem, SAVE_VERSION);

    writePod(mem, seed_);
    uint32_t rngState = rng.state;
    writePod(mem, rngState);
    int32_t depth = depth_;
    writePod(mem, depth);
    writePod(mem, turnCount_);
    writePod(mem, killCount_);
    writePod(mem, lastAutosaveTurn_);
    uint8_t over = gameOver_ ? 1 : 0;
    writePod(mem, over);
    int32_t pId = playerId_;
    int32_t nextE = nextEntityId_;
    writePod(mem, pId);
    writePod(mem, nextE);

    // Turn queue
    uint64_t qNow = queue.now();
    uint64_t qSeq = queue.nextSeq();
    writePod(mem, qNow);
    writePod(mem, qSeq);
    const std::vector<TurnQueue::Slot> slots = queue.slots();
    uint32_t slotCount = static_cast<uint32_t>(slots.size());
    writePod(mem, slotCount);
    for (const auto& s : slots) {
        writePod(mem, s.time);
        writePod(mem, s.seq);
        int32_t id = s.id;
        writePod(mem, id);
    }

    // Map
    int32_t w = dung.width;
    int32_t h = dung.height;
    writePod(mem, w);
    writePod(mem, h);
    writeVec(mem, dung.entry);
    writeVec(mem, dung.stairsDown);
    uint32_t roomCount = static_cast<uint32_t>(dung.rooms.size());
    writePod(mem, roomCount);
    for (const auto& r : dung.rooms) {
        int32_t rx = r.x, ry = r.y, rw = r.w, rh = r.h;
        writePod(mem, rx);
        writePod(mem, ry);
        writePod(mem, rw);
        writePod(mem, rh);
    }
    for (const auto& t : dung.tiles) {
        uint8_t tt = static_cast<uint8_t>(t.type);
        uint8_t explored = t.explored ? 1 : 0;
        writePod(mem, tt);
        writePod(mem, explored);
    }

    // Entities (player first)
    uint32_t entCount = static_cast<uint32_t>(ents.size());
    writePod(mem, entCount);
    for (const auto& e : ents) {
        writeEntity(mem, e);
    }

    // Message log
    uint32_t msgCount = static_cast<uint32_t>(msgs.size());
    writePod(mem, msgCount);
    for (const auto& m : msgs) {
        writeString(mem, m.text);
        uint8_t kind = static_cast<uint8_t>(m.kind);
        writePod(mem, kind);
        int32_t repeat = m.repeat;
        writePod(mem, repeat);
    }

    std::string payload = mem.str();
    const uint32_t c = crc32(reinterpret_cast<const uint8_t*>(payload.data()), payload.size());
    appendU32LE(payload, c);

    // Write to a temporary file first, then replace the target.
    std::filesystem::path tmp = p.string() + ".tmp";
    std::ofstream out(tmp, std::ios::binary);
    if (!out) {
        if (err) *err = "cannot open " + tmp.string() + " for writing";
        return false;
    }

    out.write(payload.data(), static_cast<std::streamsize>(payload.size()));
    out.flush();
    if (!out.good()) {
        out.close();
        std::error_code ec;
        std::filesystem::remove(tmp, ec);
        if (err) *err = "write error";
        return false;
    }
    out.close();

    std::error_code ec;
    std::filesystem::rename(tmp, p, ec);
    if (ec) {
        // On Windows, rename fails if destination exists; remove then retry.
        std::error_code ec2;
        std::filesystem::remove(p, ec2);
        ec.clear();
        std::filesystem::rename(tmp, p, ec);
    }
    if (ec) {
        std::error_code ec2;
        std::filesystem::remove(tmp, ec2);
        if (err) *err = "cannot replace " + p.string() + ": " + ec.message();
        return false;
    }

    return true;
}

bool Game::loadFromFile(const std::string& path, std::string* err) {
    auto fail = [&](const char* why) -> bool {
        if (err) *err = why;
        return false;
    };

    std::ifstream f(path, std::ios::binary);
    if (!f) return fail("no save file found");

    f.seekg(0, std::ios::end);
    const std::streamsize sz = f.tellg();
    if (sz <= 0) return fail("save file is corrupted or truncated");
    f.seekg(0, std::ios::beg);

    std::vector<uint8_t> bytes(static_cast<size_t>(sz));
    if (!f.read(reinterpret_cast<char*>(bytes.data()), sz)) {
        return fail("save file is corrupted or truncated");
    }

    if (bytes.size() < 12u) return fail("save file is corrupted or truncated");

    const uint32_t magic = readU32LE(bytes.data());
    const uint32_t version = readU32LE(bytes.data() + 4);
    if (magic != SAVE_MAGIC || version == 0u || version > SAVE_VERSION) {
        return fail("save file is invalid or from another version");
    }

    const uint32_t storedCrc = readU32LE(bytes.data() + bytes.size() - 4u);
    const uint32_t computedCrc = crc32(bytes.data(), bytes.size() - 4u);
    if (storedCrc != computedCrc) {
        return fail("save file failed integrity check (crc mismatch)");
    }

    const std::string payload(reinterpret_cast<const char*>(bytes.data()),
                              reinterpret_cast<const char*>(bytes.data() + (bytes.size() - 4u)));
    std::istringstream in(payload, std::ios::binary | std::ios::in);

    // Everything is parsed into temporaries; the session is only touched once
    // the whole file has been read and cross-checked.
    uint32_t magic2 = 0;
    uint32_t ver2 = 0;
    if (!readPod(in, magic2) || !readPod(in, ver2)) return fail("save file is corrupted or truncated");

    uint32_t seed = 0;
    uint32_t rngState = 0;
    int32_t depth = 1;
    uint32_t turns = 0;
    uint32_t kills = 0;
    uint32_t lastAutosave = 0;
    uint8_t over = 0;
    int32_t pId = 0;
    int32_t nextE = 1;
    if (!readPod(in, seed) || !readPod(in, rngState) || !readPod(in, depth)
        || !readPod(in, turns) || !readPod(in, kills) || !readPod(in, lastAutosave)
        || !readPod(in, over) || !readPod(in, pId) || !readPod(in, nextE)) {
        return fail("save file is corrupted or truncated");
    }
    // xorshift32 never leaves state 0.
    if (depth < 1 || pId <= 0 || nextE <= pId || rngState == 0) return fail("save file has an invalid header");

    uint64_t qNow = 0;
    uint64_t qSeq = 0;
    uint32_t slotCount = 0;
    if (!readPod(in, qNow) || !readPod(in, qSeq) || !readPod(in, slotCount)) {
        return fail("save file is corrupted or truncated");
    }
    if (slotCount > MAX_LIST) return fail("save file is corrupted or truncated");
    std::vector<TurnQueue::Slot> slots;
    slots.reserve(slotCount);
    for (uint32_t i = 0; i < slotCount; ++i) {
        TurnQueue::Slot s;
        int32_t id = 0;
        if (!readPod(in, s.time) || !readPod(in, s.seq) || !readPod(in, id)) {
            return fail("save file is corrupted or truncated");
        }
        s.id = id;
        slots.push_back(s);
    }

    int32_t w = 0;
    int32_t h = 0;
    if (!readPod(in, w) || !readPod(in, h)) return fail("save file is corrupted or truncated");
    if (w < 1 || h < 1 || w > MAX_MAP_DIM || h > MAX_MAP_DIM) return fail("save file has an invalid map size");

    Dungeon d(w, h);
    if (!readVec(in, d.entry) || !readVec(in, d.stairsDown)) return fail("save file is corrupted or truncated");

    uint32_t roomCount = 0;
    if (!readPod(in, roomCount) || roomCount > MAX_LIST) return fail("save file is corrupted or truncated");
    d.rooms.reserve(roomCount);
    for (uint32_t i = 0; i < roomCount; ++i) {
        int32_t rx = 0, ry = 0, rw = 0, rh = 0;
        if (!readPod(in, rx) || !readPod(in, ry) || !readPod(in, rw) || !readPod(in, rh)) {
            return fail("save file is corrupted or truncated");
        }
        d.rooms.push_back(Room{rx, ry, rw, rh});
    }

    for (auto& t : d.tiles) {
        uint8_t tt = 0;
        uint8_t explored = 0;
        if (!readPod(in, tt) || !readPod(in, explored)) return fail("save file is corrupted or truncated");
        if (tt >= static_cast<uint8_t>(TILE_TYPE_COUNT)) return fail("save file has an unknown tile type");
        t.type = static_cast<TileType>(tt);
        t.explored = (explored != 0);
        t.visible = false;
    }

    uint32_t entCount = 0;
    if (!readPod(in, entCount) || entCount == 0 || entCount > MAX_LIST) {
        return fail("save file is corrupted or truncated");
    }
    std::vector<Entity> es;
    es.reserve(entCount);
    for (uint32_t i = 0; i < entCount; ++i) {
        Entity e;
        if (!readEntity(in, e)) return fail("save file is corrupted or truncated");
        if (!statsInRange(e)) return fail("save file has out-of-range entity stats");
        es.push_back(e);
    }

    uint32_t msgCount = 0;
    if (!readPod(in, msgCount) || msgCount > MAX_LIST) return fail("save file is corrupted or truncated");
    std::vector<Message> ms;
    ms.reserve(msgCount);
    for (uint32_t i = 0; i < msgCount; ++i) {
        Message m;
        uint8_t kind = 0;
        int32_t repeat = 1;
        if (!readString(in, m.text) || !readPod(in, kind) || !readPod(in, repeat)) {
            return fail("save file is corrupted or truncated");
        }
        if (kind > static_cast<uint8_t>(MessageKind::System)) return fail("save file has an unknown message kind");
        m.kind = static_cast<MessageKind>(kind);
        m.repeat = std::max(1, static_cast<int>(repeat));
        ms.push_back(std::move(m));
    }

    if (in.peek() != std::char_traits<char>::eof()) return fail("save file has trailing data");

    // Cross-reference checks.
    const bool finished = (over != 0);

    if (es.front().id != pId || es.front().kind != EntityKind::Player) {
        return fail("save file has no player");
    }
    if (!es.front().alive() && !finished) return fail("save file has a dead player in a running game");

    OccupancyGrid o(w, h);
    std::set<int> ids;
    for (const auto& e : es) {
        if (e.id <= 0 || e.id >= nextE || !ids.insert(e.id).second) return fail("save file has invalid entity ids");
        if (e.kind == EntityKind::Player && e.id != pId) return fail("save file has more than one player");
        if (!e.alive()) {
            if (e.id != pId) return fail("save file has a dead monster");
            continue;
        }
        if (!d.isWalkable(e.pos.x, e.pos.y)) return fail("save file has an entity on a blocked tile");
        if (!o.place(e.id, e.pos)) return fail("save file has overlapping entities");
    }

    std::set<int> queued;
    for (const auto& s : slots) {
        if (ids.count(s.id) == 0) return fail("save file schedules an unknown entity");
        if (!queued.insert(s.id).second) return fail("save file schedules an entity twice");
        if (s.seq >= qSeq) return fail("save file has an invalid turn queue");
    }
    for (const auto& e : es) {
        if (e.alive() && queued.count(e.id) == 0) return fail("save file has an unscheduled entity");
        if (!e.alive() && queued.count(e.id) != 0) return fail("save file schedules a dead entity");
    }

    if (!d.isWalkable(d.entry.x, d.entry.y)) return fail("save file has an invalid entry");

    // Commit.
    rng.state = rngState;
    seed_ = seed;
    depth_ = depth;
    turnCount_ = turns;
    killCount_ = kills;
    lastAutosaveTurn_ = lastAutosave;
    gameOver_ = finished;
    playerId_ = pId;
    nextEntityId_ = nextE;

    dung = std::move(d);
    ents = std::move(es);
    occ = std::move(o);
    queue.restore(qNow, qSeq, slots);
    msgs = std::move(ms);

    recomputeFov();
    return true;
}
