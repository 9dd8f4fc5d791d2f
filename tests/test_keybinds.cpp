#include "keybinds.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

namespace {

int failures = 0;

void expect(bool cond, const std::string& msg) {
    if (!cond) {
        ++failures;
        std::cerr << "[FAIL] " << msg << "\n";
    }
}

std::string writeIni(const std::string& name, const std::string& body) {
    const std::string path = (std::filesystem::temp_directory_path() / name).string();
    std::ofstream f(path, std::ios::trunc);
    f << body;
    return path;
}

void test_default_bindings() {
    const KeyBinds kb = KeyBinds::defaults();
    expect(kb.mapKey(SDLK_k, KMOD_NONE) == Action::Up, "k moves up");
    expect(kb.mapKey(SDLK_KP_3, KMOD_NONE) == Action::DownRight, "keypad 3 moves down-right");
    expect(kb.mapKey(SDLK_PERIOD, KMOD_NONE) == Action::Wait, "period waits");
    expect(kb.mapKey(SDLK_PERIOD, KMOD_LSHIFT) == Action::Interact, "shift+period interacts");
    expect(kb.mapKey(SDLK_k, KMOD_LCTRL) == Action::None, "extra modifiers do not match");
    expect(kb.describeAction(Action::Save) != "unbound", "save has a default key");
}

void test_duplicate_chord_is_stable() {
    const std::string path = writeIni("delve_test_binds.ini",
        "bind_interact = x\n"
        "bind_wait = x\n"
        "bind_quit = none\n");

    KeyBinds kb = KeyBinds::defaults();
    kb.loadOverridesFromIni(path);

    // Both actions claim x; the lower action in enum order always wins.
    for (int i = 0; i < 10; ++i) {
        expect(kb.mapKey(SDLK_x, KMOD_NONE) == Action::Wait, "duplicate chord should map to wait");
    }
    expect(kb.mapKey(SDLK_g, KMOD_NONE) == Action::None, "overridden default should be gone");
    expect(kb.mapKey(SDLK_ESCAPE, KMOD_NONE) == Action::None, "binding set to none should be cleared");
    expect(kb.describeAction(Action::Quit) == "unbound", "cleared binding described as unbound");

    std::error_code ec;
    std::filesystem::remove(path, ec);
}

} // namespace

int main() {
    std::cout << "Running Delve key binding tests...\n";

    test_default_bindings();
    test_duplicate_chord_is_stable();

    if (failures == 0) {
        std::cout << "All tests passed.\n";
        return 0;
    }

    std::cerr << failures << " test(s) failed.\n";
    return 1;
}
