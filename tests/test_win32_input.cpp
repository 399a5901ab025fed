/**
 * Win32 Input Test - Console input records
 *
 * Skips the console cases when the process has no console attached.
 */

#include "input/win32_input.hpp"
#include <windows.h>
#include <cassert>
#include <iostream>

using namespace ttyin::input;

namespace {

INPUT_RECORD keyDown(WORD vk, WCHAR ch, DWORD ctrlState = 0) {
    INPUT_RECORD rec = {};
    rec.EventType = KEY_EVENT;
    rec.Event.KeyEvent.bKeyDown = TRUE;
    rec.Event.KeyEvent.wRepeatCount = 1;
    rec.Event.KeyEvent.wVirtualKeyCode = vk;
    rec.Event.KeyEvent.uChar.UnicodeChar = ch;
    rec.Event.KeyEvent.dwControlKeyState = ctrlState;
    return rec;
}

HANDLE openConsoleInput() {
    return CreateFileW(L"CONIN$", GENERIC_READ | GENERIC_WRITE,
                       FILE_SHARE_READ | FILE_SHARE_WRITE, nullptr, OPEN_EXISTING, 0, nullptr);
}

} // anonymous namespace

void test_legacy_key_mapping() {
    std::cout << "=== Test: Legacy Key Mapping ===\n";

    Win32Input input(INVALID_HANDLE_VALUE);
    assert(!input.usesVirtualTerminal());

    auto up = input.convertKeyEvent(keyDown(VK_UP, 0).Event.KeyEvent);
    assert(up && up->key() == KeySymbol::UP);

    auto ctrlLeft = input.convertKeyEvent(
        keyDown(VK_LEFT, 0, LEFT_CTRL_PRESSED).Event.KeyEvent);
    assert(ctrlLeft && ctrlLeft->key() == KeySymbol::CONTROL_LEFT);

    auto f5 = input.convertKeyEvent(keyDown(VK_F5, 0).Event.KeyEvent);
    assert(f5 && f5->key() == KeySymbol::F5);

    // Bare modifier
    assert(!input.convertKeyEvent(keyDown(VK_SHIFT, 0, SHIFT_PRESSED).Event.KeyEvent));

    std::cout << "✓ Legacy key mapping working\n";
}

void test_virtual_terminal_mode_kept() {
    std::cout << "\n=== Test: VT Input Mode ===\n";

    HANDLE console = openConsoleInput();
    DWORD original;
    if (console == INVALID_HANDLE_VALUE || !GetConsoleMode(console, &original)) {
        std::cout << "(no console, skipped)\n";
        return;
    }

    {
        Win32Input input(console);
        if (!input.usesVirtualTerminal()) {
            std::cout << "(console without VT input, skipped)\n";
        } else {
            DWORD mode;
            assert(GetConsoleMode(console, &mode));
            assert(mode & ENABLE_VIRTUAL_TERMINAL_INPUT);

            // Raw mode taken later keeps VT input on
            auto raw = input.rawMode();
            assert(GetConsoleMode(console, &mode));
            assert(mode & ENABLE_VIRTUAL_TERMINAL_INPUT);
            raw->restore();

            input.close();
            assert(GetConsoleMode(console, &mode));
            assert(mode == original);
        }
    }

    DWORD after;
    assert(GetConsoleMode(console, &after));
    assert(after == original);

    CloseHandle(console);
    std::cout << "✓ VT input mode working\n";
}

void test_keys_without_character() {
    std::cout << "\n=== Test: Keys Without Character ===\n";

    HANDLE console = openConsoleInput();
    DWORD original;
    if (console == INVALID_HANDLE_VALUE || !GetConsoleMode(console, &original)) {
        std::cout << "(no console, skipped)\n";
        return;
    }

    {
        Win32Input input(console);
        FlushConsoleInputBuffer(console);

        // Character first, then an arrow the console sends without text
        INPUT_RECORD records[] = {keyDown('A', L'a'), keyDown(VK_UP, 0)};
        DWORD written = 0;
        assert(WriteConsoleInputW(console, records, 2, &written));
        assert(written == 2);

        auto keys = input.readKeys();
        assert(keys.size() == 2);
        assert(keys[0] == KeyPress(KeySymbol::ANY, "a"));
        assert(keys[1].key() == KeySymbol::UP);
    }

    CloseHandle(console);
    std::cout << "✓ Keys without character working\n";
}

int main() {
    std::cout << "Win32 Input Test Suite\n";
    std::cout << "======================\n\n";

    try {
        test_legacy_key_mapping();
        test_virtual_terminal_mode_kept();
        test_keys_without_character();

        std::cout << "\n✅ All Win32 input tests passed!\n\n";
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "\n❌ Test failed: " << e.what() << "\n";
        return 1;
    }
}
