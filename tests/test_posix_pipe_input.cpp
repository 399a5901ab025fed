/**
 * POSIX Pipe Input Test - OS pipe backed input source
 */

#include "input/errors.hpp"
#include "input/posix_pipe_input.hpp"
#include "platform/wait.hpp"
#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>

using namespace ttyin;
using namespace ttyin::input;

void test_send_and_read() {
    std::cout << "=== Test: Send And Read ===\n";

    PosixPipeInput pipe;
    pipe.sendText("abc");
    auto keys = pipe.readKeys();

    assert(keys.size() == 3);
    assert(keys[0] == KeyPress(KeySymbol::ANY, "a"));
    assert(keys[2] == KeyPress(KeySymbol::ANY, "c"));

    pipe.sendText("\x1b[A");
    keys = pipe.readKeys();
    assert(keys.size() == 1);
    assert(keys[0].key() == KeySymbol::UP);

    // Nothing written: the read does not block
    assert(pipe.readKeys().empty());

    std::cout << "✓ Send and read working\n";
}

void test_file_descriptor_pollable() {
    std::cout << "\n=== Test: Pollable Descriptor ===\n";

    PosixPipeInput pipe;
    int fd = pipe.fileNo();
    assert(fd >= 0);

    assert(!platform::waitForHandles({fd}, 0));
    pipe.sendText("z");
    auto ready = platform::waitForHandles({fd}, 1000);
    assert(ready && *ready == fd);

    assert(pipe.readKeys().size() == 1);

    std::cout << "✓ Pollable descriptor working\n";
}

void test_close_drains_then_fails() {
    std::cout << "\n=== Test: Close Drains ===\n";

    PosixPipeInput pipe;
    pipe.sendText("tail\x1b");
    pipe.close();
    pipe.close();
    assert(pipe.closed());

    bool threw = false;
    try {
        pipe.sendText("more");
    } catch (const DisposedError&) {
        threw = true;
    }
    assert(threw && "Send after close must fail");

    // Reads continue until end of stream has been seen once
    KeyPressList all;
    bool disposed = false;
    for (int i = 0; i < 10 && !disposed; ++i) {
        try {
            auto keys = pipe.readKeys();
            all.insert(all.end(), keys.begin(), keys.end());
        } catch (const DisposedError&) {
            disposed = true;
        }
    }

    assert(disposed);
    assert(all.size() == 5);
    assert(all[3] == KeyPress(KeySymbol::ANY, "l"));
    assert(all[4].key() == KeySymbol::ESCAPE);

    std::cout << "✓ Close drains working\n";
}

void test_close_during_blocked_send() {
    std::cout << "\n=== Test: Close During Blocked Send ===\n";

    PosixPipeInput pipe;

    // Larger than any default pipe buffer: the sender blocks until drained
    const std::string payload(256 * 1024, 'a');
    std::atomic<bool> sent{false};

    std::thread sender([&]() {
        pipe.sendText(payload);
        sent = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    assert(!sent);

    // Returns without waiting for the sender
    pipe.close();
    assert(pipe.closed());

    size_t received = 0;
    bool disposed = false;
    while (!disposed) {
        try {
            received += pipe.readKeys().size();
        } catch (const DisposedError&) {
            disposed = true;
        }
    }

    sender.join();
    assert(sent);
    assert(received == payload.size());

    std::cout << "✓ Close during blocked send working\n";
}

void test_typeahead_hash_has_fd() {
    std::cout << "\n=== Test: Typeahead Hash ===\n";

    PosixPipeInput pipe;
    std::string hash = pipe.typeaheadHash();
    std::string suffix = "-" + std::to_string(pipe.fileNo());

    assert(hash.rfind("PosixPipeInput-", 0) == 0);
    assert(hash.size() > suffix.size());
    assert(hash.compare(hash.size() - suffix.size(), suffix.size(), suffix) == 0);

    std::cout << hash << "\n";
    std::cout << "✓ Typeahead hash working\n";
}

void test_no_terminal_mode() {
    std::cout << "\n=== Test: Mode On Pipe ===\n";

    PosixPipeInput pipe;
    auto raw = pipe.rawMode();
    auto cooked = pipe.cookedMode();
    assert(!raw->isValid());
    assert(!cooked->isValid());

    std::cout << "✓ Mode on pipe working\n";
}

int main() {
    std::cout << "POSIX Pipe Input Test Suite\n";
    std::cout << "===========================\n\n";

    try {
        test_send_and_read();
        test_file_descriptor_pollable();
        test_close_drains_then_fails();
        test_close_during_blocked_send();
        test_typeahead_hash_has_fd();
        test_no_terminal_mode();

        std::cout << "\n✅ All POSIX pipe input tests passed!\n\n";
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "\n❌ Test failed: " << e.what() << "\n";
        return 1;
    }
}
