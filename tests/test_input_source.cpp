/**
 * Input Source Test - Callback stack and readiness dispatch
 */

#include "input/input_factory.hpp"
#include "input/input_source.hpp"
#include "input/pipe_input.hpp"
#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

using namespace ttyin::input;

void test_callback_stack() {
    std::cout << "=== Test: Callback Stack ===\n";

    PipeInput source;
    std::string calls;

    assert(!source.hasCallback());
    source.notifyReady();  // nothing attached: no-op

    auto outer = source.attach([&]() { calls += "a"; });
    {
        auto inner = source.attach([&]() { calls += "b"; });
        source.notifyReady();
    }
    source.notifyReady();

    assert(calls == "ba");

    // detach pops, its scope pushes back
    {
        auto detached = source.detach();
        assert(detached.active());
        assert(!source.hasCallback());
        source.notifyReady();
    }
    assert(source.hasCallback());
    source.notifyReady();
    assert(calls == "baa");

    outer.release();
    assert(!source.hasCallback());

    // Nothing to detach
    auto empty = source.detach();
    assert(!empty.active());

    std::cout << "✓ Callback stack working\n";
}

void test_attach_rejects_empty_callback() {
    std::cout << "\n=== Test: Empty Callback ===\n";

    PipeInput source;
    bool threw = false;
    try {
        auto scope = source.attach(ReadyCallback());
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    std::cout << "✓ Empty callback rejected\n";
}

void test_scope_move() {
    std::cout << "\n=== Test: Scope Move ===\n";

    PipeInput source;
    int count = 0;

    CallbackScope kept;
    {
        CallbackScope scope = source.attach([&]() { ++count; });
        kept = std::move(scope);
    }
    // Moved-from scope did not undo the attach
    source.notifyReady();
    assert(count == 1);

    kept = CallbackScope();
    source.notifyReady();
    assert(count == 1);

    std::cout << "✓ Scope move working\n";
}

void test_scope_outlives_source() {
    std::cout << "\n=== Test: Scope Outlives Source ===\n";

    int count = 0;
    CallbackScope attached;
    CallbackScope detached;
    {
        PipeInput source;
        attached = source.attach([&]() { ++count; });
        auto second = source.attach([&]() { ++count; });
        detached = source.detach();
        second.release();
        source.notifyReady();
    }
    assert(count == 1);

    // Source is gone: undoing must not touch it
    attached.release();
    detached.release();
    assert(!attached.active());
    assert(!detached.active());

    std::cout << "✓ Scopes outliving their source are harmless\n";
}

void test_dispatch_ready() {
    std::cout << "\n=== Test: Dispatch Ready ===\n";

    auto pipe = createPipeInput();
    int notified = 0;
    auto scope = pipe->attach([&]() { ++notified; });

    // Timeout when nothing is pending
    assert(dispatchReady({pipe.get()}, 0) == nullptr);

    pipe->sendText("x");
    int afterSend = notified;
    assert(afterSend == 1);

    InputSource* ready = dispatchReady({pipe.get()}, 1000);
#ifndef _WIN32
    // OS pipe: the descriptor is ready until read
    assert(ready == pipe.get());
    assert(notified == afterSend + 1);
#else
    // In-memory pipe has no handle to wait on
    assert(ready == nullptr);
#endif

    assert(pipe->readKeys().size() == 1);

    std::cout << "✓ Dispatch ready working\n";
}

int main() {
    std::cout << "Input Source Test Suite\n";
    std::cout << "=======================\n\n";

    try {
        test_callback_stack();
        test_attach_rejects_empty_callback();
        test_scope_move();
        test_scope_outlives_source();
        test_dispatch_ready();

        std::cout << "\n✅ All input source tests passed!\n\n";
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "\n❌ Test failed: " << e.what() << "\n";
        return 1;
    }
}
