// test_controller_registry.cpp - Controller registry and replay protection
//
// Tests:
// 1. Registration, capacity, deregistration
// 2. Connect / disconnect state tracking
// 3. Sequence acceptance (strictly increasing only)
// 4. Sequence history survives disconnects
// 5. Voted flag and clearVoted()

#include "protocol/controller_registry.hpp"
#include "votelink/logging.hpp"
#include <iostream>

using namespace votelink;
using namespace votelink::protocol;

int main() {
    std::cout << "=== Controller Registry Unit Test ===\n\n";
    setLogLevel(LogLevel::WARN);

    int pass = 0, fail = 0;

    // ========================================================================
    // TEST 1: Membership
    // ========================================================================
    std::cout << "TEST 1: Registration and capacity\n";
    {
        ControllerRegistry reg(2);

        RegistryError e1 = reg.registerController(1);
        RegistryError e2 = reg.registerController(2);
        if (e1 == RegistryError::None && e2 == RegistryError::None && reg.size() == 2) {
            std::cout << "  [PASS] Two controllers registered\n";
            pass++;
        } else {
            std::cout << "  [FAIL] Registration failed\n";
            fail++;
        }

        if (reg.registerController(1) == RegistryError::AlreadyRegistered) {
            std::cout << "  [PASS] Re-registration rejected\n";
            pass++;
        } else {
            std::cout << "  [FAIL] Re-registration accepted\n";
            fail++;
        }

        if (reg.registerController(3) == RegistryError::Full && !reg.isRegistered(3)) {
            std::cout << "  [PASS] Registry full at capacity " << reg.capacity() << "\n";
            pass++;
        } else {
            std::cout << "  [FAIL] Capacity not enforced\n";
            fail++;
        }

        bool removed = reg.deregisterController(2) == RegistryError::None;
        bool again = reg.deregisterController(2) == RegistryError::NotRegistered;
        if (removed && again && reg.registerController(3) == RegistryError::None) {
            std::cout << "  [PASS] Deregistration frees a slot\n";
            pass++;
        } else {
            std::cout << "  [FAIL] Deregistration\n";
            fail++;
        }
    }

    // ========================================================================
    // TEST 2: Link state
    // ========================================================================
    std::cout << "\nTEST 2: Connect / disconnect\n";
    {
        ControllerRegistry reg(5);
        reg.registerController(10);
        reg.registerController(11);
        reg.registerController(12);

        if (reg.onConnect(99, 0) == RegistryError::NotRegistered) {
            std::cout << "  [PASS] Unknown controller cannot connect\n";
            pass++;
        } else {
            std::cout << "  [FAIL] Unknown controller connected\n";
            fail++;
        }

        reg.onConnect(10, 100);
        reg.onConnect(12, 150);
        auto connected = reg.connectedControllers();
        if (connected.size() == 2 && connected[0] == 10 && connected[1] == 12 &&
            !reg.isConnected(11)) {
            std::cout << "  [PASS] Connected set is {10, 12}\n";
            pass++;
        } else {
            std::cout << "  [FAIL] Connected set wrong (" << connected.size() << ")\n";
            fail++;
        }

        reg.onDisconnect(10, 300);
        const ControllerInfo* info = reg.find(10);
        if (info && info->state == ControllerState::DISCONNECTED && info->last_seen_ms == 300) {
            std::cout << "  [PASS] Disconnect recorded at 300 ms\n";
            pass++;
        } else {
            std::cout << "  [FAIL] Disconnect not recorded\n";
            fail++;
        }

        reg.touch(12, 500);
        if (reg.find(12)->last_seen_ms == 500) {
            std::cout << "  [PASS] touch() updates last seen\n";
            pass++;
        } else {
            std::cout << "  [FAIL] touch() ignored\n";
            fail++;
        }
    }

    // ========================================================================
    // TEST 3: Sequence acceptance
    // ========================================================================
    std::cout << "\nTEST 3: Sequence acceptance\n";
    {
        ControllerRegistry reg(5);
        reg.registerController(1);

        bool first = reg.nextExpectedSequence(1) == 1 && reg.acceptSequence(1, 1);
        bool tie = !reg.acceptSequence(1, 1);
        bool jump = reg.acceptSequence(1, 5);
        bool regress = !reg.acceptSequence(1, 3);

        if (first) { std::cout << "  [PASS] First sequence accepted\n"; pass++; }
        else { std::cout << "  [FAIL] First sequence rejected\n"; fail++; }

        if (tie) { std::cout << "  [PASS] Equal sequence rejected\n"; pass++; }
        else { std::cout << "  [FAIL] Equal sequence accepted\n"; fail++; }

        if (jump && reg.nextExpectedSequence(1) == 6) {
            std::cout << "  [PASS] Gaps allowed, next expected is 6\n";
            pass++;
        } else {
            std::cout << "  [FAIL] Gap handling\n";
            fail++;
        }

        if (regress && reg.find(1)->last_sequence == 5) {
            std::cout << "  [PASS] Older sequence rejected, stored value unchanged\n";
            pass++;
        } else {
            std::cout << "  [FAIL] Regression accepted\n";
            fail++;
        }

        if (!reg.acceptSequence(42, 1)) {
            std::cout << "  [PASS] Unregistered controller has no sequence\n";
            pass++;
        } else {
            std::cout << "  [FAIL] Unregistered sequence accepted\n";
            fail++;
        }
    }

    // ========================================================================
    // TEST 4: History across reconnects
    // ========================================================================
    std::cout << "\nTEST 4: Sequence history survives reconnects\n";
    {
        ControllerRegistry reg(5);
        reg.registerController(7);
        reg.onConnect(7, 0);
        reg.acceptSequence(7, 4);
        reg.onDisconnect(7, 10);
        reg.onConnect(7, 20);

        if (!reg.acceptSequence(7, 4) && reg.acceptSequence(7, 5)) {
            std::cout << "  [PASS] Replay after reconnect rejected\n";
            pass++;
        } else {
            std::cout << "  [FAIL] Reconnect reset the sequence\n";
            fail++;
        }

        reg.deregisterController(7);
        reg.registerController(7);
        if (reg.nextExpectedSequence(7) == 1) {
            std::cout << "  [PASS] Deregistration discards history\n";
            pass++;
        } else {
            std::cout << "  [FAIL] History kept after deregistration\n";
            fail++;
        }
    }

    // ========================================================================
    // TEST 5: Voted flag
    // ========================================================================
    std::cout << "\nTEST 5: Voted flag\n";
    {
        ControllerRegistry reg(5);
        reg.registerController(1);
        reg.registerController(2);
        reg.onConnect(1, 0);

        reg.markVoted(1);
        reg.markVoted(2);
        bool v1 = reg.find(1)->state == ControllerState::VOTED;
        bool v2 = reg.find(2)->state == ControllerState::DISCONNECTED && reg.find(2)->voted;
        if (v1 && v2) {
            std::cout << "  [PASS] VOTED only for connected controllers\n";
            pass++;
        } else {
            std::cout << "  [FAIL] Voted state\n";
            fail++;
        }

        reg.onConnect(2, 5);
        bool reconnect_voted = reg.find(2)->state == ControllerState::VOTED;

        reg.clearVoted();
        bool cleared = reg.find(1)->state == ControllerState::CONNECTED &&
                       reg.find(2)->state == ControllerState::CONNECTED &&
                       !reg.find(1)->voted && !reg.find(2)->voted;
        if (reconnect_voted && cleared) {
            std::cout << "  [PASS] clearVoted() returns controllers to CONNECTED\n";
            pass++;
        } else {
            std::cout << "  [FAIL] clearVoted()\n";
            fail++;
        }
    }

    // ========================================================================
    // Summary
    // ========================================================================
    std::cout << "\n========================================\n";
    std::cout << "RESULTS: " << pass << " passed, " << fail << " failed\n";
    std::cout << "========================================\n";

    if (fail == 0) {
        std::cout << "\n[SUCCESS] All registry tests passed!\n";
        return 0;
    } else {
        std::cout << "\n[FAILURE] Some tests failed.\n";
        return 1;
    }
}
