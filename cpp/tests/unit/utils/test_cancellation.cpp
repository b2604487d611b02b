#include "doctest.h"
#include "../../../utils/cancellation/cancellation.hpp"
#include <atomic>
#include <chrono>
#include <thread>

TEST_CASE("Cancellation - Default Token Is Never Cancelled") {
    cancellation::CancellationToken token = cancellation::CancellationToken::none();

    CHECK(!token.is_cancellation_requested());
    CHECK(!token.can_be_cancelled());
    CHECK_NOTHROW(token.throw_if_cancellation_requested());
}

TEST_CASE("Cancellation - Cancel Runs Registered Callbacks Once") {
    cancellation::CancellationSource source;
    std::atomic<int> calls{0};

    auto registration = source.token().register_callback([&calls]() { calls++; });
    source.cancel();
    source.cancel();

    CHECK(source.token().is_cancellation_requested());
    CHECK(calls.load() == 1);
    CHECK_THROWS_AS(source.token().throw_if_cancellation_requested(), cancellation::OperationCancelledError);
}

TEST_CASE("Cancellation - Register After Cancel Runs Immediately") {
    cancellation::CancellationSource source;
    source.cancel();

    bool called = false;
    auto registration = source.token().register_callback([&called]() { called = true; });
    CHECK(called);
}

TEST_CASE("Cancellation - Dropped Registration Is Not Invoked") {
    cancellation::CancellationSource source;
    bool called = false;
    {
        auto registration = source.token().register_callback([&called]() { called = true; });
    }
    source.cancel();
    CHECK(!called);
}

TEST_CASE("Cancellation - Linked Source Follows Any Parent") {
    cancellation::CancellationSource first;
    cancellation::CancellationSource second;
    auto linked = cancellation::CancellationSource::create_linked({first.token(), second.token()});

    CHECK(!linked->is_cancellation_requested());
    second.cancel();
    CHECK(linked->is_cancellation_requested());
    CHECK(!first.is_cancellation_requested());
}

TEST_CASE("Cancellation - Cancel After Fires On Timer") {
    cancellation::CancellationSource source;
    source.cancel_after(std::chrono::milliseconds(20));

    CHECK(source.token().wait_for(std::chrono::milliseconds(2000)));
    CHECK(source.is_cancellation_requested());
}

TEST_CASE("Cancellation - Wait For Times Out Without Cancel") {
    cancellation::CancellationSource source;
    auto start = std::chrono::steady_clock::now();

    CHECK(!source.token().wait_for(std::chrono::milliseconds(30)));
    CHECK(std::chrono::steady_clock::now() - start >= std::chrono::milliseconds(25));
}

TEST_CASE("Cancellation - Wait For Wakes On Cancel From Another Thread") {
    cancellation::CancellationSource source;
    std::thread canceller([&source]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        source.cancel();
    });

    CHECK(source.token().wait_for(std::chrono::milliseconds(5000)));
    canceller.join();
}
