#include <catch2/catch.hpp>
#include <stow/file_lock.hpp>

#include "test_util.hpp"

#include <future>
#include <thread>

using namespace stow;
using stow::test::TempDir;

TEST_CASE("file lock is held until released", "[file_lock]") {
    TempDir tmp("lock_basic");
    auto lock = FileLock::acquire(tmp / ".stow/lock");
    REQUIRE(lock.is_ok());
    REQUIRE(lock.value().is_held());
    REQUIRE(std::filesystem::exists(tmp / ".stow/lock"));

    lock.value().release();
    REQUIRE_FALSE(lock.value().is_held());

    auto again = FileLock::try_acquire(tmp / ".stow/lock");
    REQUIRE(again.is_ok());
}

TEST_CASE("try_acquire reports contention while another holder runs", "[file_lock]") {
    TempDir tmp("lock_contend");
    auto path = tmp / "lock";

    // Assertions stay on the main thread
    std::promise<bool> held;
    std::promise<void> done;
    auto done_future = done.get_future();

    std::thread holder([&] {
        auto lock = FileLock::acquire(path);
        held.set_value(lock.is_ok());
        done_future.wait();
    });

    REQUIRE(held.get_future().get());
    auto contended = FileLock::try_acquire(path);
    REQUIRE(contended.is_err());
    REQUIRE(contended.error().code == StowError::LockContention);

    done.set_value();
    holder.join();

    auto after = FileLock::try_acquire(path);
    REQUIRE(after.is_ok());
}

TEST_CASE("acquire waits for the holder to finish", "[file_lock]") {
    TempDir tmp("lock_wait");
    auto path = tmp / "lock";

    auto first = FileLock::acquire(path);
    REQUIRE(first.is_ok());

    std::promise<bool> got;
    std::thread waiter([&] {
        auto lock = FileLock::acquire(path);
        got.set_value(lock.is_ok());
    });

    auto got_future = got.get_future();
    REQUIRE(got_future.wait_for(std::chrono::milliseconds(50)) == std::future_status::timeout);
    first.value().release();
    REQUIRE(got_future.get());
    waiter.join();
}

TEST_CASE("moved lock keeps ownership", "[file_lock]") {
    TempDir tmp("lock_move");
    auto lock = FileLock::acquire(tmp / "lock");
    REQUIRE(lock.is_ok());
    FileLock owner = std::move(lock).value();
    REQUIRE(owner.is_held());
}

TEST_CASE("a lock can be released on another thread", "[file_lock]") {
    TempDir tmp("lock_handoff");
    auto path = tmp / "lock";
    auto lock = FileLock::acquire(path);
    REQUIRE(lock.is_ok());

    std::thread releaser([owner = std::move(lock).value()]() mutable {
        owner.release();
    });
    releaser.join();

    auto again = FileLock::try_acquire(path);
    REQUIRE(again.is_ok());
    REQUIRE(again.value().is_held());
}
